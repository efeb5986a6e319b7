#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>

#include <pthread.h>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "common/TargetSet.hpp"
#include "core/CycleScheduler.hpp"
#include "core/IpResolver.hpp"
#include "core/Reconciler.hpp"
#include "core/UpdateCycle.hpp"
#include "http/CurlHttpClient.hpp"
#include "providers/PorkbunProvider.hpp"

// Startup: config -> logger -> HTTP -> provider -> targets -> scheduler,
// then block until SIGINT/SIGTERM.

int main() {
  // Block termination signals before any thread exists so every thread
  // inherits the mask and sigwait() below is the only receiver.
  sigset_t sigSet;
  sigemptyset(&sigSet);
  sigaddset(&sigSet, SIGINT);
  sigaddset(&sigSet, SIGTERM);
  if (pthread_sigmask(SIG_BLOCK, &sigSet, nullptr) != 0) {
    std::cerr << "[fatal] cannot block termination signals\n";
    return EXIT_FAILURE;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = ddns::common::Config::load();
    auto tsTargets = ddns::common::TargetSet::parse(cfgApp.sDomain, cfgApp.sSubdomains);

    ddns::common::Logger::init(cfgApp.sLogLevel);
    auto spLog = ddns::common::Logger::get();
    spLog->info("Starting Porkbun dynamic DNS updater");
    spLog->info("Step 1: Configuration loaded ({} targets, interval {}s)", tsTargets.size(),
                cfgApp.iCheckIntervalSeconds);
    for (const auto& tg : tsTargets) {
      spLog->info("  target: {}", tg.fqdn());
    }

    // ── Step 2: Credentials ──────────────────────────────────────────────
    ddns::common::Credentials crCreds(cfgApp.sApiKey, cfgApp.sSecretApiKey);
    cfgApp.wipeSecrets();
    spLog->info("Step 2: Credentials loaded");

    // ── Step 3: HTTP transport ───────────────────────────────────────────
    ddns::http::CurlGlobal cgCurl;
    ddns::http::CurlHttpClient chcClient(std::chrono::seconds(cfgApp.iHttpTimeoutSeconds));
    spLog->info("Step 3: HTTP client ready (timeout {}s)", cfgApp.iHttpTimeoutSeconds);

    // ── Step 4: Porkbun provider ─────────────────────────────────────────
    ddns::providers::PorkbunProvider pbProvider(chcClient, cfgApp.sApiBaseUrl,
                                                static_cast<uint32_t>(cfgApp.iRecordTtl));
    const auto status = pbProvider.testConnectivity(crCreds);
    const char* pStatus = ddns::common::toString(status);
    if (status == ddns::common::HealthStatus::Unauthorized) {
      spLog->error("Step 4: Porkbun ping {}: credentials rejected; continuing, every cycle "
                   "will fail until they are fixed",
                   pStatus);
    } else if (status == ddns::common::HealthStatus::Unreachable) {
      spLog->warn("Step 4: Porkbun ping {}: API not reachable at {}; continuing", pStatus,
                  cfgApp.sApiBaseUrl);
    } else {
      spLog->info("Step 4: Porkbun ping {}: API reachable, credentials accepted", pStatus);
    }

    // ── Step 5: Resolver, reconciler, cycle ──────────────────────────────
    ddns::core::HttpIpResolver ipResolver(chcClient, cfgApp.sIpEchoUrl);
    ddns::core::Reconciler rcnReconciler(pbProvider, crCreds, std::move(tsTargets),
                                         cfgApp.iMaxParallelTargets);
    ddns::core::UpdateCycle ucCycle(ipResolver, rcnReconciler);
    spLog->info("Step 5: Reconciler ready (IP echo {}, up to {} targets in parallel)",
                cfgApp.sIpEchoUrl, cfgApp.iMaxParallelTargets);

    // ── Step 6: Scheduler ────────────────────────────────────────────────
    auto csScheduler = std::make_unique<ddns::core::CycleScheduler>(
        "porkbun-sync", std::chrono::seconds(cfgApp.iCheckIntervalSeconds),
        [&ucCycle]() { ucCycle.run(); });
    csScheduler->start();
    spLog->info("Step 6: Scheduler started (every {}s)", cfgApp.iCheckIntervalSeconds);

    int iSignal = 0;
    if (sigwait(&sigSet, &iSignal) != 0) {
      throw std::runtime_error("sigwait failed");
    }

    // Graceful shutdown
    spLog->info("Received signal {}, shutting down", iSignal);
    csScheduler->stop();
    spLog->info("Scheduler stopped after {} cycles", csScheduler->completedCycles());

    return EXIT_SUCCESS;
  } catch (const ddns::common::ConfigError& ex) {
    std::cerr << "[fatal] configuration error (" << ex._sErrorCode << "): " << ex.what()
              << "\n";
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] startup failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
