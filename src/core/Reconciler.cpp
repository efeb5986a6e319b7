#include "core/Reconciler.hpp"

#include "common/Logger.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <utility>

namespace ddns::core {

using common::ApiError;
using common::ApiErrorKind;
using common::TargetAction;
using common::TargetOutcome;

namespace {

void logApiError(const char* pOperation, const std::string& sFqdn, const ApiError& ae) {
  auto spLog = common::Logger::get();
  switch (ae.eKind) {
    case ApiErrorKind::Unauthorized:
      spLog->error("{} {}: Porkbun rejected the API credentials ({}). Check "
                   "PORKBUN_API_KEY / PORKBUN_SECRET_API_KEY and that API access is "
                   "enabled for the domain",
                   pOperation, sFqdn, ae.sMessage);
      break;
    case ApiErrorKind::RateLimited:
      spLog->warn("{} {}: rate limited by Porkbun ({}); retrying next cycle", pOperation,
                  sFqdn, ae.sMessage);
      break;
    case ApiErrorKind::Transient:
      spLog->error("{} {}: {} ({}); retrying next cycle", pOperation, sFqdn, ae.sMessage,
                   common::toString(ae.eKind));
      break;
  }
}

}  // namespace

Reconciler::Reconciler(providers::IProvider& prProvider, common::Credentials crCreds,
                       common::TargetSet tsTargets, int iMaxParallel, AddressCache mInitial)
    : _prProvider(prProvider), _crCreds(std::move(crCreds)), _tsTargets(std::move(tsTargets)) {
  for (const auto& tg : _tsTargets) {
    const std::string sFqdn = tg.fqdn();
    auto itSeed = mInitial.find(sFqdn);
    _mLastApplied[sFqdn] = itSeed != mInitial.end() ? itSeed->second : std::nullopt;
  }

  if (iMaxParallel > 1 && _tsTargets.size() > 1) {
    const int iWorkers = std::min(iMaxParallel, static_cast<int>(_tsTargets.size()));
    _upPool = std::make_unique<ThreadPool>(iWorkers);
  }
}

Reconciler::~Reconciler() {
  if (_upPool) {
    _upPool->shutdown();
  }
}

std::optional<std::string> Reconciler::lastApplied(const std::string& sFqdn) const {
  auto it = _mLastApplied.find(sFqdn);
  return it != _mLastApplied.end() ? it->second : std::nullopt;
}

common::CycleReport Reconciler::reconcile(const std::string& sObservedAddress) {
  common::CycleReport crp;
  crp.bResolved = true;
  crp.sObservedAddress = sObservedAddress;
  crp.vOutcomes.reserve(_tsTargets.size());

  if (!_upPool) {
    for (const auto& tg : _tsTargets) {
      crp.vOutcomes.push_back(
          reconcileTarget(tg, sObservedAddress, _mLastApplied.at(tg.fqdn())));
    }
    return crp;
  }

  std::vector<std::future<TargetOutcome>> vFutures;
  vFutures.reserve(_tsTargets.size());
  for (const auto& tg : _tsTargets) {
    auto& oEntry = _mLastApplied.at(tg.fqdn());
    vFutures.push_back(_upPool->submit([this, &tg, &sObservedAddress, &oEntry]() {
      return reconcileTarget(tg, sObservedAddress, oEntry);
    }));
  }
  // Join every task before the cycle counts as complete.
  for (auto& fut : vFutures) {
    crp.vOutcomes.push_back(fut.get());
  }
  return crp;
}

TargetOutcome Reconciler::reconcileTarget(const common::Target& tgTarget,
                                          const std::string& sObservedAddress,
                                          std::optional<std::string>& oLastApplied) {
  auto spLog = common::Logger::get();
  TargetOutcome to;
  to.sFqdn = tgTarget.fqdn();

  common::FetchResult fr;
  try {
    fr = _prProvider.fetchRecord(_crCreds, tgTarget);
  } catch (const std::exception& ex) {
    fr.oError = ApiError{ApiErrorKind::Transient, ex.what()};
  }

  if (!fr.ok()) {
    logApiError("Fetching A record for", to.sFqdn, *fr.oError);
    to.action = TargetAction::FetchFailed;
    to.oError = fr.oError;
    return to;
  }

  if (!fr.rrRecord.bExists) {
    spLog->warn("No existing A record for {}; skipping. This service only updates existing "
                "records, create one manually on Porkbun",
                to.sFqdn);
    to.action = TargetAction::Missing;
    return to;
  }

  to.sPreviousValue = fr.rrRecord.sCurrentValue;
  if (oLastApplied && *oLastApplied != fr.rrRecord.sCurrentValue) {
    spLog->warn("{}: record changed out-of-band (last applied {}, Porkbun now has {})",
                to.sFqdn, *oLastApplied, fr.rrRecord.sCurrentValue);
  }
  if (fr.rrRecord.sCurrentValue == sObservedAddress) {
    spLog->info("{}: no change ({})", to.sFqdn, sObservedAddress);
    oLastApplied = sObservedAddress;
    to.action = TargetAction::Unchanged;
    return to;
  }

  spLog->info("{}: IP change detected, {} -> {}", to.sFqdn, fr.rrRecord.sCurrentValue,
              sObservedAddress);

  common::UpdateResult ur;
  try {
    ur = _prProvider.updateRecord(_crCreds, tgTarget, sObservedAddress);
  } catch (const std::exception& ex) {
    ur.oError = ApiError{ApiErrorKind::Transient, ex.what()};
  }

  if (!ur.ok()) {
    logApiError("Updating A record for", to.sFqdn, *ur.oError);
    to.action = TargetAction::UpdateFailed;
    to.oError = ur.oError;
    return to;
  }

  spLog->info("{}: updated A record {} -> {}", to.sFqdn, fr.rrRecord.sCurrentValue,
              sObservedAddress);
  oLastApplied = sObservedAddress;
  to.action = TargetAction::Updated;
  return to;
}

}  // namespace ddns::core
