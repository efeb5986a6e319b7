#include "core/UpdateCycle.hpp"

#include "common/Logger.hpp"

namespace ddns::core {

using common::TargetAction;

UpdateCycle::UpdateCycle(IIpResolver& ipResolver, Reconciler& rcnReconciler)
    : _ipResolver(ipResolver), _rcnReconciler(rcnReconciler) {}

UpdateCycle::~UpdateCycle() = default;

common::CycleReport UpdateCycle::run() {
  auto spLog = common::Logger::get();
  ++_iCycle;
  spLog->info("--- Starting check cycle #{} ({} targets) ---", _iCycle,
              _rcnReconciler.targets().size());

  const common::ResolveResult rs = _ipResolver.resolve();
  if (!rs.ok()) {
    spLog->error("Could not determine public IPv4 address ({}): {}; skipping cycle",
                 common::toString(*rs.oError), rs.sErrorMessage);
    return common::CycleReport{};
  }
  spLog->info("Current public IPv4: {}", rs.sAddress);

  common::CycleReport crp = _rcnReconciler.reconcile(rs.sAddress);
  for (const auto& to : crp.vOutcomes) {
    spLog->debug("  {}: {}", to.sFqdn, common::toString(to.action));
  }
  spLog->info("--- Check cycle #{} finished: {} unchanged, {} updated, {} missing, {} failed ---",
              _iCycle, crp.count(TargetAction::Unchanged), crp.count(TargetAction::Updated),
              crp.count(TargetAction::Missing),
              crp.count(TargetAction::FetchFailed) + crp.count(TargetAction::UpdateFailed));
  return crp;
}

}  // namespace ddns::core
