#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/TargetSet.hpp"
#include "common/Types.hpp"
#include "core/ThreadPool.hpp"
#include "providers/IProvider.hpp"

namespace ddns::core {

/// Brings each target's A record in line with the observed public address.
/// The provider's stored value is authoritative: every cycle fetches and
/// compares, so out-of-band edits are corrected too. Records are only ever
/// edited, never created.
/// Class abbreviation: rcn
class Reconciler {
 public:
  using AddressCache = std::map<std::string, std::optional<std::string>>;

  /// iMaxParallel > 1 fans targets out over a ThreadPool of that size.
  /// mInitial seeds the last-applied cache (keys are FQDNs; unknown keys
  /// are ignored).
  Reconciler(providers::IProvider& prProvider, common::Credentials crCreds,
             common::TargetSet tsTargets, int iMaxParallel = 1, AddressCache mInitial = {});
  ~Reconciler();

  Reconciler(const Reconciler&) = delete;
  Reconciler& operator=(const Reconciler&) = delete;

  /// One pass over every target. Per-target failures are logged and
  /// recorded in the report; nothing is thrown for provider errors.
  common::CycleReport reconcile(const std::string& sObservedAddress);

  /// Last address confirmed on the provider for sFqdn, if any.
  std::optional<std::string> lastApplied(const std::string& sFqdn) const;

  const AddressCache& cache() const { return _mLastApplied; }
  const common::TargetSet& targets() const { return _tsTargets; }

 private:
  common::TargetOutcome reconcileTarget(const common::Target& tgTarget,
                                        const std::string& sObservedAddress,
                                        std::optional<std::string>& oLastApplied);

  providers::IProvider& _prProvider;
  common::Credentials _crCreds;
  common::TargetSet _tsTargets;
  // One entry per target, created up front; fan-out tasks only write their own value.
  AddressCache _mLastApplied;
  std::unique_ptr<ThreadPool> _upPool;
};

}  // namespace ddns::core
