#pragma once

#include "common/Types.hpp"
#include "core/IpResolver.hpp"
#include "core/Reconciler.hpp"

namespace ddns::core {

/// One cycle: resolve the public address once, then reconcile every target
/// against it. A failed lookup ends the cycle early.
/// Class abbreviation: uc
class UpdateCycle {
 public:
  UpdateCycle(IIpResolver& ipResolver, Reconciler& rcnReconciler);
  ~UpdateCycle();

  common::CycleReport run();

 private:
  IIpResolver& _ipResolver;
  Reconciler& _rcnReconciler;
  int _iCycle = 0;
};

}  // namespace ddns::core
