#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace ddns::common {

/// Immutable list of targets derived once from configuration.
/// Always holds at least one target.
/// Class abbreviation: ts
class TargetSet {
 public:
  /// Split sSubdomainList on ',' and build one target per entry.
  /// Entries are trimmed and lower-cased; "" and "@" denote the root domain.
  /// Duplicate host names are dropped with a warning (first one wins).
  /// Throws ConfigError if sDomain is empty.
  static TargetSet parse(const std::string& sDomain, const std::string& sSubdomainList);

  const std::vector<Target>& targets() const { return _vTargets; }
  size_t size() const { return _vTargets.size(); }

  std::vector<Target>::const_iterator begin() const { return _vTargets.begin(); }
  std::vector<Target>::const_iterator end() const { return _vTargets.end(); }

 private:
  explicit TargetSet(std::vector<Target> vTargets);

  std::vector<Target> _vTargets;
};

}  // namespace ddns::common
