#pragma once

#include <string>

#include "common/Types.hpp"

namespace ddns::providers {

/// Pure abstract interface for the DNS provider integration.
/// Implementations never create records: updateRecord() edits a record a
/// preceding fetchRecord() reported as existing.
class IProvider {
 public:
  virtual ~IProvider() = default;

  virtual std::string name() const = 0;
  virtual common::HealthStatus testConnectivity(const common::Credentials& crCreds) = 0;
  virtual common::FetchResult fetchRecord(const common::Credentials& crCreds,
                                          const common::Target& tgTarget) = 0;
  virtual common::UpdateResult updateRecord(const common::Credentials& crCreds,
                                            const common::Target& tgTarget,
                                            const std::string& sNewAddress) = 0;
};

}  // namespace ddns::providers
