#include "common/Types.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <utility>

namespace ddns::common {

std::string Target::fqdn() const {
  if (sSubdomain.empty()) {
    return sDomain;
  }
  return sSubdomain + "." + sDomain;
}

Credentials::Credentials(std::string sKey, std::string sSecret)
    : sApiKey(std::move(sKey)), sSecretApiKey(std::move(sSecret)) {}

Credentials::~Credentials() {
  OPENSSL_cleanse(sApiKey.data(), sApiKey.size());
  OPENSSL_cleanse(sSecretApiKey.data(), sSecretApiKey.size());
}

int CycleReport::count(TargetAction action) const {
  return static_cast<int>(std::count_if(vOutcomes.begin(), vOutcomes.end(),
                                        [action](const TargetOutcome& to) {
                                          return to.action == action;
                                        }));
}

const char* toString(HealthStatus status) {
  switch (status) {
    case HealthStatus::Ok: return "ok";
    case HealthStatus::Unauthorized: return "unauthorized";
    case HealthStatus::Unreachable: return "unreachable";
  }
  return "unknown";
}

const char* toString(ApiErrorKind eKind) {
  switch (eKind) {
    case ApiErrorKind::Unauthorized: return "unauthorized";
    case ApiErrorKind::RateLimited: return "rate_limited";
    case ApiErrorKind::Transient: return "transient";
  }
  return "unknown";
}

const char* toString(ResolveError eError) {
  switch (eError) {
    case ResolveError::Unreachable: return "unreachable";
    case ResolveError::InvalidFormat: return "invalid_format";
  }
  return "unknown";
}

const char* toString(TargetAction action) {
  switch (action) {
    case TargetAction::Unchanged: return "unchanged";
    case TargetAction::Updated: return "updated";
    case TargetAction::Missing: return "missing";
    case TargetAction::FetchFailed: return "fetch_failed";
    case TargetAction::UpdateFailed: return "update_failed";
  }
  return "unknown";
}

}  // namespace ddns::common
