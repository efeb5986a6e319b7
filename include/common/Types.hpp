#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ddns::common {

/// One (domain, subdomain) pair whose A record is kept in sync.
/// An empty subdomain denotes the bare domain.
/// Class abbreviation: tg
struct Target {
  std::string sDomain;
  std::string sSubdomain;

  /// subdomain + "." + domain, or just the domain for the root target.
  std::string fqdn() const;
  bool isRoot() const { return sSubdomain.empty(); }

  bool operator==(const Target&) const = default;
};

/// Porkbun API key pair. Wiped from memory on destruction, never logged.
/// Class abbreviation: cr
struct Credentials {
  std::string sApiKey;
  std::string sSecretApiKey;

  Credentials() = default;
  Credentials(std::string sKey, std::string sSecret);
  Credentials(const Credentials&) = default;
  Credentials& operator=(const Credentials&) = default;
  ~Credentials();
};

/// Provider health status.
enum class HealthStatus { Ok, Unauthorized, Unreachable };

/// Current A record as stored by the provider.
/// bExists=false means nothing is provisioned for the host.
/// Class abbreviation: rr
struct RemoteRecord {
  bool bExists = false;
  std::string sCurrentValue;
};

enum class ApiErrorKind { Unauthorized, RateLimited, Transient };

/// Failed provider call, classified for the retry/log policy.
/// Class abbreviation: ae
struct ApiError {
  ApiErrorKind eKind = ApiErrorKind::Transient;
  std::string sMessage;
};

/// Outcome of IProvider::fetchRecord.
/// Class abbreviation: fr
struct FetchResult {
  RemoteRecord rrRecord;
  std::optional<ApiError> oError;

  bool ok() const { return !oError.has_value(); }
};

/// Outcome of IProvider::updateRecord.
/// Class abbreviation: ur
struct UpdateResult {
  std::optional<ApiError> oError;

  bool ok() const { return !oError.has_value(); }
};

enum class ResolveError { Unreachable, InvalidFormat };

/// Outcome of one public IP lookup.
/// Class abbreviation: rs
struct ResolveResult {
  std::string sAddress;
  std::optional<ResolveError> oError;
  std::string sErrorMessage;

  bool ok() const { return !oError.has_value(); }
};

/// What the reconciler did with one target in one cycle.
enum class TargetAction { Unchanged, Updated, Missing, FetchFailed, UpdateFailed };

/// Class abbreviation: to
struct TargetOutcome {
  std::string sFqdn;
  TargetAction action = TargetAction::Unchanged;
  std::string sPreviousValue;
  std::optional<ApiError> oError;
};

/// Summary of one reconciliation pass over the target set.
/// Class abbreviation: crp
struct CycleReport {
  bool bResolved = false;
  std::string sObservedAddress;
  std::vector<TargetOutcome> vOutcomes;

  int count(TargetAction action) const;
};

const char* toString(HealthStatus status);
const char* toString(ApiErrorKind eKind);
const char* toString(ResolveError eError);
const char* toString(TargetAction action);

}  // namespace ddns::common
