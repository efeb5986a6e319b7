#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ddns::common {

/// Base error for all application-level exceptions.
/// Carries a machine-readable error code slug.
struct AppError : public std::runtime_error {
  std::string _sErrorCode;

  explicit AppError(std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)), _sErrorCode(std::move(sCode)) {}
};

/// Missing or invalid environment configuration. Fatal at startup only.
struct ConfigError : AppError {
  explicit ConfigError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

/// Connect, TLS or timeout failure below the HTTP status layer.
/// Never escapes a cycle: the IP resolver and provider client convert it
/// into a result variant.
struct TransportError : AppError {
  explicit TransportError(std::string sCode, std::string sMsg)
      : AppError(std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ddns::common
