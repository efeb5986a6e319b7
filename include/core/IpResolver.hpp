#pragma once

#include <string>

#include "common/Types.hpp"
#include "http/IHttpClient.hpp"

namespace ddns::core {

/// Source of the machine's current public IPv4 address.
class IIpResolver {
 public:
  virtual ~IIpResolver() = default;

  /// One lookup, no retry. Never throws for network or format failures.
  virtual common::ResolveResult resolve() = 0;
};

/// Queries an IP echo endpoint (plaintext body, or JSON with an "ip" field).
/// Class abbreviation: ipr
class HttpIpResolver : public IIpResolver {
 public:
  HttpIpResolver(http::IHttpClient& hcClient, std::string sEchoUrl);
  ~HttpIpResolver() override;

  common::ResolveResult resolve() override;

  /// Strict dotted quad: four decimal octets 0-255, no leading zeros.
  static bool isValidIpv4(const std::string& sAddress);

 private:
  http::IHttpClient& _hcClient;
  std::string _sEchoUrl;
};

}  // namespace ddns::core
