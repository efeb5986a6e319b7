#pragma once

#include <string>

namespace ddns::http {

/// Status line and body of a completed HTTP exchange.
/// Class abbreviation: hr
struct HttpResponse {
  long lStatus = 0;
  std::string sBody;

  bool isSuccess() const { return lStatus >= 200 && lStatus < 300; }
};

/// Pure abstract interface for outbound HTTP.
/// Implementations throw common::TransportError when no response was
/// received (DNS, connect, TLS, timeout). Any HTTP status is a response.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  virtual HttpResponse get(const std::string& sUrl) = 0;
  virtual HttpResponse postJson(const std::string& sUrl, const std::string& sJsonBody) = 0;
};

}  // namespace ddns::http
