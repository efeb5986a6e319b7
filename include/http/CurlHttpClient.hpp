#pragma once

#include <chrono>
#include <string>

#include "http/IHttpClient.hpp"

namespace ddns::http {

/// RAII guard for curl_global_init() / curl_global_cleanup().
/// Construct once in main() before any CurlHttpClient is used.
/// Class abbreviation: cg
class CurlGlobal {
 public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

/// libcurl easy-handle client. One handle per request, so a single
/// instance may be shared across threads.
/// Class abbreviation: chc
class CurlHttpClient : public IHttpClient {
 public:
  explicit CurlHttpClient(std::chrono::seconds durTimeout,
                          std::string sUserAgent = "porkbun-ddns/1.0");
  ~CurlHttpClient() override;

  HttpResponse get(const std::string& sUrl) override;
  HttpResponse postJson(const std::string& sUrl, const std::string& sJsonBody) override;

 private:
  /// Run one request. pBody == nullptr means GET.
  HttpResponse perform(const std::string& sUrl, const std::string* pBody);

  std::chrono::seconds _durTimeout;
  std::string _sUserAgent;
};

}  // namespace ddns::http
