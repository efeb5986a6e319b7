#include "http/CurlHttpClient.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <utility>

namespace ddns::http {

namespace {

struct CurlEasyDeleter {
  void operator()(CURL* pCurl) const { curl_easy_cleanup(pCurl); }
};

struct CurlSlistDeleter {
  void operator()(curl_slist* pList) const { curl_slist_free_all(pList); }
};

using CurlPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t writeCallback(char* pData, size_t uSize, size_t uCount, void* pUser) {
  auto* pOut = static_cast<std::string*>(pUser);
  const size_t uTotal = uSize * uCount;
  pOut->append(pData, uTotal);
  return uTotal;
}

}  // namespace

// ── CurlGlobal ─────────────────────────────────────────────────────────────

CurlGlobal::CurlGlobal() {
  const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
  if (rc != CURLE_OK) {
    throw common::TransportError("curl_init_failed",
                                 std::string("curl_global_init failed: ") +
                                     curl_easy_strerror(rc));
  }
}

CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

// ── CurlHttpClient ─────────────────────────────────────────────────────────

CurlHttpClient::CurlHttpClient(std::chrono::seconds durTimeout, std::string sUserAgent)
    : _durTimeout(durTimeout), _sUserAgent(std::move(sUserAgent)) {}

CurlHttpClient::~CurlHttpClient() = default;

HttpResponse CurlHttpClient::get(const std::string& sUrl) { return perform(sUrl, nullptr); }

HttpResponse CurlHttpClient::postJson(const std::string& sUrl, const std::string& sJsonBody) {
  return perform(sUrl, &sJsonBody);
}

HttpResponse CurlHttpClient::perform(const std::string& sUrl, const std::string* pBody) {
  CurlPtr upCurl(curl_easy_init());
  if (!upCurl) {
    throw common::TransportError("curl_handle_failed", "curl_easy_init returned null");
  }

  CURL* pCurl = upCurl.get();
  HttpResponse hr;
  char aErrorBuf[CURL_ERROR_SIZE] = {0};
  const long lTimeoutMs = static_cast<long>(
      std::chrono::duration_cast<std::chrono::milliseconds>(_durTimeout).count());

  curl_easy_setopt(pCurl, CURLOPT_URL, sUrl.c_str());
  curl_easy_setopt(pCurl, CURLOPT_TIMEOUT_MS, lTimeoutMs);
  curl_easy_setopt(pCurl, CURLOPT_CONNECTTIMEOUT_MS, lTimeoutMs);
  curl_easy_setopt(pCurl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(pCurl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(pCurl, CURLOPT_USERAGENT, _sUserAgent.c_str());
  curl_easy_setopt(pCurl, CURLOPT_ERRORBUFFER, aErrorBuf);
  curl_easy_setopt(pCurl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(pCurl, CURLOPT_WRITEDATA, &hr.sBody);

  SlistPtr upHeaders;
  if (pBody != nullptr) {
    curl_slist* pList = curl_slist_append(nullptr, "Content-Type: application/json");
    pList = curl_slist_append(pList, "Accept: application/json");
    upHeaders.reset(pList);
    curl_easy_setopt(pCurl, CURLOPT_HTTPHEADER, upHeaders.get());
    curl_easy_setopt(pCurl, CURLOPT_POST, 1L);
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDS, pBody->c_str());
    curl_easy_setopt(pCurl, CURLOPT_POSTFIELDSIZE, static_cast<long>(pBody->size()));
    // The body carries the API secret; never replay it to another location.
    curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 0L);
  } else {
    curl_easy_setopt(pCurl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(pCurl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(pCurl, CURLOPT_MAXREDIRS, 3L);
    curl_easy_setopt(pCurl, CURLOPT_REDIR_PROTOCOLS_STR, "https");
  }

  const CURLcode rc = curl_easy_perform(pCurl);
  if (rc != CURLE_OK) {
    const std::string sDetail = aErrorBuf[0] != '\0' ? aErrorBuf : curl_easy_strerror(rc);
    const char* pCode = rc == CURLE_OPERATION_TIMEDOUT ? "timeout" : "transport_failed";
    throw common::TransportError(pCode, sDetail);
  }

  curl_easy_getinfo(pCurl, CURLINFO_RESPONSE_CODE, &hr.lStatus);
  common::Logger::get()->trace("HTTP {} {} -> {} ({} bytes)", pBody ? "POST" : "GET", sUrl,
                               hr.lStatus, hr.sBody.size());
  return hr;
}

}  // namespace ddns::http
