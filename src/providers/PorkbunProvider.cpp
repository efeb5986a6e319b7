#include "providers/PorkbunProvider.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace ddns::providers {

using common::ApiError;
using common::ApiErrorKind;
using nlohmann::json;

namespace {

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

bool contains(const std::string& sHaystack, const char* pNeedle) {
  return sHaystack.find(pNeedle) != std::string::npos;
}

/// Porkbun encodes most scalar fields as strings; accept either form.
std::string stringField(const json& jObj, const char* pKey) {
  auto it = jObj.find(pKey);
  if (it == jObj.end() || it->is_null()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

}  // namespace

PorkbunProvider::PorkbunProvider(http::IHttpClient& hcClient, std::string sApiBaseUrl,
                                 uint32_t uTtl)
    : _hcClient(hcClient), _sApiBaseUrl(std::move(sApiBaseUrl)), _uTtl(uTtl) {}

PorkbunProvider::~PorkbunProvider() = default;

std::string PorkbunProvider::name() const { return "porkbun"; }

std::string PorkbunProvider::recordUrl(const std::string& sAction,
                                       const common::Target& tgTarget) const {
  std::string sUrl = _sApiBaseUrl + "/dns/" + sAction + "/" + tgTarget.sDomain + "/A";
  if (!tgTarget.isRoot()) {
    sUrl += "/" + tgTarget.sSubdomain;
  }
  return sUrl;
}

std::optional<ApiError> PorkbunProvider::classify(long lHttpStatus, const json& jBody) {
  const std::string sStatus = jBody.is_object() ? stringField(jBody, "status") : std::string{};
  std::string sMessage = jBody.is_object() ? stringField(jBody, "message") : std::string{};

  if (lHttpStatus >= 200 && lHttpStatus < 300 && sStatus == "SUCCESS") {
    return std::nullopt;
  }

  if (sMessage.empty()) {
    sMessage = "HTTP " + std::to_string(lHttpStatus) +
               (sStatus.empty() ? " (no status in response)" : " status=" + sStatus);
  }

  const std::string sLower = toLower(sMessage);
  if (lHttpStatus == 401 || lHttpStatus == 403 || contains(sLower, "invalid api key") ||
      contains(sLower, "api access") || contains(sLower, "authentication")) {
    return ApiError{ApiErrorKind::Unauthorized, std::move(sMessage)};
  }
  if (lHttpStatus == 429 || contains(sLower, "rate limit") || contains(sLower, "too many")) {
    return ApiError{ApiErrorKind::RateLimited, std::move(sMessage)};
  }
  return ApiError{ApiErrorKind::Transient, std::move(sMessage)};
}

std::optional<ApiError> PorkbunProvider::call(const std::string& sUrl,
                                              const common::Credentials& crCreds,
                                              json jPayload, json& jResponse) {
  jPayload["apikey"] = crCreds.sApiKey;
  jPayload["secretapikey"] = crCreds.sSecretApiKey;
  std::string sBody = jPayload.dump();
  jPayload.clear();

  http::HttpResponse hr;
  try {
    hr = _hcClient.postJson(sUrl, sBody);
  } catch (const common::TransportError& ex) {
    OPENSSL_cleanse(sBody.data(), sBody.size());
    return ApiError{ApiErrorKind::Transient, std::string("transport: ") + ex.what()};
  }
  OPENSSL_cleanse(sBody.data(), sBody.size());

  jResponse = json::parse(hr.sBody, nullptr, /*allow_exceptions=*/false);
  if (jResponse.is_discarded() || !jResponse.is_object()) {
    common::Logger::get()->debug("Porkbun returned a non-JSON body (HTTP {})", hr.lStatus);
    jResponse = json::object();
  }
  return classify(hr.lStatus, jResponse);
}

common::HealthStatus PorkbunProvider::testConnectivity(const common::Credentials& crCreds) {
  json jResponse;
  auto oError = call(_sApiBaseUrl + "/ping", crCreds, json::object(), jResponse);
  if (!oError) {
    common::Logger::get()->debug("Porkbun ping ok (yourIp={})",
                                 stringField(jResponse, "yourIp"));
    return common::HealthStatus::Ok;
  }
  common::Logger::get()->debug("Porkbun ping failed: {}", oError->sMessage);
  return oError->eKind == ApiErrorKind::Unauthorized ? common::HealthStatus::Unauthorized
                                                     : common::HealthStatus::Unreachable;
}

common::FetchResult PorkbunProvider::fetchRecord(const common::Credentials& crCreds,
                                                 const common::Target& tgTarget) {
  common::FetchResult fr;
  json jResponse;
  fr.oError = call(recordUrl("retrieveByNameType", tgTarget), crCreds, json::object(),
                   jResponse);
  if (fr.oError) {
    return fr;
  }

  auto itRecords = jResponse.find("records");
  if (itRecords == jResponse.end() || !itRecords->is_array()) {
    return fr;
  }

  const std::string sFqdn = toLower(tgTarget.fqdn());
  int iMatches = 0;
  for (const auto& jRecord : *itRecords) {
    if (!jRecord.is_object() || stringField(jRecord, "type") != "A" ||
        toLower(stringField(jRecord, "name")) != sFqdn) {
      continue;
    }
    if (++iMatches > 1) {
      continue;
    }
    fr.rrRecord.bExists = true;
    fr.rrRecord.sCurrentValue = stringField(jRecord, "content");
  }

  if (iMatches > 1) {
    common::Logger::get()->debug("{} has {} A records; comparing against the first",
                                 tgTarget.fqdn(), iMatches);
  }
  return fr;
}

common::UpdateResult PorkbunProvider::updateRecord(const common::Credentials& crCreds,
                                                   const common::Target& tgTarget,
                                                   const std::string& sNewAddress) {
  json jPayload = {{"content", sNewAddress}, {"ttl", std::to_string(_uTtl)}};
  json jResponse;
  common::UpdateResult ur;
  ur.oError = call(recordUrl("editByNameType", tgTarget), crCreds, std::move(jPayload),
                   jResponse);
  return ur;
}

}  // namespace ddns::providers
