#include "core/IpResolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <arpa/inet.h>
#include <nlohmann/json.hpp>

#include <utility>

namespace ddns::core {

using common::ResolveError;
using common::ResolveResult;

namespace {

std::string trim(const std::string& sValue) {
  const auto iBegin = sValue.find_first_not_of(" \t\r\n");
  if (iBegin == std::string::npos) {
    return {};
  }
  const auto iEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(iBegin, iEnd - iBegin + 1);
}

ResolveResult failure(ResolveError eError, std::string sMessage) {
  ResolveResult rs;
  rs.oError = eError;
  rs.sErrorMessage = std::move(sMessage);
  return rs;
}

}  // namespace

HttpIpResolver::HttpIpResolver(http::IHttpClient& hcClient, std::string sEchoUrl)
    : _hcClient(hcClient), _sEchoUrl(std::move(sEchoUrl)) {}

HttpIpResolver::~HttpIpResolver() = default;

bool HttpIpResolver::isValidIpv4(const std::string& sAddress) {
  if (sAddress.empty() || sAddress.size() > 15) {
    return false;
  }
  // glibc's inet_pton(AF_INET) only accepts the four-part decimal form and
  // rejects octets with leading zeros.
  in_addr addr{};
  return inet_pton(AF_INET, sAddress.c_str(), &addr) == 1;
}

ResolveResult HttpIpResolver::resolve() {
  http::HttpResponse hr;
  try {
    hr = _hcClient.get(_sEchoUrl);
  } catch (const common::TransportError& ex) {
    return failure(ResolveError::Unreachable, ex.what());
  }

  if (!hr.isSuccess()) {
    return failure(ResolveError::Unreachable,
                   "IP echo service returned HTTP " + std::to_string(hr.lStatus));
  }

  std::string sCandidate = trim(hr.sBody);
  if (!sCandidate.empty() && sCandidate.front() == '{') {
    auto jBody = nlohmann::json::parse(sCandidate, nullptr, /*allow_exceptions=*/false);
    auto itIp = jBody.is_object() ? jBody.find("ip") : jBody.end();
    if (jBody.is_discarded() || !jBody.is_object() || itIp == jBody.end() ||
        !itIp->is_string()) {
      return failure(ResolveError::InvalidFormat, "IP echo JSON has no string 'ip' field");
    }
    sCandidate = trim(itIp->get<std::string>());
  }

  if (!isValidIpv4(sCandidate)) {
    return failure(ResolveError::InvalidFormat,
                   "not an IPv4 address: '" + sCandidate.substr(0, 64) + "'");
  }

  common::Logger::get()->debug("Public IPv4 from {}: {}", _sEchoUrl, sCandidate);
  ResolveResult rs;
  rs.sAddress = std::move(sCandidate);
  return rs;
}

}  // namespace ddns::core
