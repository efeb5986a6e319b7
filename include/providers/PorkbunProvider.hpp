#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "http/IHttpClient.hpp"
#include "providers/IProvider.hpp"

namespace ddns::providers {

/// Porkbun JSON API v3 provider implementation.
/// Every call is a POST whose body carries apikey/secretapikey.
class PorkbunProvider : public IProvider {
 public:
  PorkbunProvider(http::IHttpClient& hcClient, std::string sApiBaseUrl, uint32_t uTtl);
  ~PorkbunProvider() override;

  std::string name() const override;
  common::HealthStatus testConnectivity(const common::Credentials& crCreds) override;
  common::FetchResult fetchRecord(const common::Credentials& crCreds,
                                  const common::Target& tgTarget) override;
  common::UpdateResult updateRecord(const common::Credentials& crCreds,
                                    const common::Target& tgTarget,
                                    const std::string& sNewAddress) override;

  /// {base}/dns/{sAction}/{domain}/A[/{subdomain}]
  std::string recordUrl(const std::string& sAction, const common::Target& tgTarget) const;

  /// Map an HTTP status plus the decoded body to the error taxonomy.
  /// Returns nullopt when the call succeeded.
  static std::optional<common::ApiError> classify(long lHttpStatus,
                                                  const nlohmann::json& jBody);

 private:
  /// POST sUrl with credentials merged into jPayload.
  /// Transport failures and undecodable bodies come back as Transient errors.
  std::optional<common::ApiError> call(const std::string& sUrl,
                                       const common::Credentials& crCreds,
                                       nlohmann::json jPayload, nlohmann::json& jResponse);

  http::IHttpClient& _hcClient;
  std::string _sApiBaseUrl;
  uint32_t _uTtl;
};

}  // namespace ddns::providers
