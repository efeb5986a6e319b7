#include "providers/PorkbunProvider.hpp"

#include "common/Logger.hpp"
#include "core/IpResolver.hpp"
#include "http/CurlHttpClient.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

using namespace ddns::common;
using ddns::core::HttpIpResolver;
using ddns::http::CurlHttpClient;
using ddns::providers::PorkbunProvider;

namespace {

std::string getEnv(const char* pName) {
  const char* pValue = std::getenv(pName);
  return pValue ? std::string(pValue) : std::string{};
}

}  // namespace

/// Read-only checks against the real Porkbun API. Never updates records.
/// Needs PORKBUN_IT_API_KEY, PORKBUN_IT_SECRET_API_KEY and PORKBUN_IT_DOMAIN.
class PorkbunLiveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    _sApiKey = getEnv("PORKBUN_IT_API_KEY");
    _sSecret = getEnv("PORKBUN_IT_SECRET_API_KEY");
    _sDomain = getEnv("PORKBUN_IT_DOMAIN");
    if (_sApiKey.empty() || _sSecret.empty() || _sDomain.empty()) {
      GTEST_SKIP() << "PORKBUN_IT_* not set — skipping live Porkbun test";
    }
    Logger::init("warn");
    _upCurl = std::make_unique<ddns::http::CurlGlobal>();
    _upClient = std::make_unique<CurlHttpClient>(std::chrono::seconds(15));
  }

  std::string _sApiKey;
  std::string _sSecret;
  std::string _sDomain;
  std::unique_ptr<ddns::http::CurlGlobal> _upCurl;
  std::unique_ptr<CurlHttpClient> _upClient;
};

TEST_F(PorkbunLiveTest, PingAcceptsCredentials) {
  PorkbunProvider pb(*_upClient, "https://api.porkbun.com/api/json/v3", 600);
  EXPECT_EQ(pb.testConnectivity(Credentials{_sApiKey, _sSecret}), HealthStatus::Ok);
}

TEST_F(PorkbunLiveTest, BadCredentialsAreUnauthorized) {
  PorkbunProvider pb(*_upClient, "https://api.porkbun.com/api/json/v3", 600);
  auto fr = pb.fetchRecord(Credentials{"pk1_invalid", "sk1_invalid"}, Target{_sDomain, ""});
  ASSERT_FALSE(fr.ok());
  EXPECT_EQ(fr.oError->eKind, ApiErrorKind::Unauthorized);
}

TEST_F(PorkbunLiveTest, FetchRootRecordSucceeds) {
  PorkbunProvider pb(*_upClient, "https://api.porkbun.com/api/json/v3", 600);
  auto fr = pb.fetchRecord(Credentials{_sApiKey, _sSecret}, Target{_sDomain, ""});
  ASSERT_TRUE(fr.ok()) << fr.oError->sMessage;
  if (fr.rrRecord.bExists) {
    EXPECT_TRUE(HttpIpResolver::isValidIpv4(fr.rrRecord.sCurrentValue));
  }
}

TEST_F(PorkbunLiveTest, IpEchoReturnsIpv4) {
  HttpIpResolver ipr(*_upClient, "https://api.ipify.org");
  auto rs = ipr.resolve();
  ASSERT_TRUE(rs.ok()) << rs.sErrorMessage;
  EXPECT_TRUE(HttpIpResolver::isValidIpv4(rs.sAddress));
}
