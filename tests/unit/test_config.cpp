#include "common/Config.hpp"

#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace ddns::common;

namespace {

void clearAllPorkbunEnv() {
  const char* vVars[] = {
      "PORKBUN_API_KEY", "PORKBUN_API_KEY_FILE", "PORKBUN_SECRET_API_KEY",
      "PORKBUN_SECRET_API_KEY_FILE", "PORKBUN_DOMAIN", "PORKBUN_SUBDOMAIN",
      "PORKBUN_CHECK_INTERVAL_SECONDS", "PORKBUN_MAX_PARALLEL_TARGETS",
      "PORKBUN_API_BASE_URL", "PORKBUN_RECORD_TTL", "PORKBUN_IP_ECHO_URL",
      "PORKBUN_HTTP_TIMEOUT_SECONDS", "PORKBUN_LOG_LEVEL",
      nullptr};
  for (int i = 0; vVars[i] != nullptr; ++i) {
    unsetenv(vVars[i]);
  }
}

void setMinimumRequiredEnv() {
  setenv("PORKBUN_API_KEY", "pk1_test", 1);
  setenv("PORKBUN_SECRET_API_KEY", "sk1_test", 1);
  setenv("PORKBUN_DOMAIN", "example.com", 1);
}

}  // namespace

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { clearAllPorkbunEnv(); }
  void TearDown() override { clearAllPorkbunEnv(); }
};

TEST_F(ConfigTest, LoadWithAllRequiredVars) {
  setMinimumRequiredEnv();
  auto cfg = Config::load();
  EXPECT_EQ(cfg.sApiKey, "pk1_test");
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_test");
  EXPECT_EQ(cfg.sDomain, "example.com");
  EXPECT_EQ(cfg.sSubdomains, "");
  EXPECT_EQ(cfg.iCheckIntervalSeconds, 300);
  EXPECT_EQ(cfg.iMaxParallelTargets, 1);
  EXPECT_EQ(cfg.iRecordTtl, 600);
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 10);
  EXPECT_EQ(cfg.sApiBaseUrl, "https://api.porkbun.com/api/json/v3");
  EXPECT_EQ(cfg.sIpEchoUrl, "https://api.ipify.org");
  EXPECT_EQ(cfg.sLogLevel, "info");
}

TEST_F(ConfigTest, ThrowsOnMissingApiKey) {
  setenv("PORKBUN_SECRET_API_KEY", "sk1_test", 1);
  setenv("PORKBUN_DOMAIN", "example.com", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnMissingSecretApiKey) {
  setenv("PORKBUN_API_KEY", "pk1_test", 1);
  setenv("PORKBUN_DOMAIN", "example.com", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, ThrowsOnMissingDomain) {
  setenv("PORKBUN_API_KEY", "pk1_test", 1);
  setenv("PORKBUN_SECRET_API_KEY", "sk1_test", 1);

  try {
    Config::load();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err._sErrorCode, "missing_domain");
  }
}

TEST_F(ConfigTest, BlankDomainCountsAsMissing) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_DOMAIN", "   ", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, FallsBackToFileForApiKey) {
  setenv("PORKBUN_SECRET_API_KEY", "sk1_test", 1);
  setenv("PORKBUN_DOMAIN", "example.com", 1);

  const std::string sPath = "/tmp/ddns_test_api_key";
  {
    std::ofstream ofs(sPath);
    ofs << "pk1_from_file\n";
  }
  setenv("PORKBUN_API_KEY_FILE", sPath.c_str(), 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sApiKey, "pk1_from_file");

  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, MissingSecretFileIsConfigError) {
  setenv("PORKBUN_API_KEY", "pk1_test", 1);
  setenv("PORKBUN_DOMAIN", "example.com", 1);
  setenv("PORKBUN_SECRET_API_KEY_FILE", "/nonexistent/ddns/secret", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, IntervalMustBePositive) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "0", 1);
  EXPECT_THROW(Config::load(), ConfigError);

  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "-30", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, IntervalMustBeAnInteger) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "five", 1);
  EXPECT_THROW(Config::load(), ConfigError);

  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "60s", 1);
  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, TtlBelowPorkbunMinimumIsRejected) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_RECORD_TTL", "300", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_LOG_LEVEL", "verbose", 1);

  EXPECT_THROW(Config::load(), ConfigError);
}

TEST_F(ConfigTest, OverrideDefaults) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_SUBDOMAIN", "www,blog", 1);
  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", " 60 ", 1);
  setenv("PORKBUN_MAX_PARALLEL_TARGETS", "4", 1);
  setenv("PORKBUN_API_BASE_URL", "http://localhost:8080/api/", 1);
  setenv("PORKBUN_LOG_LEVEL", "debug", 1);
  setenv("PORKBUN_RECORD_TTL", "3600", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.sSubdomains, "www,blog");
  EXPECT_EQ(cfg.iCheckIntervalSeconds, 60);
  EXPECT_EQ(cfg.iMaxParallelTargets, 4);
  EXPECT_EQ(cfg.sApiBaseUrl, "http://localhost:8080/api");
  EXPECT_EQ(cfg.sLogLevel, "debug");
  EXPECT_EQ(cfg.iRecordTtl, 3600);
}

TEST_F(ConfigTest, WipeSecretsClearsKeys) {
  setMinimumRequiredEnv();
  auto cfg = Config::load();
  cfg.wipeSecrets();
  EXPECT_TRUE(cfg.sApiKey.empty());
  EXPECT_TRUE(cfg.sSecretApiKey.empty());
  EXPECT_EQ(cfg.sDomain, "example.com");
}

TEST_F(ConfigTest, ShortIntervalLowersDefaultTimeout) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "5", 1);

  auto cfg = Config::load();
  EXPECT_EQ(cfg.iCheckIntervalSeconds, 5);
  EXPECT_EQ(cfg.iHttpTimeoutSeconds, 5);
}

TEST_F(ConfigTest, ExplicitTimeoutLongerThanIntervalIsRejected) {
  setMinimumRequiredEnv();
  setenv("PORKBUN_CHECK_INTERVAL_SECONDS", "5", 1);
  setenv("PORKBUN_HTTP_TIMEOUT_SECONDS", "120", 1);

  try {
    Config::load();
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err._sErrorCode, "timeout_exceeds_interval");
  }

  setenv("PORKBUN_HTTP_TIMEOUT_SECONDS", "5", 1);
  EXPECT_EQ(Config::load().iHttpTimeoutSeconds, 5);
}

TEST_F(ConfigTest, DotEnvFillsUnsetVarsOnly) {
  const std::string sPath = "/tmp/ddns_test_dotenv";
  {
    std::ofstream ofs(sPath);
    ofs << "# local overrides\n"
        << "\n"
        << "PORKBUN_API_KEY=pk1_from_dotenv\n"
        << "export PORKBUN_SECRET_API_KEY=\"sk1_from_dotenv\"\n"
        << "PORKBUN_DOMAIN = 'dotenv.example'\n"
        << "PORKBUN_SUBDOMAIN=www,vpn\n";
  }
  setenv("PORKBUN_API_KEY", "pk1_from_env", 1);

  auto cfg = Config::load(sPath);
  EXPECT_EQ(cfg.sApiKey, "pk1_from_env");
  EXPECT_EQ(cfg.sSecretApiKey, "sk1_from_dotenv");
  EXPECT_EQ(cfg.sDomain, "dotenv.example");
  EXPECT_EQ(cfg.sSubdomains, "www,vpn");

  std::remove(sPath.c_str());
}

TEST_F(ConfigTest, MissingDotEnvIsIgnored) {
  setMinimumRequiredEnv();
  auto cfg = Config::load("/nonexistent/ddns/.env");
  EXPECT_EQ(cfg.sDomain, "example.com");
}

TEST_F(ConfigTest, MalformedDotEnvLineIsConfigError) {
  setMinimumRequiredEnv();
  const std::string sPath = "/tmp/ddns_test_dotenv_bad";
  {
    std::ofstream ofs(sPath);
    ofs << "PORKBUN_LOG_LEVEL=debug\n"
        << "this line has no separator\n";
  }

  try {
    Config::load(sPath);
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& err) {
    EXPECT_EQ(err._sErrorCode, "invalid_dotenv");
    EXPECT_NE(std::string(err.what()).find(":2:"), std::string::npos);
  }

  std::remove(sPath.c_str());
}
