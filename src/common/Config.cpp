#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <openssl/crypto.h>

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

#include <stdlib.h>

namespace ddns::common {

namespace {

std::string trim(const std::string& sValue) {
  const auto iBegin = sValue.find_first_not_of(" \t\r\n");
  if (iBegin == std::string::npos) {
    return {};
  }
  const auto iEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(iBegin, iEnd - iBegin + 1);
}

std::string getEnvOr(const std::string& sValue, const char* pDefault) {
  return sValue.empty() ? std::string(pDefault) : sValue;
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? trim(pValue) : std::string{};
}

int Config::getEnvInt(const char* pVarName, int iDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return iDefault;
  }
  int iValue = 0;
  const char* pEnd = sValue.data() + sValue.size();
  auto [pPtr, ec] = std::from_chars(sValue.data(), pEnd, iValue);
  if (ec != std::errc{} || pPtr != pEnd) {
    throw ConfigError("invalid_integer",
                      std::string("Invalid integer value for ") + pVarName + ": " + sValue);
  }
  return iValue;
}

std::string Config::loadSecret(const char* pVarName) {
  std::string sValue = getEnv(pVarName);
  if (!sValue.empty()) {
    return sValue;
  }

  const std::string sFileVar = std::string(pVarName) + "_FILE";
  const std::string sFilePath = getEnv(sFileVar.c_str());
  if (sFilePath.empty()) {
    throw ConfigError("missing_secret",
                      std::string("Required secret not set: neither ") + pVarName + " nor " +
                          sFileVar + " is defined");
  }

  std::ifstream ifs(sFilePath);
  if (!ifs.is_open()) {
    throw ConfigError("unreadable_secret", std::string("Cannot open secret file specified by ") +
                                               sFileVar + ": " + sFilePath);
  }

  std::ostringstream oss;
  oss << ifs.rdbuf();
  sValue = oss.str();

  while (!sValue.empty() &&
         (sValue.back() == '\n' || sValue.back() == '\r' || sValue.back() == ' ')) {
    sValue.pop_back();
  }

  if (sValue.empty()) {
    throw ConfigError("empty_secret", std::string("Secret file is empty: ") + sFilePath +
                                          " (from " + sFileVar + ")");
  }

  return sValue;
}

void Config::loadDotEnv(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    return;
  }

  std::string sLine;
  int iLineNo = 0;
  while (std::getline(ifs, sLine)) {
    ++iLineNo;
    sLine = trim(sLine);
    if (sLine.empty() || sLine.front() == '#') {
      continue;
    }
    if (sLine.rfind("export ", 0) == 0) {
      sLine = trim(sLine.substr(7));
    }

    const auto iEq = sLine.find('=');
    const std::string sKey = iEq == std::string::npos ? std::string{} : trim(sLine.substr(0, iEq));
    if (sKey.empty()) {
      throw ConfigError("invalid_dotenv", sPath + ":" + std::to_string(iLineNo) +
                                              ": expected KEY=VALUE");
    }

    std::string sValue = trim(sLine.substr(iEq + 1));
    if (sValue.size() >= 2 && (sValue.front() == '"' || sValue.front() == '\'') &&
        sValue.back() == sValue.front()) {
      sValue = sValue.substr(1, sValue.size() - 2);
    }

    // overwrite=0: the process environment wins
    if (setenv(sKey.c_str(), sValue.c_str(), 0) != 0) {
      throw ConfigError("invalid_dotenv", sPath + ":" + std::to_string(iLineNo) +
                                              ": cannot export " + sKey);
    }
  }
}

Config Config::load(const std::string& sDotEnvPath) {
  loadDotEnv(sDotEnvPath);

  Config cfg;

  // ── Required vars ──────────────────────────────────────────────────────
  cfg.sApiKey = loadSecret("PORKBUN_API_KEY");
  cfg.sSecretApiKey = loadSecret("PORKBUN_SECRET_API_KEY");

  cfg.sDomain = getEnv("PORKBUN_DOMAIN");
  if (cfg.sDomain.empty()) {
    throw ConfigError("missing_domain",
                      "Required environment variable PORKBUN_DOMAIN is not set");
  }

  // ── Optional vars with defaults ────────────────────────────────────────
  cfg.sSubdomains = getEnv("PORKBUN_SUBDOMAIN");
  cfg.iCheckIntervalSeconds = getEnvInt("PORKBUN_CHECK_INTERVAL_SECONDS", 300);
  cfg.iMaxParallelTargets = getEnvInt("PORKBUN_MAX_PARALLEL_TARGETS", 1);
  cfg.sApiBaseUrl = getEnvOr(getEnv("PORKBUN_API_BASE_URL"), "https://api.porkbun.com/api/json/v3");
  cfg.iRecordTtl = getEnvInt("PORKBUN_RECORD_TTL", 600);
  cfg.sIpEchoUrl = getEnvOr(getEnv("PORKBUN_IP_ECHO_URL"), "https://api.ipify.org");
  cfg.iHttpTimeoutSeconds = getEnvInt("PORKBUN_HTTP_TIMEOUT_SECONDS", 10);
  const bool bTimeoutSet = !getEnv("PORKBUN_HTTP_TIMEOUT_SECONDS").empty();
  cfg.sLogLevel = getEnvOr(getEnv("PORKBUN_LOG_LEVEL"), "info");

  while (!cfg.sApiBaseUrl.empty() && cfg.sApiBaseUrl.back() == '/') {
    cfg.sApiBaseUrl.pop_back();
  }

  // ── Validation ─────────────────────────────────────────────────────────

  if (cfg.iCheckIntervalSeconds < 1) {
    throw ConfigError("invalid_interval",
                      "PORKBUN_CHECK_INTERVAL_SECONDS must be >= 1 (got " +
                          std::to_string(cfg.iCheckIntervalSeconds) + ")");
  }

  if (cfg.iMaxParallelTargets < 1) {
    throw ConfigError("invalid_parallelism",
                      "PORKBUN_MAX_PARALLEL_TARGETS must be >= 1 (got " +
                          std::to_string(cfg.iMaxParallelTargets) + ")");
  }

  if (cfg.iHttpTimeoutSeconds < 1) {
    throw ConfigError("invalid_timeout",
                      "PORKBUN_HTTP_TIMEOUT_SECONDS must be >= 1 (got " +
                          std::to_string(cfg.iHttpTimeoutSeconds) + ")");
  }

  // One stalled call must not hold a cycle past the next tick
  if (cfg.iHttpTimeoutSeconds > cfg.iCheckIntervalSeconds) {
    if (bTimeoutSet) {
      throw ConfigError("timeout_exceeds_interval",
                        "PORKBUN_HTTP_TIMEOUT_SECONDS (" +
                            std::to_string(cfg.iHttpTimeoutSeconds) +
                            ") must not exceed PORKBUN_CHECK_INTERVAL_SECONDS (" +
                            std::to_string(cfg.iCheckIntervalSeconds) + ")");
    }
    cfg.iHttpTimeoutSeconds = cfg.iCheckIntervalSeconds;
  }

  // Porkbun rejects TTLs below 600 seconds
  if (cfg.iRecordTtl < 600) {
    throw ConfigError("invalid_ttl", "PORKBUN_RECORD_TTL must be >= 600 (got " +
                                         std::to_string(cfg.iRecordTtl) + ")");
  }

  if (cfg.sApiBaseUrl.empty()) {
    throw ConfigError("invalid_url", "PORKBUN_API_BASE_URL must not be empty");
  }

  if (!Logger::isValidLevel(cfg.sLogLevel)) {
    throw ConfigError("invalid_log_level", "PORKBUN_LOG_LEVEL is not a valid level: " +
                                               cfg.sLogLevel);
  }

  return cfg;
}

void Config::wipeSecrets() {
  OPENSSL_cleanse(sApiKey.data(), sApiKey.size());
  sApiKey.clear();
  OPENSSL_cleanse(sSecretApiKey.data(), sSecretApiKey.size());
  sSecretApiKey.clear();
}

}  // namespace ddns::common
