#pragma once

#include <string>

namespace ddns::common {

/// Environment variable loader. Loads all PORKBUN_* vars into a typed
/// struct with validation.
/// Class abbreviation: cfg
struct Config {
  // ── Required ──────────────────────────────────────────────────────────
  std::string sApiKey;        // raw key (zeroed after handoff to Credentials)
  std::string sSecretApiKey;  // raw secret (zeroed after handoff to Credentials)
  std::string sDomain;

  // ── Targets ───────────────────────────────────────────────────────────
  std::string sSubdomains;  // comma-separated, parsed by TargetSet

  // ── Scheduling ────────────────────────────────────────────────────────
  int iCheckIntervalSeconds = 300;
  int iMaxParallelTargets = 1;

  // ── Porkbun API ───────────────────────────────────────────────────────
  std::string sApiBaseUrl = "https://api.porkbun.com/api/json/v3";
  int iRecordTtl = 600;

  // ── HTTP ──────────────────────────────────────────────────────────────
  std::string sIpEchoUrl = "https://api.ipify.org";
  int iHttpTimeoutSeconds = 10;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";

  /// Load and validate all config from environment variables.
  /// Reads sDotEnvPath first (see loadDotEnv), then the environment.
  /// Implements _FILE fallback for PORKBUN_API_KEY and PORKBUN_SECRET_API_KEY.
  /// Throws ConfigError on missing required vars or invalid constraints.
  static Config load(const std::string& sDotEnvPath = ".env");

  /// Export KEY=VALUE lines from a dotenv file without overriding variables
  /// that are already set. A missing file is ignored.
  static void loadDotEnv(const std::string& sPath);

  /// Zero the raw key material once Credentials owns a copy.
  void wipeSecrets();

 private:
  /// Read an env var with optional _FILE fallback for secrets.
  /// If varName is unset, tries varName + "_FILE" and reads file contents.
  /// Trims trailing whitespace/newlines from file contents.
  static std::string loadSecret(const char* pVarName);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as int with a default value.
  static int getEnvInt(const char* pVarName, int iDefault);
};

}  // namespace ddns::common
