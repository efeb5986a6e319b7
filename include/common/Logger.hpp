#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace ddns::common {

/// Thin wrapper over spdlog. All output goes to stdout through a single
/// logger named "ddns", installed as spdlog's default logger.
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Checking {} targets", iCount);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  static void init(const std::string& sLevel);

  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// True if sLevel is one of the names accepted by init().
  static bool isValidLevel(const std::string& sLevel);

 private:
  static bool _bInitialized;
};

}  // namespace ddns::common
