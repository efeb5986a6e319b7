#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace ddns::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel) {
  const auto level = spdlog::level::from_str(sLevel);
  if (_bInitialized) {
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("ddns");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->debug("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

bool Logger::isValidLevel(const std::string& sLevel) {
  // from_str() maps unknown names to "off", so "off" has to be checked by name.
  return sLevel == "off" || spdlog::level::from_str(sLevel) != spdlog::level::off;
}

}  // namespace ddns::common
