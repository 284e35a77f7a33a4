#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace dockops::common {

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  // from_str maps unknown names to "off", which would silence a typo
  auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw std::invalid_argument("Unknown log level '" + sLevel + "'");
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  const auto level = parseLevel(sLevel);
  if (_bInitialized) {
    spdlog::default_logger()->set_level(level);
    return;
  }

  // stderr keeps stdout free for summaries and `status --json`
  auto spLogger = spdlog::stderr_color_mt("dockops");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
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

}  // namespace dockops::common
