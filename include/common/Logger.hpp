#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dockops::common {

/// Thin wrapper over spdlog for structured logging.
/// Writes to stderr; stdout is reserved for command output.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Processing stack '{}'", sName);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// Throws std::invalid_argument for any other name.
  static void init(const std::string& sLevel);

  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

 private:
  static bool _bInitialized;
};

}  // namespace dockops::common
