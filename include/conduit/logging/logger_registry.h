#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "conduit/logging/logger.h"

namespace conduit {
namespace logging {

// Glob pattern ("http.*") to level binding
struct LogPattern {
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& glob, LogLevel lvl)
      : pattern(globToRegex(glob)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob);
};

/**
 * Process-wide set of loggers, one per component name.
 *
 * A logger's threshold is the level of the latest pattern matching its
 * name, or the global level when none does. Every logger writes to the
 * registry's default sink (stderr unless replaced).
 */
class LoggerRegistry {
 public:
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);
  std::shared_ptr<Logger> getDefaultLogger();

  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  void setPattern(const std::string& pattern, LogLevel level);
  void clearPatterns();

  // Replaces the sink of every logger, existing and future
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);
  LogLevel getEffectiveLevel(const std::string& name);

 private:
  LoggerRegistry();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;
  void refreshLevelsLocked();

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LogPattern> patterns_;
  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace conduit
