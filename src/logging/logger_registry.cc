#include "conduit/logging/logger_registry.h"

namespace conduit {
namespace logging {

std::string LogPattern::globToRegex(const std::string& glob) {
  std::string regex;
  for (char c : glob) {
    switch (c) {
      case '*': regex += ".*"; break;
      case '?': regex += "."; break;
      case '.': regex += "\\."; break;
      default: regex += c; break;
    }
  }
  return regex;
}

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);
  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);
  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;
  refreshLevelsLocked();
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.emplace_back(pattern, level);
  refreshLevelsLocked();
}

void LoggerRegistry::clearPatterns() {
  std::lock_guard<std::mutex> lock(mutex_);
  patterns_.clear();
  refreshLevelsLocked();
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  LogLevel threshold = getEffectiveLevelLocked(name);
  return threshold != LogLevel::Off && level >= threshold;
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  // Latest matching pattern wins
  for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
    if (std::regex_match(name, it->pattern)) {
      return it->level;
    }
  }
  return global_level_;
}

void LoggerRegistry::refreshLevelsLocked() {
  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}


}  // namespace logging
}  // namespace conduit
