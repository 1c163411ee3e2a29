#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

#include "conduit/logging/log_level.h"
#include "conduit/logging/log_message.h"
#include "conduit/logging/log_sink.h"

namespace conduit {
namespace logging {

/**
 * Named logger with its own threshold and sink.
 *
 * Records below the threshold are dropped before the message is
 * formatted.
 */
class Logger {
 public:
  explicit Logger(const std::string& name) : name_(name) {}

  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* format_str,
           Args&&... args) {
    if (!shouldLog(level)) {
      return;
    }
    LogMessage msg;
    msg.level = level;
    msg.message =
        fmt::format(fmt::runtime(format_str), std::forward<Args>(args)...);
    msg.logger_name = name_;
    msg.file = file;
    msg.line = line;
    msg.function = function;
    write(msg);
  }

  void setLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const { return level_.load(std::memory_order_relaxed); }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  bool shouldLog(LogLevel level) const {
    LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::Off && level >= threshold;
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

 private:
  void write(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

  const std::string name_;
  std::atomic<LogLevel> level_{LogLevel::Info};
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace conduit
