#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "conduit/logging/log_formatter.h"
#include "conduit/logging/log_message.h"

namespace conduit {
namespace logging {

// Base sink interface
class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  Target target_;
  std::mutex mutex_;
};

// File sink with size-based rotation
class RotatingFileSink : public LogSink {
 public:
  struct Config {
    std::string base_filename;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
    bool auto_flush = false;
  };

  explicit RotatingFileSink(const Config& config);
  ~RotatingFileSink() override;

  void log(const LogMessage& msg) override;
  void flush() override;

 private:
  void openFile();
  void closeFile();
  void rotate();

  Config config_;
  std::ofstream file_;
  size_t current_size_{0};
  std::mutex mutex_;
};

// Discards everything
class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
};

enum class LogFormat { Text, Json };

// "text" or "json", case-insensitive
optional<LogFormat> parseLogFormat(const std::string& name);

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createFileSink(
      const RotatingFileSink::Config& config,
      LogFormat format = LogFormat::Text);
  static std::unique_ptr<LogSink> createStdioSink(
      bool use_stderr = true, LogFormat format = LogFormat::Text);
};

}  // namespace logging
}  // namespace conduit
