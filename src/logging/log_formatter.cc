#include "conduit/logging/log_formatter.h"

#include <cstring>
#include <ctime>
#include <sstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace conduit {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto seconds = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_buf;
  localtime_r(&seconds, &tm_buf);

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
  return fmt::format("{}.{:03d}", date, static_cast<int>(ms.count()));
}

std::string threadIdString(const std::thread::id& id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

// Basename of __FILE__
const char* shortFile(const char* file) {
  const char* slash = std::strrchr(file, '/');
  return slash ? slash + 1 : file;
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;

  fmt::format_to(std::back_inserter(out), "[{}] [{}] [T:{}] [{}] ",
                 formatTimestamp(msg.timestamp), logLevelToString(msg.level),
                 threadIdString(msg.thread_id), msg.logger_name);

  if (msg.file && msg.line > 0) {
    fmt::format_to(std::back_inserter(out), "[{}:{}] ", shortFile(msg.file),
                   msg.line);
  }

  fmt::format_to(std::back_inserter(out), "{}", msg.message);
  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json record;
  record["timestamp"] = formatTimestamp(msg.timestamp);
  record["level"] = logLevelToString(msg.level);
  record["logger"] = msg.logger_name;
  record["thread"] = threadIdString(msg.thread_id);
  if (msg.file && msg.line > 0) {
    record["file"] = shortFile(msg.file);
    record["line"] = msg.line;
  }
  if (msg.function) {
    record["function"] = msg.function;
  }
  record["message"] = msg.message;
  return record.dump();
}

}  // namespace logging
}  // namespace conduit
