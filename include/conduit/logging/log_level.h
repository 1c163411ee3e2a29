#pragma once

#include <cctype>
#include <cstdint>
#include <string>

#include "conduit/core/compat.h"

namespace conduit {
namespace logging {

// Severity, lowest first. Off suppresses everything.
enum class LogLevel : uint8_t {
  Debug = 0,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency,
  Off
};

inline const char* logLevelToString(LogLevel level) {
  static const char* const kNames[] = {"DEBUG",    "INFO",  "NOTICE",
                                       "WARNING",  "ERROR", "CRITICAL",
                                       "ALERT",    "EMERGENCY", "OFF"};
  auto index = static_cast<size_t>(level);
  return index < sizeof(kNames) / sizeof(kNames[0]) ? kNames[index]
                                                    : "UNKNOWN";
}

// Case-insensitive; nullopt for anything that is not a level name
inline optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string upper;
  upper.reserve(name.size());
  for (char c : name) {
    upper.push_back(
        static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
    auto level = static_cast<LogLevel>(i);
    if (upper == logLevelToString(level)) {
      return level;
    }
  }
  return nullopt;
}

}  // namespace logging
}  // namespace conduit
