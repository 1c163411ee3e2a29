#pragma once

#include <chrono>
#include <string>
#include <thread>

#include "conduit/logging/log_level.h"

namespace conduit {
namespace logging {

// Log record handed to sinks
struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;
  // Component the record was logged under, e.g. "http.client"
  std::string logger_name;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  std::thread::id thread_id;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace conduit
