#pragma once

#include <string>

#include "conduit/logging/log_message.h"

namespace conduit {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// "[time] [LEVEL] [T:thread] [component] [file:line] message"
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per record
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace conduit
