#pragma once

#include <string>

#include "tokenkeeper/logging/log_message.h"

namespace tokenkeeper {
namespace logging {

class Formatter {
 public:
  virtual ~Formatter() = default;
  virtual std::string format(const LogMessage& msg) const = 0;
};

// [time] [LEVEL] [T:thread] [logger] [file:line function()] message {k=v}
class DefaultFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

// One JSON object per line
class JsonFormatter : public Formatter {
 public:
  std::string format(const LogMessage& msg) const override;
};

}  // namespace logging
}  // namespace tokenkeeper
