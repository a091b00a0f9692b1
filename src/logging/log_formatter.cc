#include "tokenkeeper/logging/log_formatter.h"

#include <ctime>
#include <iterator>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace tokenkeeper {
namespace logging {

namespace {

std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) {
  const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()) %
                  1000;
  return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", fmt::localtime(seconds),
                     ms.count());
}

std::string threadIdString(std::thread::id id) {
  std::ostringstream oss;
  oss << id;
  return oss.str();
}

}  // namespace

std::string DefaultFormatter::format(const LogMessage& msg) const {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "[{}] [{}] [T:{}] [{}] ", formatTimestamp(msg.timestamp),
                 logLevelToString(msg.level), threadIdString(msg.thread_id),
                 msg.logger_name);

  if (msg.file && msg.line > 0) {
    fmt::format_to(it, "[{}:{}", msg.file, msg.line);
    if (msg.function) {
      fmt::format_to(it, " {}()", msg.function);
    }
    fmt::format_to(it, "] ");
  }

  fmt::format_to(it, "{}", msg.message);

  if (!msg.key_values.empty()) {
    const char* separator = " {";
    for (const auto& kv : msg.key_values) {
      fmt::format_to(it, "{}{}={}", separator, kv.first, kv.second);
      separator = ", ";
    }
    fmt::format_to(it, "}}");
  }

  return fmt::to_string(out);
}

std::string JsonFormatter::format(const LogMessage& msg) const {
  nlohmann::json line = {
      {"timestamp", formatTimestamp(msg.timestamp)},
      {"level", logLevelToString(msg.level)},
      {"logger", msg.logger_name},
      {"thread", threadIdString(msg.thread_id)},
      {"message", msg.message},
  };

  if (msg.process_id > 0) {
    line["pid"] = msg.process_id;
  }
  if (msg.file && msg.line > 0) {
    line["file"] = msg.file;
    line["line"] = msg.line;
  }
  // Structured fields never replace the fixed ones
  for (const auto& kv : msg.key_values) {
    if (!line.contains(kv.first)) {
      line[kv.first] = kv.second;
    }
  }

  // Replace invalid UTF-8 instead of throwing from a log call
  return line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace logging
}  // namespace tokenkeeper
