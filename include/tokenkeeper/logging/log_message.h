#pragma once

#include <chrono>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>

#include "tokenkeeper/logging/log_level.h"

namespace tokenkeeper {
namespace logging {

struct LogMessage {
  LogLevel level{LogLevel::Info};
  std::string message;
  std::chrono::system_clock::time_point timestamp;

  // Source location
  const char* file{nullptr};
  int line{0};
  const char* function{nullptr};

  pid_t process_id{0};
  std::thread::id thread_id;

  // Structured fields (slot name, endpoint, ...)
  std::map<std::string, std::string> key_values;

  std::string logger_name;

  LogMessage()
      : timestamp(std::chrono::system_clock::now()),
        process_id(getpid()),
        thread_id(std::this_thread::get_id()) {}
};

}  // namespace logging
}  // namespace tokenkeeper
