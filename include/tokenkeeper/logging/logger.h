#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <fmt/format.h>

#include "tokenkeeper/logging/log_level.h"
#include "tokenkeeper/logging/log_message.h"
#include "tokenkeeper/logging/log_sink.h"

namespace tokenkeeper {
namespace logging {

// Synchronous logger; formatting happens only when the level is enabled.
class Logger : public std::enable_shared_from_this<Logger> {
 public:
  explicit Logger(const std::string& name)
      : effective_level_(LogLevel::Info), name_(name) {}

  template <typename... Args>
  void debug(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Debug)) {
      logImpl(LogLevel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void info(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Info)) {
      logImpl(LogLevel::Info, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void warning(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Warning)) {
      logImpl(LogLevel::Warning, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void error(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Error)) {
      logImpl(LogLevel::Error, fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  template <typename... Args>
  void critical(const char* fmt, Args&&... args) {
    if (shouldLog(LogLevel::Critical)) {
      logImpl(LogLevel::Critical,
              fmt::format(fmt, std::forward<Args>(args)...));
    }
  }

  // Direct log with location
  template <typename... Args>
  void log(LogLevel level,
           const char* file,
           int line,
           const char* function,
           const char* fmt,
           Args&&... args) {
    if (shouldLog(level)) {
      LogMessage msg;
      msg.level = level;
      msg.message = fmt::format(fmt, std::forward<Args>(args)...);
      msg.logger_name = name_;
      msg.file = file;
      msg.line = line;
      msg.function = function;
      logMessage(msg);
    }
  }

  void setLevel(LogLevel level) {
    effective_level_.store(level, std::memory_order_relaxed);
  }

  LogLevel getLevel() const {
    return effective_level_.load(std::memory_order_relaxed);
  }

  void setSink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
  }

  std::shared_ptr<LogSink> getSink() const {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    return sink_;
  }

  bool shouldLog(LogLevel level) const {
    return level != LogLevel::Off &&
           level >= effective_level_.load(std::memory_order_relaxed);
  }

  const std::string& getName() const { return name_; }

  void flush() {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->flush();
    }
  }

  void logMessage(const LogMessage& msg) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
      sink_->log(msg);
    }
  }

 protected:
  void logImpl(LogLevel level, const std::string& msg) {
    LogMessage log_msg;
    log_msg.level = level;
    log_msg.message = msg;
    log_msg.logger_name = name_;
    logMessage(log_msg);
  }

 private:
  std::atomic<LogLevel> effective_level_;
  std::string name_;
  std::shared_ptr<LogSink> sink_;
  mutable std::mutex sink_mutex_;
};

}  // namespace logging
}  // namespace tokenkeeper
