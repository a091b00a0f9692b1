#pragma once

#include <memory>
#include <mutex>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "tokenkeeper/logging/logger.h"

namespace tokenkeeper {
namespace logging {

// Glob-style pattern ("Lifecycle.*") mapped to a level
struct LogPattern {
  std::string glob;
  std::regex pattern;
  LogLevel level;

  LogPattern(const std::string& g, LogLevel lvl)
      : glob(g), pattern(globToRegex(g)), level(lvl) {}

 private:
  static std::string globToRegex(const std::string& glob) {
    std::string regex;
    for (char c : glob) {
      switch (c) {
        case '*':
          regex += ".*";
          break;
        case '?':
          regex += ".";
          break;
        case '.':
          regex += "\\.";
          break;
        default:
          regex += c;
          break;
      }
    }
    return regex;
  }
};

class LoggerRegistry {
 public:
  // Process-wide registry, usable without any setup
  static LoggerRegistry& instance();

  std::shared_ptr<Logger> getOrCreateLogger(const std::string& name);

  std::shared_ptr<Logger> getDefaultLogger();

  // Applies to every logger not matched by a pattern
  void setGlobalLevel(LogLevel level);
  LogLevel getGlobalLevel() const;

  // Patterns are checked in registration order, first match wins
  void setPattern(const std::string& pattern, LogLevel level);

  // Replaces the sink of every registered logger and of future ones
  void setDefaultSink(std::shared_ptr<LogSink> sink);

  bool shouldLog(const std::string& logger_name, LogLevel level);

  LogLevel getEffectiveLevel(const std::string& name);

  std::vector<std::string> getLoggerNames() const;

  // Drops patterns, loggers and sinks back to the defaults
  void reset();

 private:
  LoggerRegistry();

  void initializeDefaults();

  LogLevel getEffectiveLevelLocked(const std::string& name) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Logger>> loggers_;
  std::vector<LogPattern> patterns_;

  LogLevel global_level_{LogLevel::Info};
  std::shared_ptr<Logger> default_logger_;
  std::shared_ptr<LogSink> default_sink_;
};

}  // namespace logging
}  // namespace tokenkeeper
