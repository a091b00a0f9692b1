#include "tokenkeeper/logging/logger_registry.h"

namespace tokenkeeper {
namespace logging {

LoggerRegistry& LoggerRegistry::instance() {
  static LoggerRegistry instance;
  return instance;
}

LoggerRegistry::LoggerRegistry() : global_level_(LogLevel::Info) {
  initializeDefaults();
}

void LoggerRegistry::initializeDefaults() {
  default_sink_ = std::make_shared<StdioSink>(StdioSink::Stderr);
  default_logger_ = std::make_shared<Logger>("default");
  default_logger_->setSink(default_sink_);
  default_logger_->setLevel(global_level_);

  loggers_["default"] = default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getDefaultLogger() {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_logger_;
}

std::shared_ptr<Logger> LoggerRegistry::getOrCreateLogger(
    const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second;
  }

  auto logger = std::make_shared<Logger>(name);
  logger->setLevel(getEffectiveLevelLocked(name));
  logger->setSink(default_sink_);

  loggers_[name] = logger;
  return logger;
}

void LoggerRegistry::setGlobalLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_level_ = level;

  // Loggers pinned by a pattern keep their level
  for (auto& entry : loggers_) {
    bool has_pattern = false;
    for (const auto& pattern : patterns_) {
      if (std::regex_match(entry.first, pattern.pattern)) {
        has_pattern = true;
        break;
      }
    }
    if (!has_pattern) {
      entry.second->setLevel(level);
    }
  }
}

LogLevel LoggerRegistry::getGlobalLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return global_level_;
}

void LoggerRegistry::setPattern(const std::string& pattern, LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);

  patterns_.emplace_back(pattern, level);

  for (auto& entry : loggers_) {
    entry.second->setLevel(getEffectiveLevelLocked(entry.first));
  }
}

void LoggerRegistry::setDefaultSink(std::shared_ptr<LogSink> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  default_sink_ = std::move(sink);
  for (auto& entry : loggers_) {
    entry.second->setSink(default_sink_);
  }
}

bool LoggerRegistry::shouldLog(const std::string& name, LogLevel level) {
  if (level == LogLevel::Off) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = loggers_.find(name);
  if (it != loggers_.end()) {
    return it->second->shouldLog(level);
  }
  return level >= getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevel(const std::string& name) {
  std::lock_guard<std::mutex> lock(mutex_);
  return getEffectiveLevelLocked(name);
}

LogLevel LoggerRegistry::getEffectiveLevelLocked(
    const std::string& name) const {
  for (const auto& pattern : patterns_) {
    if (std::regex_match(name, pattern.pattern)) {
      return pattern.level;
    }
  }
  return global_level_;
}

std::vector<std::string> LoggerRegistry::getLoggerNames() const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::vector<std::string> names;
  names.reserve(loggers_.size());
  for (const auto& entry : loggers_) {
    names.push_back(entry.first);
  }
  return names;
}

void LoggerRegistry::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  loggers_.clear();
  patterns_.clear();
  global_level_ = LogLevel::Info;
  initializeDefaults();
}

}  // namespace logging
}  // namespace tokenkeeper
