#pragma once

#include <functional>
#include <iostream>
#include <memory>
#include <mutex>

#include "tokenkeeper/logging/log_formatter.h"
#include "tokenkeeper/logging/log_message.h"

namespace tokenkeeper {
namespace logging {

class LogSink {
 public:
  virtual ~LogSink() = default;

  virtual void log(const LogMessage& msg) = 0;
  virtual void flush() = 0;
  virtual SinkType type() const = 0;

  virtual void setFormatter(std::unique_ptr<Formatter> formatter) {
    formatter_ = std::move(formatter);
  }

 protected:
  std::unique_ptr<Formatter> formatter_{std::make_unique<DefaultFormatter>()};
};

// Stdio sink (stdout/stderr)
class StdioSink : public LogSink {
 public:
  enum Target { Stdout, Stderr };

  explicit StdioSink(Target target = Stderr) : target_(target) {}

  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream << formatter_->format(msg) << std::endl;
  }

  void flush() override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = (target_ == Stdout) ? std::cout : std::cerr;
    stream.flush();
  }

  SinkType type() const override { return SinkType::Stdio; }

 private:
  Target target_;
  std::mutex mutex_;
};

class NullSink : public LogSink {
 public:
  void log(const LogMessage&) override {}
  void flush() override {}
  SinkType type() const override { return SinkType::Null; }
};

// Hands formatted lines to the embedding application
class ExternalSink : public LogSink {
 public:
  using LogCallback =
      std::function<void(LogLevel, const std::string&, const std::string&)>;

  explicit ExternalSink(LogCallback callback) : callback_(std::move(callback)) {}

  void log(const LogMessage& msg) override {
    if (callback_) {
      callback_(msg.level, msg.logger_name, formatter_->format(msg));
    }
  }

  void flush() override {}
  SinkType type() const override { return SinkType::External; }

 private:
  LogCallback callback_;
};

class SinkFactory {
 public:
  static std::unique_ptr<LogSink> createStdioSink(bool use_stderr = true);
  static std::unique_ptr<LogSink> createNullSink();
  static std::unique_ptr<LogSink> createExternalSink(
      ExternalSink::LogCallback callback);
};

}  // namespace logging
}  // namespace tokenkeeper
