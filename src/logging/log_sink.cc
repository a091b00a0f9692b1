#include "tokenkeeper/logging/log_sink.h"

namespace tokenkeeper {
namespace logging {

std::unique_ptr<LogSink> SinkFactory::createStdioSink(bool use_stderr) {
  return std::make_unique<StdioSink>(use_stderr ? StdioSink::Stderr
                                                : StdioSink::Stdout);
}

std::unique_ptr<LogSink> SinkFactory::createNullSink() {
  return std::make_unique<NullSink>();
}

std::unique_ptr<LogSink> SinkFactory::createExternalSink(
    ExternalSink::LogCallback callback) {
  return std::make_unique<ExternalSink>(std::move(callback));
}

}  // namespace logging
}  // namespace tokenkeeper
