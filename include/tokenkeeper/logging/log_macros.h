#pragma once

#include "tokenkeeper/logging/logger_registry.h"

// Each translation unit names its logger before including this header:
//   #define TOKENKEEPER_LOG_COMPONENT "Lifecycle.manager"
#ifndef TOKENKEEPER_LOG_COMPONENT
#define TOKENKEEPER_LOG_COMPONENT "default"
#endif

#ifdef TOKENKEEPER_LOG_DISABLE
#define TOKENKEEPER_LOG(level, ...) ((void)0)
#else
#define TOKENKEEPER_LOG(level, ...)                                       \
  do {                                                                    \
    auto tokenkeeper_logger_ =                                            \
        ::tokenkeeper::logging::LoggerRegistry::instance()                \
            .getOrCreateLogger(TOKENKEEPER_LOG_COMPONENT);                \
    if (tokenkeeper_logger_->shouldLog(                                   \
            ::tokenkeeper::logging::LogLevel::level)) {                   \
      tokenkeeper_logger_->log(::tokenkeeper::logging::LogLevel::level,   \
                               __FILE__, __LINE__, __FUNCTION__,          \
                               __VA_ARGS__);                              \
    }                                                                     \
  } while (0)
#endif

#define TOKENKEEPER_LOG_DEBUG(...) TOKENKEEPER_LOG(Debug, __VA_ARGS__)
#define TOKENKEEPER_LOG_INFO(...) TOKENKEEPER_LOG(Info, __VA_ARGS__)
#define TOKENKEEPER_LOG_WARNING(...) TOKENKEEPER_LOG(Warning, __VA_ARGS__)
#define TOKENKEEPER_LOG_ERROR(...) TOKENKEEPER_LOG(Error, __VA_ARGS__)
