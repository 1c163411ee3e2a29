#pragma once

#include "conduit/logging/logger_registry.h"

// Define CONDUIT_LOG_COMPONENT (e.g. "http.client") before including
#ifndef CONDUIT_LOG_COMPONENT
#define CONDUIT_LOG_COMPONENT "default"
#endif

#ifdef CONDUIT_LOG_DISABLE
#define CONDUIT_LOG(level, ...) ((void)0)
#else
#define CONDUIT_LOG(level, ...)                                            \
  do {                                                                     \
    if (::conduit::logging::LoggerRegistry::instance().shouldLog(          \
            CONDUIT_LOG_COMPONENT, ::conduit::logging::LogLevel::level)) { \
      ::conduit::logging::LoggerRegistry::instance()                       \
          .getOrCreateLogger(CONDUIT_LOG_COMPONENT)                        \
          ->log(::conduit::logging::LogLevel::level, __FILE__, __LINE__,   \
                __FUNCTION__, __VA_ARGS__);                                \
    }                                                                      \
  } while (0)
#endif

#define CONDUIT_LOG_DEBUG(...) CONDUIT_LOG(Debug, __VA_ARGS__)
#define CONDUIT_LOG_INFO(...) CONDUIT_LOG(Info, __VA_ARGS__)
#define CONDUIT_LOG_WARNING(...) CONDUIT_LOG(Warning, __VA_ARGS__)
#define CONDUIT_LOG_ERROR(...) CONDUIT_LOG(Error, __VA_ARGS__)
