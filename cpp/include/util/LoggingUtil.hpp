#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The logging macros are LOG_INFO() and LOG_DEBUG().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_DEBUG() statements are compiled out. In order to enable them,
// configure with -DDROPFOUR_DEBUG_LOGGING=ON, which lowers SPDLOG_ACTIVE_LEVEL.

#define LOG_DEBUG(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_DEBUG(__VA_ARGS__);    \
  } while (0)

#define LOG_INFO(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_INFO(__VA_ARGS__);     \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
