#pragma once

#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>
#include "util/CppUtil.hpp"

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use {}-style format strings. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_DEBUG() and LOG_TRACE() statements are compiled out. In order to enable them,
// configure with -DLOOPWALK_DEBUG_LOGGING=ON.

#define LOG_TRACE(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_TRACE(__VA_ARGS__);    \
  } while (0)

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

#define LOG_WARN(...)             \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_WARN(__VA_ARGS__);     \
  } while (0)

#define LOG_ERROR(...)            \
  do {                            \
    USE_UNEVALUATED(__VA_ARGS__); \
    SPDLOG_ERROR(__VA_ARGS__);    \
  } while (0)

namespace util {

struct Logging {
  struct Params {
    std::string log_filename;
    std::string log_level = "trace";  // spdlog level name; levels below it are dropped at runtime
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Throws util::CleanException if params.log_level is not a spdlog level name.
  static void init(const Params&);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
