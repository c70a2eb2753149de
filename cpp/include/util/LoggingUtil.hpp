#pragma once

#include "util/CppUtil.hpp"

#include <spdlog/common.h>
#include <spdlog/fmt/ostr.h>  // Enables fallback to ostream <<
#include <spdlog/spdlog.h>

#include <string>

// The main logging macros are LOG_INFO(), LOG_DEBUG(), LOG_WARN(), and LOG_ERROR().
//
// These use fmt::format() to format the message. For example:
//
// LOG_INFO("Hello {}!", "world");
// LOG_DEBUG("x={} pi={}", 3, 3.14159);
//
// By default, LOG_DEBUG() statements are compiled out. In order to enable them, configure with
// -DMINIMAX_ENABLE_DEBUG_LOGGING=ON. The runtime --log-level filter applies on top of that.

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
  static constexpr const char* kLoggerName = "minimax";

  struct Params {
    std::string log_filename;
    std::string log_level = "trace";
    bool append_mode = false;
    bool omit_timestamps = false;

    auto make_options_description();
  };

  // Throws util::CleanException on an invalid --log-level.
  static void init(const Params&);

  // Accepts trace|debug|info|warn|error|off. Throws util::CleanException on anything else.
  static spdlog::level::level_enum parse_level(const std::string& level);
};  // Logging

}  // namespace util

#include "inline/util/LoggingUtil.inl"
