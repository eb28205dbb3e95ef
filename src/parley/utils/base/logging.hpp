#pragma once

#include "spdlog/spdlog.h"

#include <exception>
#include <optional>
#include <string_view>
#include <utility>

/**
 * @defgroup logging Logging
 * @ingroup parley-utils
 *
 * @see https://github.com/gabime/spdlog
 *
 * One process wide `spdlog` logger named "parley", writing to stdout in color.
 * It is created on first use by `debug_logger()`. Debug builds start at `trace`
 * and release builds at `warn`. The `PARLEY_LOG_LEVEL` environment variable
 * (trace, debug, info, warn, err, critical, off) overrides that at startup, and
 * `set_level()` overrides it at runtime.
 *
 * Code does not call into this header directly: use the `TRACE`, `LOG_DEBUG`,
 * `INFO`, `WARN`, `LOG_ERR` and `FATAL` macros from `base-include.hpp`.
 */

namespace parley::logging
{
using logger_type = spdlog::logger;

logger_type& debug_logger();

enum class LogLevel : int { TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF };

constexpr spdlog::level::level_enum to_spdlog(LogLevel level) noexcept
{
   switch(level) {
   case LogLevel::TRACE: return spdlog::level::trace;
   case LogLevel::DEBUG: return spdlog::level::debug;
   case LogLevel::INFO: return spdlog::level::info;
   case LogLevel::WARN: return spdlog::level::warn;
   case LogLevel::ERROR: return spdlog::level::err;
   case LogLevel::FATAL: return spdlog::level::critical;
   case LogLevel::OFF: return spdlog::level::off;
   }
   return spdlog::level::off;
}

/// Accepts spdlog's level names, and "warning", "error" and "fatal"
std::optional<LogLevel> parse_level(std::string_view name) noexcept;

void set_level(LogLevel level);
LogLevel current_level();

namespace detail
{
   template<std::size_t N> struct static_string
   {
      char str[N]{};
      constexpr static_string(const char (&s)[N])
      {
         for(std::size_t i = 0; i < N; ++i) str[i] = s[i];
      }
   };

   template<static_string s> struct format_string
   {
      static constexpr const char* string = s.str;
   };

   /// Carries a literal format string through to spdlog as a compile time constant
   template<static_string s> constexpr auto operator""_cfmt() { return format_string<s>{}; }
} // namespace detail

/// FATAL logs, then terminates
template<LogLevel level, typename F, typename... Args> inline void log_at(F, Args&&... args)
{
   static_assert(level != LogLevel::OFF);
   auto& logger = debug_logger();
   logger.log(to_spdlog(level), F::string, std::forward<Args>(args)...);
   if constexpr(level == LogLevel::FATAL) {
      logger.flush();
      std::terminate();
   }
}

} // namespace parley::logging
