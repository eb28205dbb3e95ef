#include "logging.hpp"

#include "spdlog/sinks/stdout_color_sinks.h"

#include <cassert>
#include <cstdlib>
#include <mutex>

namespace parley::logging {
/// @private
static std::shared_ptr<spdlog::logger> instance;

/// @private
static std::once_flag flag;

/// @private
static void apply_environment_level(spdlog::logger& logger) {
  const char* env_variable = "PARLEY_LOG_LEVEL";
  const char* log_level = std::getenv(env_variable);
  if (log_level == nullptr)
    return;
  if (const auto level = parse_level(log_level); level.has_value())
    logger.set_level(to_spdlog(*level));
  else
    logger.error("failed to set log level from environment variable {}={}", env_variable,
                 log_level);
}

/**
 * @ingroup logging
 * @brief lazily initializes and returns the logger instance.
 */
spdlog::logger& debug_logger() {
  std::call_once(flag, []() {
    instance = spdlog::stdout_color_mt("parley");
    instance->set_pattern("[%Y-%m-%d %T.%e] [%^%l%$] [%t] %v");

#ifdef DEBUG_BUILD
    instance->set_level(spdlog::level::trace);
#else
    instance->set_level(spdlog::level::warn);
#endif
    apply_environment_level(*instance);
  });

  assert(instance);
  return *instance;
}

std::optional<LogLevel> parse_level(std::string_view name) noexcept {
  if (name == "trace")
    return LogLevel::TRACE;
  if (name == "debug")
    return LogLevel::DEBUG;
  if (name == "info")
    return LogLevel::INFO;
  if (name == "warn" || name == "warning")
    return LogLevel::WARN;
  if (name == "err" || name == "error")
    return LogLevel::ERROR;
  if (name == "critical" || name == "fatal")
    return LogLevel::FATAL;
  if (name == "off")
    return LogLevel::OFF;
  return std::nullopt;
}

void set_level(LogLevel level) { debug_logger().set_level(to_spdlog(level)); }

LogLevel current_level() {
  switch (debug_logger().level()) {
  case spdlog::level::trace: return LogLevel::TRACE;
  case spdlog::level::debug: return LogLevel::DEBUG;
  case spdlog::level::info: return LogLevel::INFO;
  case spdlog::level::warn: return LogLevel::WARN;
  case spdlog::level::err: return LogLevel::ERROR;
  case spdlog::level::critical: return LogLevel::FATAL;
  default: return LogLevel::OFF;
  }
}

} // namespace parley::logging
