#include "stdinc.hpp"

#include <catch2/catch.hpp>

namespace parley::tests {

using logging::LogLevel;

CATCH_TEST_CASE("logging-levels", "[logging]") {
  CATCH_SECTION("parse-level") {
    CATCH_REQUIRE(logging::parse_level("trace") == LogLevel::TRACE);
    CATCH_REQUIRE(logging::parse_level("warn") == LogLevel::WARN);
    CATCH_REQUIRE(logging::parse_level("warning") == LogLevel::WARN);
    CATCH_REQUIRE(logging::parse_level("err") == LogLevel::ERROR);
    CATCH_REQUIRE(logging::parse_level("fatal") == LogLevel::FATAL);
    CATCH_REQUIRE(logging::parse_level("off") == LogLevel::OFF);
    CATCH_REQUIRE(!logging::parse_level("loud").has_value());
    CATCH_REQUIRE(!logging::parse_level("").has_value());
  }

  CATCH_SECTION("set-level") {
    const auto before = logging::current_level();
    logging::set_level(LogLevel::INFO);
    CATCH_REQUIRE(logging::current_level() == LogLevel::INFO);
    CATCH_REQUIRE(logging::debug_logger().should_log(spdlog::level::warn));
    CATCH_REQUIRE(!logging::debug_logger().should_log(spdlog::level::debug));
    INFO("logging at level {}", "info");
    logging::set_level(before);
    CATCH_REQUIRE(logging::current_level() == before);
  }
}

} // namespace parley::tests
