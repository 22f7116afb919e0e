#include "ctlapi/log.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace ctlapi;

TEST_CASE("Logger - parse_level", "[log]") {
  REQUIRE(Logger::parse_level("debug") == Logger::Level::kDebug);
  REQUIRE(Logger::parse_level("info") == Logger::Level::kInfo);
  REQUIRE(Logger::parse_level("warn") == Logger::Level::kWarn);
  REQUIRE(Logger::parse_level("warning") == Logger::Level::kWarn);
  REQUIRE(Logger::parse_level("error") == Logger::Level::kError);
  REQUIRE(Logger::parse_level("verbose") == Logger::Level::kInfo);
}

TEST_CASE("Logger - threshold filters lower levels", "[log]") {
  Logger::Level saved = Logger::level();

  Logger::set_level(Logger::Level::kWarn);
  REQUIRE(!Logger::enabled(Logger::Level::kDebug));
  REQUIRE(!Logger::enabled(Logger::Level::kInfo));
  REQUIRE(Logger::enabled(Logger::Level::kWarn));
  REQUIRE(Logger::enabled(Logger::Level::kError));

  Logger::set_level(Logger::Level::kDebug);
  REQUIRE(Logger::enabled(Logger::Level::kDebug));
  CTLAPI_LOG_DEBUG("webhooks: debug output enabled");

  Logger::set_level(saved);
}
