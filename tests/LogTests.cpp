#include <catch2/catch_test_macros.hpp>
#include "Log.hpp"

using sealbox::Log;
using sealbox::LogLevel;

TEST_CASE("Log level names parse case-insensitively", "[log]") {
    REQUIRE(Log::parseLevel("debug") == LogLevel::Debug);
    REQUIRE(Log::parseLevel("INFO") == LogLevel::Info);
    REQUIRE(Log::parseLevel("Warn") == LogLevel::Warn);
    REQUIRE(Log::parseLevel("warning") == LogLevel::Warn);
    REQUIRE(Log::parseLevel("off") == LogLevel::Off);
    REQUIRE(Log::parseLevel("none") == LogLevel::Off);
    REQUIRE_FALSE(Log::parseLevel("verbose").has_value());
    REQUIRE_FALSE(Log::parseLevel("").has_value());
}

TEST_CASE("Log level can be changed at runtime", "[log]") {
    const LogLevel original = Log::getLevel();

    Log::setLevel(LogLevel::Debug);
    REQUIRE(Log::getLevel() == LogLevel::Debug);
    Log::debug("debug output enabled");

    Log::setLevel(LogLevel::Off);
    REQUIRE(Log::getLevel() == LogLevel::Off);
    Log::warn("suppressed");

    Log::setLevel(original);
}
