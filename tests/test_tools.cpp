#include "log_level.hpp"

#include <catch2/catch_test_macros.hpp>

TEST_CASE("tools: RECSQL_LOG_LEVEL parsing", "[tools]") {
    SECTION("known level names") {
        REQUIRE(parse_log_level("debug") == spdlog::level::debug);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    }

    SECTION("off only when spelled out") {
        REQUIRE(parse_log_level("off") == spdlog::level::off);
        REQUIRE_FALSE(parse_log_level("debgu").has_value());
        REQUIRE_FALSE(parse_log_level("").has_value());
        REQUIRE_FALSE(parse_log_level("OFF ").has_value());
    }
}
