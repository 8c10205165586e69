#include <catch2/catch_test_macros.hpp>
#include "cgraph/debug/logger.hpp"
#include <array>
using namespace cgraph::debug;

TEST_CASE("Logger - Level threshold", "[logger]") {
    const LogLevel saved = Logger::GetLevel();

    SECTION("Default threshold suppresses debug and info") {
        Logger::SetLevel(LogLevel::Warning);
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Debug));
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Info));
        REQUIRE(Logger::IsEnabled(LogLevel::Warning));
        REQUIRE(Logger::IsEnabled(LogLevel::Error));
    }
    SECTION("Off disables everything") {
        Logger::SetLevel(LogLevel::Off);
        REQUIRE_FALSE(Logger::IsEnabled(LogLevel::Error));
    }
    SECTION("Warnings are counted even when not printed") {
        Logger::SetLevel(LogLevel::Off);
        const auto before = Logger::WarningCount();
        CGRAPH_LOG_WARN("TEST", "counted {}", 1);
        REQUIRE(Logger::WarningCount() == before + 1);
    }

    Logger::SetLevel(saved);
}

TEST_CASE("Logger - Hex prefix", "[logger]") {
    const std::array<uint8_t, 6> data = {0xde, 0xad, 0xbe, 0xef, 0x01, 0x02};
    REQUIRE(ToHexPrefix(data, 4) == "deadbeef...(6 bytes)");
    REQUIRE(ToHexPrefix(std::span<const uint8_t>(data.data(), 2), 4) == "dead");
}
