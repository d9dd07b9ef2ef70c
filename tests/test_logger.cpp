#include <catch2/catch.hpp>

#include "temp_dir.hpp"
#include "core/Logger.hpp"

#include <filesystem>

using fastget::core::Logger;
using fastget::core::LogLevel;

TEST_CASE("level names parse case-insensitively with info as fallback") {
    REQUIRE(Logger::levelFromString("debug") == LogLevel::Debug);
    REQUIRE(Logger::levelFromString(" WARNING ") == LogLevel::Warn);
    REQUIRE(Logger::levelFromString("Error") == LogLevel::Error);
    REQUIRE(Logger::levelFromString("off") == LogLevel::Off);
    REQUIRE(Logger::levelFromString("verbose") == LogLevel::Info);
}

TEST_CASE("initialized logger writes a rotating log file") {
    fastget::test::TempDir tmp;
    auto& logger = Logger::instance();

    logger.initialize(LogLevel::Warn, tmp.path().string());
    REQUIRE(logger.isInitialized());
    FASTGET_LOG_WARN("logger test line {}", 42);
    logger.flush();

    REQUIRE(std::filesystem::exists(tmp.path() / "fastget.log"));
    REQUIRE(fastget::test::readFile(tmp.path() / "fastget.log").find("logger test line 42") !=
            std::string::npos);

    // Back to quiet for the remaining tests
    logger.setLevel(LogLevel::Off);
}
