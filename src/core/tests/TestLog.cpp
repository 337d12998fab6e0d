/**
 * @file TestLog.cpp
 * @brief Unit tests for pensteer::core::Log and parseLogLevel.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/core/Log.hpp"

#include <string>
#include <vector>

using namespace pensteer::core;

namespace {

class RecordingLogger final : public ILogger {
public:
    struct Entry {
        LogLevel    level;
        std::string tag;
        std::string message;
    };

    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        entries.push_back({level, std::string(tag), std::string(message)});
    }

    std::vector<Entry> entries;
};

struct LoggerGuard {
    explicit LoggerGuard(ILogger &logger) { Log::setLogger(&logger); }
    ~LoggerGuard()
    {
        Log::setLogger(nullptr);
        Log::setMinLevel(LogLevel::kInfo);
    }
};

} // namespace

TEST_CASE("parseLogLevel accepts the documented names", "[core][log]")
{
    REQUIRE(parseLogLevel("debug") == LogLevel::kDebug);
    REQUIRE(parseLogLevel("info") == LogLevel::kInfo);
    REQUIRE(parseLogLevel("warn") == LogLevel::kWarn);
    REQUIRE(parseLogLevel("error") == LogLevel::kError);
    REQUIRE(parseLogLevel("fatal") == LogLevel::kFatal);
}

TEST_CASE("parseLogLevel rejects unknown names", "[core][log]")
{
    REQUIRE_FALSE(parseLogLevel("").has_value());
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
    REQUIRE_FALSE(parseLogLevel("DEBUG").has_value());
}

TEST_CASE("Log forwards tag and message to the installed sink", "[core][log]")
{
    RecordingLogger logger;
    LoggerGuard guard{logger};

    Log::warn("Wheel", "something odd");

    REQUIRE(logger.entries.size() == 1);
    REQUIRE(logger.entries[0].level == LogLevel::kWarn);
    REQUIRE(logger.entries[0].tag == "Wheel");
    REQUIRE(logger.entries[0].message == "something odd");
}

TEST_CASE("Log drops messages below the minimum level", "[core][log]")
{
    RecordingLogger logger;
    LoggerGuard guard{logger};

    Log::setMinLevel(LogLevel::kError);
    Log::info("Controller", "hidden");
    Log::warn("Controller", "hidden too");
    Log::error("Controller", "shown");

    REQUIRE(logger.entries.size() == 1);
    REQUIRE(logger.entries[0].message == "shown");
}
