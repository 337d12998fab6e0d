/**
 * @file TestDeadlineTimer.cpp
 * @brief Unit tests for pensteer::engine::DeadlineTimer.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "pensteer/engine/DeadlineTimer.hpp"

#include <chrono>
#include <thread>

using namespace pensteer::engine;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

TEST_CASE("Deadlines advance by exactly one period", "[engine][timer]")
{
    const auto start = DeadlineTimer::Clock::now();
    DeadlineTimer timer{125, start};

    REQUIRE(timer.period() == 8ms);
    REQUIRE_THAT(timer.periodSeconds(), WithinAbs(0.008, 1e-7));
    REQUIRE(timer.deadline() == start);

    timer.advance();
    timer.advance();
    REQUIRE(timer.advance() == start + 24ms);
}

TEST_CASE("Deadlines do not drift with slow ticks", "[engine][timer]")
{
    const auto start = DeadlineTimer::Clock::now();
    DeadlineTimer timer{1000, start};

    for (int i = 0; i < 5; ++i)
    {
        std::this_thread::sleep_for(2ms);
        timer.advance();
        timer.sleep();
    }

    REQUIRE(timer.deadline() == start + 5ms);
}

TEST_CASE("Changing the frequency keeps the current deadline", "[engine][timer]")
{
    const auto start = DeadlineTimer::Clock::now();
    DeadlineTimer timer{100, start};
    timer.advance();

    REQUIRE(timer.setFrequency(50));
    REQUIRE(timer.frequency() == 50);
    REQUIRE(timer.deadline() == start + 10ms);
    REQUIRE(timer.advance() == start + 30ms);
}

TEST_CASE("A zero frequency is refused", "[engine][timer]")
{
    DeadlineTimer timer{125};
    REQUIRE_FALSE(timer.setFrequency(0));
    REQUIRE(timer.frequency() == 125);
    REQUIRE(timer.period() == 8ms);
}

TEST_CASE("sleep waits for the deadline", "[engine][timer]")
{
    DeadlineTimer timer{50};
    const auto target = timer.advance();
    timer.sleep();
    REQUIRE(DeadlineTimer::Clock::now() >= target);
}
