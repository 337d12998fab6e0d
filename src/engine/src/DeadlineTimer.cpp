/**
 * @file DeadlineTimer.cpp
 * @brief DeadlineTimer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/engine/DeadlineTimer.hpp>
#include <pensteer/core/Assert.hpp>

#include <thread>

namespace pensteer::engine {

namespace {

DeadlineTimer::Clock::duration periodOf(core::u32 frequency) noexcept
{
    return std::chrono::duration_cast<DeadlineTimer::Clock::duration>(std::chrono::seconds{1}) / frequency;
}

} // anonymous namespace

DeadlineTimer::DeadlineTimer(core::u32 frequency, Clock::time_point start)
    : frequency_{frequency}
    , period_{periodOf(frequency)}
    , deadline_{start}
{
    PENSTEER_ASSERT(frequency > 0);
}

bool DeadlineTimer::setFrequency(core::u32 frequency) noexcept
{
    if (frequency == 0)
        return false;
    frequency_ = frequency;
    period_ = periodOf(frequency);
    return true;
}

DeadlineTimer::Clock::time_point DeadlineTimer::advance() noexcept
{
    deadline_ += period_;
    return deadline_;
}

void DeadlineTimer::sleep() const
{
    std::this_thread::sleep_until(deadline_);
}

core::f32 DeadlineTimer::periodSeconds() const noexcept
{
    return std::chrono::duration<core::f32>{period_}.count();
}

} // namespace pensteer::engine
