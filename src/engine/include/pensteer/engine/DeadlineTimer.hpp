/**
 * @file DeadlineTimer.hpp
 * @brief Fixed-rate absolute deadline scheduling.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_ENGINE_DEADLINETIMER_HPP
    #define PENSTEER_ENGINE_DEADLINETIMER_HPP

#include <pensteer/core/Types.hpp>

#include <chrono>

namespace pensteer::engine {

/**
 * @class DeadlineTimer
 * @brief Produces deadlines spaced exactly one period apart.
 *
 * Each deadline is the previous one plus the period, never "now" plus the
 * period, so tick jitter does not accumulate. A loop that falls behind
 * fires back-to-back until it has caught up.
 */
class DeadlineTimer
{
public:
    using Clock = std::chrono::steady_clock;

    explicit DeadlineTimer(core::u32 frequency, Clock::time_point start = Clock::now());

    /**
     * @brief Changes the period used from the next advance() on.
     * @return false (and no change) when @p frequency is 0.
     */
    bool setFrequency(core::u32 frequency) noexcept;

    /** @brief Moves the deadline forward by one period and returns it. */
    Clock::time_point advance() noexcept;

    /** @brief Blocks until the current deadline. */
    void sleep() const;

    [[nodiscard]] core::u32 frequency() const noexcept { return frequency_; }
    [[nodiscard]] Clock::duration period() const noexcept { return period_; }
    [[nodiscard]] Clock::time_point deadline() const noexcept { return deadline_; }

    /** @brief Period in seconds, the simulation time step. */
    [[nodiscard]] core::f32 periodSeconds() const noexcept;

private:
    core::u32 frequency_;
    Clock::duration period_;
    Clock::time_point deadline_;
};

} // namespace pensteer::engine

#endif // PENSTEER_ENGINE_DEADLINETIMER_HPP
