/**
 * @file Controller.hpp
 * @brief Fixed-rate scheduler tying source, wheel and device together.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_ENGINE_CONTROLLER_HPP
    #define PENSTEER_ENGINE_CONTROLLER_HPP

#include <pensteer/engine/State.hpp>
#include <pensteer/engine/DeadlineTimer.hpp>
#include <pensteer/core/Expected.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <functional>
#include <memory>

namespace pensteer::engine {

/**
 * @class Controller
 * @brief Runs one tick of work per period over a SharedState.
 *
 * Every tick, under the state lock:
 *  1. rebuild the source if a reset was requested,
 *  2. rebuild the device if a reset was requested,
 *  3. poll the source and map the sample (last value held),
 *  4. advance the wheel,
 *  5. flush the device and service its force-feedback requests,
 *  6. pick up a changed update frequency.
 *
 * Failures are logged and stored in State::lastError; none of them stops
 * the loop. Sleeping happens outside the lock.
 */
class Controller final : public core::NonCopyable<Controller>
{
public:
    using SourceBuilder = std::function<core::Expected<std::unique_ptr<input::ISource>>(const input::SourceConfig&)>;
    using DeviceBuilder = std::function<core::Expected<std::unique_ptr<device::IDevice>>(const device::DeviceConfig&)>;

    /** @brief Controller building backends through the platform factories. */
    explicit Controller(SharedState& state);

    Controller(SharedState& state, SourceBuilder sourceBuilder, DeviceBuilder deviceBuilder);

    /** @brief Performs one tick of work without sleeping. */
    void tick();

    /** @brief Ticks forever at the configured frequency. */
    [[noreturn]] void run();

    [[nodiscard]] const DeadlineTimer& timer() const noexcept { return timer_; }

private:
    void rebuildSource(State& state);
    void rebuildDevice(State& state);
    [[nodiscard]] core::Expected<void> step(State& state, core::f32 dt);
    void updateFrequency(const State& state);

    SharedState& state_;
    SourceBuilder sourceBuilder_;
    DeviceBuilder deviceBuilder_;
    DeadlineTimer timer_;
    core::u32 requestedFrequency_;
};

} // namespace pensteer::engine

#endif // PENSTEER_ENGINE_CONTROLLER_HPP
