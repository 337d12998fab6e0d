/**
 * @file State.hpp
 * @brief Mutable record shared by the controller thread and the UI.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_ENGINE_STATE_HPP
    #define PENSTEER_ENGINE_STATE_HPP

#include <pensteer/engine/Config.hpp>
#include <pensteer/wheel/Wheel.hpp>
#include <pensteer/input/ISource.hpp>
#include <pensteer/device/IDevice.hpp>
#include <pensteer/core/Error.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace pensteer::engine {

struct State
{
    Config config;
    wheel::Wheel wheel;

    /// Last mapped sample from the source, held until a newer one arrives.
    std::optional<input::PenSample> pen;
    /// Sample set by the UI; takes precedence over @ref pen while present.
    std::optional<input::PenSample> penOverride;

    std::unique_ptr<input::ISource>  source;
    std::unique_ptr<device::IDevice> device;

    /// Most recent failure surfaced by the controller, cleared by the reader.
    std::optional<core::Error> lastError;

    /// Rebuild the source from @ref config at the start of the next tick.
    bool resetSource{true};
    /// Rebuild the device from @ref config at the start of the next tick.
    bool resetDevice{true};
};

/**
 * @class SharedState
 * @brief State guarded by a single mutex.
 *
 * The whole record is one unit: callers never hold a reference to it
 * outside access().
 */
class SharedState final : public core::NonCopyable<SharedState>
{
public:
    explicit SharedState(Config config = {})
    {
        state_.config = std::move(config);
    }

    /**
     * @brief Runs @p fn with exclusive access to the state.
     * @return Whatever @p fn returns.
     */
    template <typename F>
    decltype(auto) access(F&& fn)
    {
        std::lock_guard<std::mutex> lock{mutex_};
        return std::invoke(std::forward<F>(fn), state_);
    }

    /** @brief Publishes a new configuration and schedules both backends to be rebuilt. */
    void reconfigure(Config config)
    {
        access([&](State& s) {
            const bool sourceChanged = s.config.source() != config.source();
            const bool deviceChanged = s.config.device() != config.device();
            s.config = std::move(config);
            s.resetSource = s.resetSource || sourceChanged;
            s.resetDevice = s.resetDevice || deviceChanged;
        });
    }

    void requestSourceReset()
    {
        access([](State& s) { s.resetSource = true; });
    }

    void requestDeviceReset()
    {
        access([](State& s) { s.resetDevice = true; });
    }

    /** @brief Takes the last error out of its slot. */
    [[nodiscard]] std::optional<core::Error> takeLastError()
    {
        return access([](State& s) { return std::exchange(s.lastError, std::nullopt); });
    }

private:
    std::mutex mutex_;
    State state_;
};

} // namespace pensteer::engine

#endif // PENSTEER_ENGINE_STATE_HPP
