/**
 * @file Controller.cpp
 * @brief Controller implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/engine/Controller.hpp>
#include <pensteer/input/SourceFactory.hpp>
#include <pensteer/device/DeviceFactory.hpp>
#include <pensteer/core/Constants.hpp>
#include <pensteer/core/Log.hpp>

#include <string>
#include <utility>

namespace pensteer::engine {

namespace {

constexpr const char* kTag = "Controller";

core::u32 initialFrequency(SharedState& state)
{
    const core::u32 hz = state.access([](const State& s) { return s.config.physical().updateFrequency; });
    if (hz > 0)
        return hz;
    core::Log::warn(kTag, "update frequency 0 is invalid, using " +
                          std::to_string(core::kDefaultUpdateFrequency) + " Hz");
    return core::kDefaultUpdateFrequency;
}

void surface(State& state, core::Error error)
{
    core::Log::error(kTag, error.message());
    state.lastError = std::move(error);
}

} // anonymous namespace

Controller::Controller(SharedState& state)
    : Controller{state, &input::SourceFactory::create, &device::DeviceFactory::create}
{
}

Controller::Controller(SharedState& state, SourceBuilder sourceBuilder, DeviceBuilder deviceBuilder)
    : state_{state}
    , sourceBuilder_{std::move(sourceBuilder)}
    , deviceBuilder_{std::move(deviceBuilder)}
    , timer_{initialFrequency(state)}
    , requestedFrequency_{timer_.frequency()}
{
}

void Controller::tick()
{
    state_.access([this](State& s) {
        if (s.resetSource)
            rebuildSource(s);
        if (s.resetDevice)
            rebuildDevice(s);

        if (auto result = step(s, timer_.periodSeconds()); !result)
            surface(s, std::move(result.error()));

        updateFrequency(s);
    });
}

void Controller::run()
{
    core::Log::info(kTag, "running at " + std::to_string(timer_.frequency()) + " Hz");

    for (;;)
    {
        tick();
        timer_.advance();
        timer_.sleep();
    }
}

void Controller::rebuildSource(State& state)
{
    state.resetSource = false;
    state.source.reset();

    auto source = sourceBuilder_(state.config.source());
    if (!source)
    {
        surface(state, source.error().withContext("could not create source"));
        return;
    }

    state.source = std::move(*source);
    core::Log::info(kTag, std::string("source ready: ") + state.source->name());
}

void Controller::rebuildDevice(State& state)
{
    state.resetDevice = false;
    // The old virtual device must be gone before the new one registers.
    state.device.reset();

    auto device = deviceBuilder_(state.config.device());
    if (!device)
    {
        surface(state, device.error().withContext("could not create device"));
        return;
    }

    state.device = std::move(*device);
    core::Log::info(kTag, std::string("device ready: ") + state.device->name());
}

core::Expected<void> Controller::step(State& state, core::f32 dt)
{
    if (state.source)
    {
        auto sample = state.source->poll();
        if (!sample)
            return core::Unexpected{sample.error().withContext("could not poll source")};
        if (sample->has_value())
            state.pen = state.config.mapping().apply(**sample);
    }

    const auto& pen = state.penOverride ? state.penOverride : state.pen;
    state.wheel.update(state.device.get(), state.config.physical(), pen, dt);

    if (state.device)
    {
        PENSTEER_TRY_VOID(state.device->apply());
        PENSTEER_TRY_VOID(state.device->handleEvents());
    }
    return {};
}

void Controller::updateFrequency(const State& state)
{
    const core::u32 hz = state.config.physical().updateFrequency;
    if (hz == requestedFrequency_)
        return;
    requestedFrequency_ = hz;

    if (!timer_.setFrequency(hz))
    {
        core::Log::warn(kTag, "update frequency 0 is invalid, keeping " +
                              std::to_string(timer_.frequency()) + " Hz");
        return;
    }
    core::Log::info(kTag, "update frequency set to " + std::to_string(hz) + " Hz");
}

} // namespace pensteer::engine
