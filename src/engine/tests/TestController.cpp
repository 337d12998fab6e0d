/**
 * @file TestController.cpp
 * @brief Unit tests for pensteer::engine::Controller with scripted backends.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "pensteer/engine/Controller.hpp"
#include "pensteer/device/DeviceFactory.hpp"

#include <deque>
#include <memory>

using namespace pensteer;
using namespace pensteer::engine;
using Catch::Matchers::WithinAbs;

namespace {

struct SourceScript {
    std::deque<core::Expected<std::optional<input::PenSample>>> polls;
    int  builds{0};
    bool failBuild{false};
};

class ScriptedSource final : public input::ISource {
public:
    explicit ScriptedSource(std::shared_ptr<SourceScript> script) : _script{std::move(script)} {}

    core::Expected<std::optional<input::PenSample>> poll() override
    {
        if (_script->polls.empty())
            return std::optional<input::PenSample>{};
        auto next = std::move(_script->polls.front());
        _script->polls.pop_front();
        return next;
    }

    const char* name() const noexcept override { return "ScriptedSource"; }

private:
    std::shared_ptr<SourceScript> _script;
};

struct DeviceScript {
    int   builds{0};
    int   alive{0};
    int   aliveAtBuild{0};
    int   applies{0};
    int   handled{0};
    bool  failBuild{false};
    bool  failApply{false};
    std::optional<float> lastWheel;
    std::optional<bool>  lastHorn;
};

class ScriptedDevice final : public device::IDevice {
public:
    explicit ScriptedDevice(std::shared_ptr<DeviceScript> script) : _script{std::move(script)}
    {
        ++_script->alive;
    }
    ~ScriptedDevice() override { --_script->alive; }

    std::optional<float> feedback() const override { return 0.0f; }
    void setWheel(float normalizedAngle) override { _script->lastWheel = normalizedAngle; }
    void setHorn(bool pressed) override { _script->lastHorn = pressed; }

    core::Expected<void> apply() override
    {
        ++_script->applies;
        if (_script->failApply)
            return core::makeError(core::ErrorCode::kDeviceWriteFailed, "could not write events: EIO");
        return {};
    }

    core::Expected<void> handleEvents() override
    {
        ++_script->handled;
        return {};
    }

    const char* name() const noexcept override { return "ScriptedDevice"; }

private:
    std::shared_ptr<DeviceScript> _script;
};

struct Rig {
    std::shared_ptr<SourceScript> source = std::make_shared<SourceScript>();
    std::shared_ptr<DeviceScript> device = std::make_shared<DeviceScript>();
    SharedState state;
    Controller controller;

    explicit Rig(Config config = Config::Builder{}.build())
        : state{std::move(config)}
        , controller{state, sourceBuilder(source), deviceBuilder(device)}
    {}

    static Controller::SourceBuilder sourceBuilder(std::shared_ptr<SourceScript> script)
    {
        return [script](const input::SourceConfig&) -> core::Expected<std::unique_ptr<input::ISource>> {
            ++script->builds;
            if (script->failBuild)
                return core::makeError(core::ErrorCode::kDeviceNotFound, "no tablet found");
            return std::make_unique<ScriptedSource>(script);
        };
    }

    static Controller::DeviceBuilder deviceBuilder(std::shared_ptr<DeviceScript> script)
    {
        return [script](const device::DeviceConfig&) -> core::Expected<std::unique_ptr<device::IDevice>> {
            ++script->builds;
            script->aliveAtBuild = script->alive;
            if (script->failBuild)
                return core::makeError(core::ErrorCode::kPermissionDenied, "/dev/uinput: EACCES");
            return std::make_unique<ScriptedDevice>(script);
        };
    }

    template <typename F>
    decltype(auto) with(F&& fn) { return state.access(std::forward<F>(fn)); }
};

input::PenSample touch(float x, float y)
{
    return input::PenSample{x, y, 500, 0};
}

} // namespace

TEST_CASE("First tick builds both backends once", "[engine][controller]")
{
    Rig rig;
    rig.controller.tick();
    rig.controller.tick();

    REQUIRE(rig.source->builds == 1);
    REQUIRE(rig.device->builds == 1);
    rig.with([](State& s) {
        REQUIRE(s.source != nullptr);
        REQUIRE(s.device != nullptr);
        REQUIRE_FALSE(s.resetSource);
        REQUIRE_FALSE(s.resetDevice);
        REQUIRE_FALSE(s.lastError.has_value());
    });
}

TEST_CASE("Every tick flushes the device then services its events", "[engine][controller]")
{
    Rig rig;
    for (int i = 0; i < 3; ++i)
        rig.controller.tick();

    REQUIRE(rig.device->applies == 3);
    REQUIRE(rig.device->handled == 3);
    REQUIRE(rig.device->lastWheel == 0.0f);
}

TEST_CASE("Samples are mapped and held until a newer one arrives", "[engine][controller]")
{
    input::Mapping mapping;
    mapping.orientation = input::MapOrientation::k180;
    Rig rig{Config::Builder{}.mapping(mapping).build()};

    rig.source->polls.push_back(std::optional<input::PenSample>{touch(0.5f, 0.25f)});
    rig.controller.tick();
    rig.controller.tick();
    rig.controller.tick();

    rig.with([](State& s) {
        REQUIRE(s.pen.has_value());
        REQUIRE_THAT(s.pen->x, WithinAbs(-0.5, 1e-6));
        REQUIRE_THAT(s.pen->y, WithinAbs(-0.25, 1e-6));
        REQUIRE(s.pen->pressure == 500);
        REQUIRE(s.wheel.state().dragging);
    });
}

TEST_CASE("Source construction failure leaves it absent until reset", "[engine][controller]")
{
    Rig rig;
    rig.source->failBuild = true;

    rig.controller.tick();
    rig.controller.tick();
    REQUIRE(rig.source->builds == 1);

    auto error = rig.state.takeLastError();
    REQUIRE(error.has_value());
    REQUIRE(error->code() == core::ErrorCode::kDeviceNotFound);
    REQUIRE_FALSE(rig.state.takeLastError().has_value());

    rig.with([](State& s) {
        REQUIRE(s.source == nullptr);
        REQUIRE_FALSE(s.resetSource);
        REQUIRE(s.device != nullptr);
    });

    rig.source->failBuild = false;
    rig.state.requestSourceReset();
    rig.controller.tick();
    REQUIRE(rig.source->builds == 2);
    rig.with([](State& s) { REQUIRE(s.source != nullptr); });
}

TEST_CASE("Device replacement destroys the old device first", "[engine][controller]")
{
    Rig rig;
    rig.controller.tick();
    REQUIRE(rig.device->alive == 1);

    rig.state.requestDeviceReset();
    rig.controller.tick();

    REQUIRE(rig.device->builds == 2);
    REQUIRE(rig.device->aliveAtBuild == 0);
    REQUIRE(rig.device->alive == 1);
}

TEST_CASE("Device construction failure keeps the wheel running", "[engine][controller]")
{
    Rig rig;
    rig.device->failBuild = true;
    rig.source->polls.push_back(std::optional<input::PenSample>{touch(0.0f, 0.0f)});

    rig.controller.tick();

    rig.with([](State& s) {
        REQUIRE(s.device == nullptr);
        REQUIRE(s.lastError.has_value());
        REQUIRE(s.lastError->code() == core::ErrorCode::kPermissionDenied);
        REQUIRE(s.wheel.state().honking);
    });
}

TEST_CASE("An out-of-range resolution leaves the device absent", "[engine][controller]")
{
    auto script = std::make_shared<SourceScript>();
    SharedState state{Config::Builder{}
        .device(device::DeviceKind::kUInput)
        .deviceResolution(70000)
        .build()};
    Controller controller{state, Rig::sourceBuilder(script), &device::DeviceFactory::create};

    controller.tick();

    state.access([](State& s) {
        REQUIRE(s.device == nullptr);
        REQUIRE(s.lastError.has_value());
    });
}

TEST_CASE("A failed write aborts the tick but not the loop", "[engine][controller]")
{
    Rig rig;
    rig.device->failApply = true;
    rig.controller.tick();

    REQUIRE(rig.device->applies == 1);
    REQUIRE(rig.device->handled == 0);
    REQUIRE(rig.state.takeLastError().has_value());

    rig.device->failApply = false;
    rig.controller.tick();
    REQUIRE(rig.device->applies == 2);
    REQUIRE(rig.device->handled == 1);
    REQUIRE_FALSE(rig.state.takeLastError().has_value());
}

TEST_CASE("A poll error is surfaced and the previous sample kept", "[engine][controller]")
{
    Rig rig;
    rig.source->polls.push_back(std::optional<input::PenSample>{touch(0.2f, 0.9f)});
    rig.source->polls.push_back(core::makeError(core::ErrorCode::kDeviceReadFailed, "ENODEV"));

    rig.controller.tick();
    rig.controller.tick();

    auto error = rig.state.takeLastError();
    REQUIRE(error.has_value());
    REQUIRE(error->code() == core::ErrorCode::kDeviceReadFailed);
    rig.with([](State& s) {
        REQUIRE(s.pen.has_value());
        REQUIRE_THAT(s.pen->y, WithinAbs(0.9, 1e-6));
    });
}

TEST_CASE("The pen override wins over the source", "[engine][controller]")
{
    Rig rig;
    rig.source->polls.push_back(std::optional<input::PenSample>{touch(0.0f, 0.9f)});
    rig.with([](State& s) { s.penOverride = touch(0.0f, 0.0f); });

    rig.controller.tick();

    rig.with([](State& s) {
        REQUIRE(s.wheel.state().honking);
        REQUIRE_FALSE(s.wheel.state().dragging);
    });
    REQUIRE(rig.device->lastHorn == true);
}

TEST_CASE("A frequency change keeps the wheel state", "[engine][controller]")
{
    Rig rig;
    rig.with([](State& s) { s.wheel.state().angle = 0.5f; });
    rig.controller.tick();
    REQUIRE(rig.controller.timer().frequency() == 125);

    const Config faster = rig.with([](State& s) { return s.config; }).toBuilder().updateFrequency(250).build();
    rig.state.reconfigure(faster);
    rig.controller.tick();

    REQUIRE(rig.controller.timer().frequency() == 250);
    rig.with([](State& s) { REQUIRE_THAT(s.wheel.state().angle, WithinAbs(0.5, 1e-4)); });
    REQUIRE(rig.source->builds == 1);
    REQUIRE(rig.device->builds == 1);

    rig.state.reconfigure(faster.toBuilder().updateFrequency(0).build());
    rig.controller.tick();
    REQUIRE(rig.controller.timer().frequency() == 250);
}

TEST_CASE("Reconfiguring a backend schedules only that backend", "[engine][controller]")
{
    Rig rig;
    rig.controller.tick();

    const Config current = rig.with([](State& s) { return s.config; });
    rig.state.reconfigure(current.toBuilder().netAddress("127.0.0.1:4000").build());
    rig.controller.tick();

    REQUIRE(rig.source->builds == 2);
    REQUIRE(rig.device->builds == 1);
}
