/**
 * @file Wheel.hpp
 * @brief Steering wheel simulation driven by an absolute pen.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_WHEEL_WHEEL_HPP
    #define PENSTEER_WHEEL_WHEEL_HPP

#include <pensteer/wheel/PhysicalConfig.hpp>
#include <pensteer/input/PenSample.hpp>
#include <pensteer/device/IDevice.hpp>
#include <pensteer/math/Vec2.hpp>

#include <optional>

namespace pensteer::wheel {

/** @brief Everything the simulation carries from one tick to the next. */
struct WheelState
{
    /// Radians, within +/- PhysicalConfig::halfRange().
    core::f32  angle{0.0f};
    /// Radians per second.
    core::f32  velocity{0.0f};
    /// Torque applied by the last feedback reading (N m).
    core::f32  feedbackTorque{0.0f};
    bool       honking{false};
    bool       dragging{false};
    math::Vec2 prevPos{};
    /// Angle at the start of the last drag step.
    core::f32  prevAngle{0.0f};
};

/**
 * @class Wheel
 * @brief Pen-to-wheel state machine with free-spin physics.
 *
 * Touching close to the centre presses the horn until the pen lifts;
 * touching elsewhere grabs the rim and turns the wheel by the pen's polar
 * angle. While not grabbed the wheel spins freely under inertia, friction,
 * the centring spring and the device's force feedback.
 */
class Wheel
{
public:
    /**
     * @brief Advances the simulation by one tick.
     * @param device Output device (may be null). Feedback is read from it
     *               and the new angle and horn state are staged on it.
     * @param config Physical parameters for this tick.
     * @param pen    Pen in wheel space; std::nullopt counts as lifted.
     * @param dt     Tick duration in seconds, strictly positive.
     */
    void update(device::IDevice* device,
                const PhysicalConfig& config,
                const std::optional<input::PenSample>& pen,
                core::f32 dt);

    [[nodiscard]] const WheelState& state() const noexcept { return _state; }

    /** @brief Mutable access, for the UI moving the wheel by hand. */
    [[nodiscard]] WheelState& state() noexcept { return _state; }

private:
    void freeSpin(device::IDevice* device, const PhysicalConfig& config, core::f32 dt);
    void drag(device::IDevice* device, const PhysicalConfig& config, math::Vec2 pos, core::f32 dt);

    WheelState _state;
};

} // namespace pensteer::wheel

#endif // PENSTEER_WHEEL_WHEEL_HPP
