/**
 * @file Wheel.cpp
 * @brief Wheel state machine and physics.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/wheel/Wheel.hpp>
#include <pensteer/math/Angle.hpp>
#include <pensteer/core/Assert.hpp>
#include <pensteer/core/Log.hpp>

#include <cmath>

namespace pensteer::wheel {

namespace {

core::f32 finiteOrZero(core::f32 v) noexcept
{
    return std::isfinite(v) ? v : 0.0f;
}

/// Angle as a fraction of the half range; a range of zero or less pins it at 0.
core::f32 normalizedAngle(core::f32 angle, core::f32 halfRange) noexcept
{
    return halfRange > 0.0f ? angle / halfRange : 0.0f;
}

} // anonymous namespace

void Wheel::update(device::IDevice* device,
                   const PhysicalConfig& config,
                   const std::optional<input::PenSample>& pen,
                   core::f32 dt)
{
    PENSTEER_ASSERT(dt > 0.0f);

    const bool touching = pen.has_value() && pen->pressure > config.pressureThreshold;
    bool grabbing = false;
    math::Vec2 pos{};

    if (!touching)
    {
        if (_state.honking)
        {
            if (device)
                device->setHorn(false);
            core::Log::debug("Wheel", "horn released");
        }
        _state.honking  = false;
        _state.dragging = false;
    }
    else if (!_state.honking)
    {
        pos = math::Vec2{pen->x, pen->y};
        const core::f32 centreDist = math::length(pos.x, pos.y);

        if (!_state.dragging && centreDist <= config.hornRadius)
        {
            _state.honking = true;
            if (device)
                device->setHorn(true);
            core::Log::debug("Wheel", "horn pressed");
        }
        else
        {
            grabbing = true;
        }
    }

    // The first grabbing tick has no previous position to measure from, so
    // the wheel keeps spinning freely until the next one.
    if (grabbing && _state.dragging)
        drag(device, config, pos, dt);
    else
        freeSpin(device, config, dt);

    if (grabbing)
    {
        _state.prevPos  = pos;
        _state.dragging = true;
    }
}

void Wheel::freeSpin(device::IDevice* device, const PhysicalConfig& config, core::f32 dt)
{
    _state.velocity = finiteOrZero(_state.velocity);
    _state.angle    = finiteOrZero(_state.angle);

    const core::f32 feedback = device ? device->feedback().value_or(0.0f) : 0.0f;
    _state.feedbackTorque = feedback * config.maxTorque;

    const core::f32 netTorque = _state.feedbackTorque
                              - config.friction * _state.velocity
                              - config.spring * _state.angle;
    const core::f32 angularAccel = netTorque / config.inertia;

    _state.velocity += angularAccel * dt;
    if (std::fabs(_state.velocity) < core::kVelocityEpsilon)
        _state.velocity = 0.0f;

    const core::f32 halfRange = config.halfRange();
    const core::f32 unclamped = finiteOrZero(_state.angle + _state.velocity * dt);
    _state.angle = math::clampSymmetric(halfRange, unclamped);
    if (_state.angle != unclamped)
        _state.velocity = 0.0f;

    if (device)
        device->setWheel(normalizedAngle(_state.angle, halfRange));
}

void Wheel::drag(device::IDevice* device, const PhysicalConfig& config, math::Vec2 pos, core::f32 dt)
{
    // Clock-face convention: 0 at twelve o'clock, positive clockwise.
    const core::f32 prevTheta = std::atan2(_state.prevPos.x, _state.prevPos.y);
    const core::f32 theta     = std::atan2(pos.x, pos.y);

    const core::f32 centreDist = math::length(pos.x, pos.y);
    const core::f32 delta = math::dampAngleDelta(math::angleDelta(prevTheta, theta),
                                                 centreDist, config.baseRadius);

    const core::f32 halfRange = config.halfRange();
    _state.prevAngle = _state.angle;
    _state.angle     = math::clampSymmetric(halfRange, finiteOrZero(_state.angle + delta));
    _state.velocity  = (_state.angle - _state.prevAngle) / dt;

    if (device)
        device->setWheel(normalizedAngle(_state.angle, halfRange));
}

} // namespace pensteer::wheel
