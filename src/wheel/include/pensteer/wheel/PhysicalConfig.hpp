/**
 * @file PhysicalConfig.hpp
 * @brief Physical parameters of the simulated wheel.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_WHEEL_PHYSICALCONFIG_HPP
    #define PENSTEER_WHEEL_PHYSICALCONFIG_HPP

#include <pensteer/core/Constants.hpp>
#include <pensteer/math/Angle.hpp>

namespace pensteer::wheel {

struct PhysicalConfig
{
    /// Lock-to-lock steering range in degrees.
    core::f32 rangeDegrees{core::kDefaultRangeDegrees};
    /// Touching the pen down within this radius sounds the horn.
    core::f32 hornRadius{core::kDefaultHornRadius};
    /// Angular deltas measured closer to the centre than this are damped.
    core::f32 baseRadius{core::kDefaultBaseRadius};
    /// Pressure at or below this value counts as lifted.
    core::u32 pressureThreshold{core::kDefaultPressureThreshold};
    /// Rotational inertia (kg m^2).
    core::f32 inertia{core::kDefaultInertia};
    /// Viscous friction coefficient.
    core::f32 friction{core::kDefaultFriction};
    /// Centring spring coefficient.
    core::f32 spring{core::kDefaultSpring};
    /// Torque (N m) produced by a full-scale feedback effect.
    core::f32 maxTorque{core::kDefaultMaxTorque};
    /// Simulation ticks per second.
    core::u32 updateFrequency{core::kDefaultUpdateFrequency};

    /** @brief Clamp bound of the wheel angle, in radians. */
    [[nodiscard]] constexpr core::f32 halfRange() const noexcept
    {
        return math::toRadians(rangeDegrees * 0.5f);
    }

    [[nodiscard]] bool operator==(const PhysicalConfig&) const = default;
};

} // namespace pensteer::wheel

#endif // PENSTEER_WHEEL_PHYSICALCONFIG_HPP
