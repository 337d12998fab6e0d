/**
 * @file Angle.hpp
 * @brief Scalar helpers for planar angles and symmetric clamping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_MATH_ANGLE_HPP
    #define PENSTEER_MATH_ANGLE_HPP

    #include <pensteer/core/Types.hpp>

    #include <algorithm>
    #include <cmath>
    #include <numbers>

namespace pensteer::math {

inline constexpr core::f32 kPi    = std::numbers::pi_v<core::f32>;
inline constexpr core::f32 kTwoPi = 2.0f * kPi;

/** @brief Degrees to radians. */
[[nodiscard]] constexpr core::f32 toRadians(core::f32 degrees) noexcept
{
    return degrees * (kPi / 180.0f);
}

/** @brief Map @p t from range [a1, a2] to range [b1, b2]. */
[[nodiscard]] constexpr core::f32 remap(core::f32 t, core::f32 a1, core::f32 a2,
                                        core::f32 b1, core::f32 b2) noexcept
{
    return b1 + (t - a1) * (b2 - b1) / (a2 - a1);
}

/** @brief Linear interpolation from @p b1 (t = 0) to @p b2 (t = 1). */
[[nodiscard]] constexpr core::f32 lerp(core::f32 t, core::f32 b1, core::f32 b2) noexcept
{
    return b1 + t * (b2 - b1);
}

/** @brief Inverse of lerp(): where @p t lies between @p a1 and @p a2. */
[[nodiscard]] constexpr core::f32 inverseLerp(core::f32 t, core::f32 a1, core::f32 a2) noexcept
{
    return (t - a1) / (a2 - a1);
}

/** @brief Clamp @p v within [-maxAbs, maxAbs]; an empty or NaN bound yields 0. */
[[nodiscard]] constexpr core::f32 clampSymmetric(core::f32 maxAbs, core::f32 v) noexcept
{
    if (!(maxAbs > 0.0f))
        return 0.0f;
    return std::clamp(v, -maxAbs, maxAbs);
}

/** @brief Euclidean distance from the origin. */
[[nodiscard]] inline core::f32 length(core::f32 x, core::f32 y) noexcept
{
    return std::sqrt(x * x + y * y);
}

/**
 * @brief Shortest signed angular difference from @p a to @p b.
 * @return Radians in (-pi, pi].
 */
[[nodiscard]] inline core::f32 angleDelta(core::f32 a, core::f32 b) noexcept
{
    core::f32 delta = std::remainder(b - a, kTwoPi);
    if (delta <= -kPi)
        delta += kTwoPi;
    return delta;
}

/**
 * @brief Scale an angular delta by how far from the centre it was measured.
 *
 * Near the centre a small positional jitter is a large angular one, so
 * deltas measured inside @p baseRadius are attenuated linearly towards 0.
 * A non-positive @p baseRadius disables the attenuation.
 */
[[nodiscard]] inline core::f32 dampAngleDelta(core::f32 delta, core::f32 distance,
                                              core::f32 baseRadius) noexcept
{
    if (baseRadius <= 0.0f)
        return delta;
    return delta * (std::min(distance, baseRadius) / baseRadius);
}

} // namespace pensteer::math

#endif // PENSTEER_MATH_ANGLE_HPP
