/**
 * @file Vec2.hpp
 * @brief Plain 2-D float vector used for pen positions.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_MATH_VEC2_HPP
    #define PENSTEER_MATH_VEC2_HPP

    #include <pensteer/core/Types.hpp>

namespace pensteer::math {

struct Vec2
{
    core::f32 x{0.0f};
    core::f32 y{0.0f};

    [[nodiscard]] constexpr bool operator==(const Vec2&) const noexcept = default;
};

} // namespace pensteer::math

#endif // PENSTEER_MATH_VEC2_HPP
