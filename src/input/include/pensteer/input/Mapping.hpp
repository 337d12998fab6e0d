/**
 * @file Mapping.hpp
 * @brief Raw-to-wheel coordinate mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_INPUT_MAPPING_HPP
    #define PENSTEER_INPUT_MAPPING_HPP

#include <pensteer/input/PenSample.hpp>
#include <pensteer/math/Vec2.hpp>

namespace pensteer::input {

/** @brief Quarter-turn rotation applied after scaling. */
enum class MapOrientation : core::u8 {
    kNone = 0,
    k90,
    k180,
    k270
};

/**
 * @class Mapping
 * @brief Affine window mapping followed by an optional quarter-turn.
 *
 * The input window [minIn, maxIn] is normalized to [0, 1] and clamped,
 * optionally mirrored per axis, scaled into [minOut, maxOut], clamped to
 * [-1, 1] and finally rotated. A default-constructed Mapping is the
 * identity on [-1, 1]^2.
 */
struct Mapping
{
    math::Vec2     minIn{-1.0f, -1.0f};
    math::Vec2     maxIn{ 1.0f,  1.0f};
    math::Vec2     minOut{-1.0f, -1.0f};
    math::Vec2     maxOut{ 1.0f,  1.0f};
    MapOrientation orientation{MapOrientation::kNone};
    bool           invertX{false};
    bool           invertY{false};

    [[nodiscard]] math::Vec2 transform(core::f32 x, core::f32 y) const noexcept;

    /** @brief Maps the position of @p sample, keeping pressure and buttons. */
    [[nodiscard]] PenSample apply(const PenSample& sample) const noexcept;

    [[nodiscard]] bool operator==(const Mapping&) const noexcept = default;
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_MAPPING_HPP
