/**
 * @file PenSample.hpp
 * @brief One absolute pen reading.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_INPUT_PENSAMPLE_HPP
    #define PENSTEER_INPUT_PENSAMPLE_HPP

#include <pensteer/core/Types.hpp>

namespace pensteer::input {

/**
 * @struct PenSample
 * @brief Pen position, pressure and barrel buttons.
 *
 * Sources deliver x/y in their own raw space; once passed through a
 * Mapping they lie in the canonical [-1, 1] wheel space.
 */
struct PenSample
{
    core::f32 x{0.0f};
    core::f32 y{0.0f};
    core::u32 pressure{0};
    core::u8  buttons{0};

    [[nodiscard]] constexpr bool operator==(const PenSample&) const noexcept = default;
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_PENSAMPLE_HPP
