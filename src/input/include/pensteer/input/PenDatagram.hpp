/**
 * @file PenDatagram.hpp
 * @brief Wire format of the network pen source.
 *
 * A datagram is exactly 13 bytes, little-endian:
 *
 * | offset | type | field    |
 * |--------|------|----------|
 * | 0      | f32  | x        |
 * | 4      | f32  | y        |
 * | 8      | u32  | pressure |
 * | 12     | u8   | buttons  |
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_INPUT_PENDATAGRAM_HPP
    #define PENSTEER_INPUT_PENDATAGRAM_HPP

#include <pensteer/input/PenSample.hpp>
#include <pensteer/core/Constants.hpp>

#include <array>
#include <optional>
#include <span>

namespace pensteer::input {

using PenDatagram = std::array<core::byte, core::kPenDatagramSize>;

/**
 * @brief Decodes one datagram.
 * @return The sample, or std::nullopt when the length is not 13 bytes.
 */
[[nodiscard]] std::optional<PenSample> decodePenDatagram(std::span<const core::byte> data) noexcept;

/** @brief Encodes a sample the way a sender is expected to. */
[[nodiscard]] PenDatagram encodePenDatagram(const PenSample& sample) noexcept;

} // namespace pensteer::input

#endif // PENSTEER_INPUT_PENDATAGRAM_HPP
