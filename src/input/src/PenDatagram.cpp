/**
 * @file PenDatagram.cpp
 * @brief Little-endian pen datagram codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/input/PenDatagram.hpp>

#include <bit>

namespace pensteer::input {

namespace {

core::u32 readU32(std::span<const core::byte> data, core::usize offset) noexcept
{
    return  static_cast<core::u32>(data[offset])
         | (static_cast<core::u32>(data[offset + 1]) << 8)
         | (static_cast<core::u32>(data[offset + 2]) << 16)
         | (static_cast<core::u32>(data[offset + 3]) << 24);
}

void writeU32(PenDatagram& out, core::usize offset, core::u32 value) noexcept
{
    out[offset]     = static_cast<core::byte>(value & 0xFFu);
    out[offset + 1] = static_cast<core::byte>((value >> 8) & 0xFFu);
    out[offset + 2] = static_cast<core::byte>((value >> 16) & 0xFFu);
    out[offset + 3] = static_cast<core::byte>((value >> 24) & 0xFFu);
}

} // anonymous namespace

std::optional<PenSample> decodePenDatagram(std::span<const core::byte> data) noexcept
{
    if (data.size() != core::kPenDatagramSize)
    {
        return std::nullopt;
    }

    PenSample sample;
    sample.x        = std::bit_cast<core::f32>(readU32(data, 0));
    sample.y        = std::bit_cast<core::f32>(readU32(data, 4));
    sample.pressure = readU32(data, 8);
    sample.buttons  = static_cast<core::u8>(data[12]);
    return sample;
}

PenDatagram encodePenDatagram(const PenSample& sample) noexcept
{
    PenDatagram out{};
    writeU32(out, 0, std::bit_cast<core::u32>(sample.x));
    writeU32(out, 4, std::bit_cast<core::u32>(sample.y));
    writeU32(out, 8, sample.pressure);
    out[12] = static_cast<core::byte>(sample.buttons);
    return out;
}

} // namespace pensteer::input
