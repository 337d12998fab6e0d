/**
 * @file Mapping.cpp
 * @brief Mapping implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/input/Mapping.hpp>
#include <pensteer/math/Angle.hpp>

#include <algorithm>
#include <cmath>

namespace pensteer::input {

namespace {

// NaN input or a collapsed input window lands on the window centre.
core::f32 unitPosition(core::f32 t, core::f32 a1, core::f32 a2) noexcept
{
    const core::f32 u = math::inverseLerp(t, a1, a2);
    return std::isfinite(u) ? std::clamp(u, 0.0f, 1.0f) : 0.5f;
}

} // anonymous namespace

math::Vec2 Mapping::transform(core::f32 x, core::f32 y) const noexcept
{
    x = unitPosition(x, minIn.x, maxIn.x);
    y = unitPosition(y, minIn.y, maxIn.y);

    if (invertX)
        x = 1.0f - x;
    if (invertY)
        y = 1.0f - y;

    x = std::clamp(math::lerp(x, minOut.x, maxOut.x), -1.0f, 1.0f);
    y = std::clamp(math::lerp(y, minOut.y, maxOut.y), -1.0f, 1.0f);

    switch (orientation)
    {
        case MapOrientation::kNone: return {x, y};
        case MapOrientation::k90:   return {-y, x};
        case MapOrientation::k180:  return {-x, -y};
        case MapOrientation::k270:  return {y, -x};
    }
    return {x, y};
}

PenSample Mapping::apply(const PenSample& sample) const noexcept
{
    const math::Vec2 pos = transform(sample.x, sample.y);
    return PenSample{pos.x, pos.y, sample.pressure, sample.buttons};
}

} // namespace pensteer::input
