/**
 * @file Constants.hpp
 * @brief Compile-time defaults and protocol limits.
 *
 * The defaults seed engine::Config::Builder; the limits are enforced by
 * the device and source backends.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_CORE_CONSTANTS_HPP
    #define PENSTEER_CORE_CONSTANTS_HPP

    #include "Types.hpp"

    #include <string_view>

namespace pensteer::core {

// ---- Physical defaults ---------------------------------------------------

inline constexpr u32   kDefaultUpdateFrequency   = 125;
inline constexpr f32   kDefaultRangeDegrees      = 1800.0f;
inline constexpr f32   kDefaultHornRadius        = 0.3f;
inline constexpr u32   kDefaultPressureThreshold = 10;
inline constexpr f32   kDefaultBaseRadius        = 0.6f;
inline constexpr f32   kDefaultInertia           = 1.0f;
inline constexpr f32   kDefaultFriction          = 25.0f;
inline constexpr f32   kDefaultSpring            = 0.0f;
inline constexpr f32   kDefaultMaxTorque         = 300.0f;

/// Velocities below this magnitude (rad/s) snap to zero during free spin.
inline constexpr f32   kVelocityEpsilon          = 1e-5f;

// ---- Net source ----------------------------------------------------------

inline constexpr std::string_view kDefaultNetAddress = "127.0.0.1:16027";
inline constexpr usize kPenDatagramSize          = 13;

// ---- Virtual device ------------------------------------------------------

inline constexpr u32   kDefaultDeviceResolution  = 32768;
inline constexpr std::string_view kDefaultDeviceName = "G29 Driving Force Racing Wheel [PS3]";
inline constexpr u16   kDefaultDeviceVendor      = 0x046D;
inline constexpr u16   kDefaultDeviceProduct     = 0xC24F;
inline constexpr u16   kDefaultDeviceVersion     = 0x0003;

/// Widest axis resolution the uinput backend accepts.
inline constexpr u32   kMaxDeviceResolution      = 0xFFFF;
/// Simultaneous force-feedback effects advertised to the kernel.
inline constexpr u32   kMaxFfEffects             = 10;

} // namespace pensteer::core

#endif // PENSTEER_CORE_CONSTANTS_HPP
