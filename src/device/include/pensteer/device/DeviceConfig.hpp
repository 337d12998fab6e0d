/**
 * @file DeviceConfig.hpp
 * @brief Backend selection and identity of the virtual wheel.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_DEVICECONFIG_HPP
    #define PENSTEER_DEVICE_DEVICECONFIG_HPP

#include <pensteer/core/Constants.hpp>

#include <string>
#include <string_view>

namespace pensteer::device {

/** @brief Available output backends. */
enum class DeviceKind : core::u8 {
    kNone = 0,
    kUInput
};

/** @brief Display name of a device kind. */
[[nodiscard]] std::string_view toString(DeviceKind kind) noexcept;

/** @brief Everything needed to create any device. */
struct DeviceConfig
{
    DeviceKind  kind{DeviceKind::kNone};
    /// Axis reports span [-resolution, resolution].
    core::u32   resolution{core::kDefaultDeviceResolution};
    std::string name{core::kDefaultDeviceName};
    core::u16   vendor{core::kDefaultDeviceVendor};
    core::u16   product{core::kDefaultDeviceProduct};
    core::u16   version{core::kDefaultDeviceVersion};

    [[nodiscard]] bool operator==(const DeviceConfig&) const = default;
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_DEVICECONFIG_HPP
