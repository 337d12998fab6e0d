/**
 * @file DeviceFactory.hpp
 * @brief Registry of output backends.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_DEVICEFACTORY_HPP
    #define PENSTEER_DEVICE_DEVICEFACTORY_HPP

#include <pensteer/device/IDevice.hpp>
#include <pensteer/device/DeviceConfig.hpp>

#include <memory>
#include <vector>

namespace pensteer::device {

/**
 * @brief Instantiates the IDevice matching a DeviceConfig.
 *
 * Platform differences stop here: callers ask for a kind and either get a
 * device or an error (kNotSupported when the kind is not built in).
 */
class DeviceFactory
{
public:
    DeviceFactory() = delete;

    [[nodiscard]] static core::Expected<std::unique_ptr<IDevice>> create(const DeviceConfig& config);

    /** @brief Device kinds compiled in for this platform. */
    [[nodiscard]] static std::vector<DeviceKind> availableKinds();

    /** @brief Default kind for this platform. */
    [[nodiscard]] static DeviceKind defaultKind() noexcept;
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_DEVICEFACTORY_HPP
