/**
 * @file DeviceFactory.cpp
 * @brief Implementation of the DeviceFactory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/device/DeviceFactory.hpp>
#include <pensteer/core/Platform.hpp>

#ifdef PENSTEER_OS_LINUX
    #include <pensteer/device/UInputDevice.hpp>
#endif

namespace pensteer::device {

std::string_view toString(DeviceKind kind) noexcept
{
    switch (kind)
    {
        case DeviceKind::kNone:   return "Null";
        case DeviceKind::kUInput: return "Linux uinput";
    }
    return "Unknown";
}

core::Expected<std::unique_ptr<IDevice>> DeviceFactory::create(const DeviceConfig& config)
{
    switch (config.kind)
    {
        case DeviceKind::kNone:
            return std::make_unique<DummyDevice>();

        case DeviceKind::kUInput:
#ifdef PENSTEER_OS_LINUX
        {
            auto device = PENSTEER_TRY(UInputDevice::create(config));
            return std::unique_ptr<IDevice>{std::move(device)};
        }
#else
            return core::makeError(core::ErrorCode::kNotSupported,
                                   "uinput devices are only available on Linux");
#endif
    }

    return core::makeError(core::ErrorCode::kInvalidArgument, "unknown device kind");
}

std::vector<DeviceKind> DeviceFactory::availableKinds()
{
#ifdef PENSTEER_OS_LINUX
    return {DeviceKind::kNone, DeviceKind::kUInput};
#else
    return {DeviceKind::kNone};
#endif
}

DeviceKind DeviceFactory::defaultKind() noexcept
{
#ifdef PENSTEER_OS_LINUX
    return DeviceKind::kUInput;
#else
    return DeviceKind::kNone;
#endif
}

} // namespace pensteer::device
