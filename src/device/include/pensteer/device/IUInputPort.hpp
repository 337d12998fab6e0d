/**
 * @file IUInputPort.hpp
 * @brief Kernel-facing half of the uinput backend.
 *
 * UInputDevice speaks the uinput protocol through this interface so that
 * the protocol logic can be exercised without /dev/uinput.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_IUINPUTPORT_HPP
    #define PENSTEER_DEVICE_IUINPUTPORT_HPP

#include <pensteer/core/Types.hpp>
#include <pensteer/core/Expected.hpp>

#include <linux/input.h>
#include <linux/uinput.h>

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace pensteer::device {

/** @brief Everything advertised to the kernel before UI_DEV_CREATE. */
struct UInputSetup
{
    std::string            name;
    core::u16              bustype{BUS_USB};
    core::u16              vendor{0};
    core::u16              product{0};
    core::u16              version{0};
    core::u32              ffEffectsMax{0};

    std::vector<core::u16> keys;
    std::vector<core::u16> ffBits;

    core::u16              absAxis{ABS_X};
    core::i32              absMinimum{0};
    core::i32              absMaximum{0};
    core::i32              absResolution{0};
};

/**
 * @class IUInputPort
 * @brief Thin wrapper over the uinput character device.
 *
 * Implementations destroy the virtual device when they are destroyed.
 */
class IUInputPort
{
public:
    virtual ~IUInputPort() = default;

    /** @brief Advertise capabilities and create the device. */
    [[nodiscard]] virtual core::Expected<void> create(const UInputSetup& setup) = 0;

    /** @brief Write a batch of events in one call. */
    [[nodiscard]] virtual core::Expected<void> write(std::span<const input_event> events) = 0;

    /**
     * @brief Non-blocking read of one event sent by the kernel.
     * @return The event, or std::nullopt when the queue is empty.
     */
    [[nodiscard]] virtual core::Expected<std::optional<input_event>> read() = 0;

    [[nodiscard]] virtual core::Expected<void> beginUpload(uinput_ff_upload& upload) = 0;
    [[nodiscard]] virtual core::Expected<void> endUpload(uinput_ff_upload& upload) = 0;
    [[nodiscard]] virtual core::Expected<void> beginErase(uinput_ff_erase& erase) = 0;
    [[nodiscard]] virtual core::Expected<void> endErase(uinput_ff_erase& erase) = 0;
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_IUINPUTPORT_HPP
