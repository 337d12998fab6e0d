/**
 * @file IDevice.hpp
 * @brief Abstract virtual wheel device interface (Strategy pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_IDEVICE_HPP
    #define PENSTEER_DEVICE_IDEVICE_HPP

#include <pensteer/core/Types.hpp>
#include <pensteer/core/Expected.hpp>

#include <optional>

namespace pensteer::device {

/**
 * @brief Abstract interface for virtual steering wheel outputs.
 *
 * setWheel() and setHorn() only stage values; nothing reaches the platform
 * until apply(). Destroying a device removes it from the system before the
 * destructor returns.
 */
class IDevice
{
public:
    virtual ~IDevice() = default;

    /**
     * @brief Normalized force-feedback magnitude currently requested by the
     *        game, in [-1, 1].
     * @return std::nullopt when the device has no force-feedback support.
     */
    [[nodiscard]] virtual std::optional<core::f32> feedback() const = 0;

    /** @brief Stage a wheel position, -1 full left to 1 full right. */
    virtual void setWheel(core::f32 normalizedAngle) = 0;

    /** @brief Stage the horn button state. */
    virtual void setHorn(bool pressed) = 0;

    /**
     * @brief Flush staged values to the platform.
     * @return Success or the write error.
     */
    [[nodiscard]] virtual core::Expected<void> apply() = 0;

    /**
     * @brief Service pending requests from the platform (effect uploads,
     *        erases and playback) without blocking.
     */
    [[nodiscard]] virtual core::Expected<void> handleEvents() = 0;

    /** @brief Human-readable device name. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/**
 * @brief Device that accepts everything and reports no feedback.
 *
 * Stands in when output is disabled and for backends not built on this
 * platform.
 */
class DummyDevice final : public IDevice
{
public:
    [[nodiscard]] std::optional<core::f32> feedback() const override { return std::nullopt; }
    void setWheel(core::f32 /*normalizedAngle*/) override {}
    void setHorn(bool /*pressed*/) override {}
    [[nodiscard]] core::Expected<void> apply() override { return {}; }
    [[nodiscard]] core::Expected<void> handleEvents() override { return {}; }
    [[nodiscard]] const char* name() const noexcept override { return "DummyDevice"; }
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_IDEVICE_HPP
