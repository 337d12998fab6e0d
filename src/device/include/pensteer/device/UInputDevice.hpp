/**
 * @file UInputDevice.hpp
 * @brief Force-feedback steering wheel presented through Linux uinput.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_UINPUTDEVICE_HPP
    #define PENSTEER_DEVICE_UINPUTDEVICE_HPP

#include <pensteer/device/IDevice.hpp>
#include <pensteer/device/DeviceConfig.hpp>
#include <pensteer/device/FfEffectTracker.hpp>
#include <pensteer/device/IUInputPort.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <array>
#include <memory>

namespace pensteer::device {

/**
 * @class UInputDevice
 * @brief Virtual wheel with one absolute axis, a horn button and a
 *        constant-force effect.
 *
 * The extra buttons and effect types it advertises are never driven; they
 * only help games recognise a wheel.
 */
class UInputDevice final : public IDevice,
                           public core::NonCopyable<UInputDevice>
{
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    /// Key reported for the horn.
    static constexpr core::u16 kHornKey = BTN_THUMBR;

    UInputDevice(PrivateTag, std::unique_ptr<IUInputPort> port, core::u32 resolution) noexcept;
    ~UInputDevice() override;

    /** @brief Validates @p config and creates the device on /dev/uinput. */
    [[nodiscard]] static core::Expected<std::unique_ptr<UInputDevice>> create(const DeviceConfig& config);

    /** @brief Validates @p config and creates the device on @p port. */
    [[nodiscard]] static core::Expected<std::unique_ptr<UInputDevice>> create(
        const DeviceConfig& config, std::unique_ptr<IUInputPort> port);

    /**
     * @brief Rejects a resolution that is zero or wider than the backend
     *        axis, and a name longer than the kernel accepts.
     */
    [[nodiscard]] static core::Expected<void> validate(const DeviceConfig& config);

    /** @brief Capabilities advertised for @p config. */
    [[nodiscard]] static UInputSetup describe(const DeviceConfig& config);

    [[nodiscard]] std::optional<core::f32> feedback() const override;
    void setWheel(core::f32 normalizedAngle) override;
    void setHorn(bool pressed) override;
    [[nodiscard]] core::Expected<void> apply() override;
    [[nodiscard]] core::Expected<void> handleEvents() override;
    [[nodiscard]] const char* name() const noexcept override { return "UInputDevice"; }

    [[nodiscard]] const FfEffectTracker& effects() const noexcept { return _effects; }

private:
    [[nodiscard]] core::Expected<void> handleUpload(core::u32 requestId);
    [[nodiscard]] core::Expected<void> handleErase(core::u32 requestId);

    std::unique_ptr<IUInputPort>  _port;
    core::f32                     _resolution;
    std::optional<core::i32>      _pendingAxis;
    std::optional<bool>           _pendingHorn;
    FfEffectTracker               _effects;
    std::array<input_event, 3>    _events{};
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_UINPUTDEVICE_HPP
