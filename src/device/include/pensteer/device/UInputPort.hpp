/**
 * @file UInputPort.hpp
 * @brief /dev/uinput implementation of IUInputPort.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_UINPUTPORT_HPP
    #define PENSTEER_DEVICE_UINPUTPORT_HPP

#include <pensteer/device/IUInputPort.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <memory>

namespace pensteer::device {

/**
 * @class UInputPort
 * @brief Owns a non-blocking /dev/uinput descriptor.
 *
 * The destructor issues UI_DEV_DESTROY before closing, so the virtual
 * controller disappears synchronously.
 */
class UInputPort final : public IUInputPort,
                         public core::NonCopyable<UInputPort>
{
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    UInputPort(PrivateTag, int fd) noexcept : _fd{fd} {}
    ~UInputPort() override;

    /** @brief Opens @p path (normally /dev/uinput) read-write, non-blocking. */
    [[nodiscard]] static core::Expected<std::unique_ptr<UInputPort>> open(const char* path = "/dev/uinput");

    [[nodiscard]] core::Expected<void> create(const UInputSetup& setup) override;
    [[nodiscard]] core::Expected<void> write(std::span<const input_event> events) override;
    [[nodiscard]] core::Expected<std::optional<input_event>> read() override;

    [[nodiscard]] core::Expected<void> beginUpload(uinput_ff_upload& upload) override;
    [[nodiscard]] core::Expected<void> endUpload(uinput_ff_upload& upload) override;
    [[nodiscard]] core::Expected<void> beginErase(uinput_ff_erase& erase) override;
    [[nodiscard]] core::Expected<void> endErase(uinput_ff_erase& erase) override;

private:
    int  _fd{-1};
    bool _created{false};
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_UINPUTPORT_HPP
