/**
 * @file UInputPort.cpp
 * @brief ioctl-level uinput access.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/device/UInputPort.hpp>
#include <pensteer/core/Log.hpp>

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace pensteer::device {

namespace {

core::Expected<void> control(int fd, unsigned long request, unsigned long arg, const char* what)
{
    if (::ioctl(fd, request, arg) < 0)
    {
        return core::makeError(core::ErrorCode::kDeviceOpenFailed,
                               std::string(what) + ": " + std::strerror(errno));
    }
    return {};
}

template <typename T>
core::Expected<void> transact(int fd, unsigned long request, T& payload, const char* what)
{
    if (::ioctl(fd, request, &payload) < 0)
    {
        return core::makeError(core::ErrorCode::kProtocolViolation,
                               std::string(what) + ": " + std::strerror(errno));
    }
    return {};
}

} // anonymous namespace

core::Expected<std::unique_ptr<UInputPort>> UInputPort::open(const char* path)
{
    const int fd = ::open(path, O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0)
    {
        const auto code = errno == EACCES ? core::ErrorCode::kPermissionDenied
                                          : core::ErrorCode::kDeviceOpenFailed;
        return core::makeError(code, std::string("could not open ") + path + ": " + std::strerror(errno));
    }
    return std::make_unique<UInputPort>(PrivateTag{}, fd);
}

UInputPort::~UInputPort()
{
    if (_fd < 0)
        return;

    if (_created && ::ioctl(_fd, UI_DEV_DESTROY) < 0)
    {
        core::Log::error("UInput", std::string("UI_DEV_DESTROY: ") + std::strerror(errno));
    }
    ::close(_fd);
}

core::Expected<void> UInputPort::create(const UInputSetup& setup)
{
    if (_created)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "uinput device already created");
    }

    PENSTEER_TRY_VOID(control(_fd, UI_SET_EVBIT, EV_KEY, "UI_SET_EVBIT(EV_KEY)"));
    for (const core::u16 key : setup.keys)
        PENSTEER_TRY_VOID(control(_fd, UI_SET_KEYBIT, key, "UI_SET_KEYBIT"));

    PENSTEER_TRY_VOID(control(_fd, UI_SET_EVBIT, EV_ABS, "UI_SET_EVBIT(EV_ABS)"));
    PENSTEER_TRY_VOID(control(_fd, UI_SET_ABSBIT, setup.absAxis, "UI_SET_ABSBIT"));

    if (!setup.ffBits.empty())
    {
        PENSTEER_TRY_VOID(control(_fd, UI_SET_EVBIT, EV_FF, "UI_SET_EVBIT(EV_FF)"));
        for (const core::u16 bit : setup.ffBits)
            PENSTEER_TRY_VOID(control(_fd, UI_SET_FFBIT, bit, "UI_SET_FFBIT"));
    }

    uinput_abs_setup abs{};
    abs.code = setup.absAxis;
    abs.absinfo.minimum    = setup.absMinimum;
    abs.absinfo.maximum    = setup.absMaximum;
    abs.absinfo.resolution = setup.absResolution;
    PENSTEER_TRY_VOID(transact(_fd, UI_ABS_SETUP, abs, "UI_ABS_SETUP"));

    uinput_setup dev{};
    dev.id.bustype = setup.bustype;
    dev.id.vendor  = setup.vendor;
    dev.id.product = setup.product;
    dev.id.version = setup.version;
    std::strncpy(dev.name, setup.name.c_str(), UINPUT_MAX_NAME_SIZE - 1);
    dev.ff_effects_max = setup.ffEffectsMax;
    PENSTEER_TRY_VOID(transact(_fd, UI_DEV_SETUP, dev, "UI_DEV_SETUP"));

    PENSTEER_TRY_VOID(control(_fd, UI_DEV_CREATE, 0, "UI_DEV_CREATE"));
    _created = true;
    return {};
}

core::Expected<void> UInputPort::write(std::span<const input_event> events)
{
    const auto bytes = static_cast<::ssize_t>(events.size_bytes());
    const auto written = ::write(_fd, events.data(), events.size_bytes());
    if (written != bytes)
    {
        return core::makeError(core::ErrorCode::kDeviceWriteFailed,
                               written < 0 ? std::string("write: ") + std::strerror(errno)
                                           : std::string("short write to uinput"));
    }
    return {};
}

core::Expected<std::optional<input_event>> UInputPort::read()
{
    input_event ev{};
    const auto got = ::read(_fd, &ev, sizeof(ev));
    if (got < 0)
    {
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return std::optional<input_event>{};
        return core::makeError(core::ErrorCode::kDeviceReadFailed,
                               std::string("read: ") + std::strerror(errno));
    }
    if (got != static_cast<::ssize_t>(sizeof(ev)))
    {
        return core::makeError(core::ErrorCode::kDeviceReadFailed, "short read from uinput");
    }
    return std::optional<input_event>{ev};
}

core::Expected<void> UInputPort::beginUpload(uinput_ff_upload& upload)
{
    return transact(_fd, UI_BEGIN_FF_UPLOAD, upload, "UI_BEGIN_FF_UPLOAD");
}

core::Expected<void> UInputPort::endUpload(uinput_ff_upload& upload)
{
    return transact(_fd, UI_END_FF_UPLOAD, upload, "UI_END_FF_UPLOAD");
}

core::Expected<void> UInputPort::beginErase(uinput_ff_erase& erase)
{
    return transact(_fd, UI_BEGIN_FF_ERASE, erase, "UI_BEGIN_FF_ERASE");
}

core::Expected<void> UInputPort::endErase(uinput_ff_erase& erase)
{
    return transact(_fd, UI_END_FF_ERASE, erase, "UI_END_FF_ERASE");
}

} // namespace pensteer::device
