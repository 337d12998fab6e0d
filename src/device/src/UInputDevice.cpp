/**
 * @file UInputDevice.cpp
 * @brief uinput wheel: capability setup, event batching and FF protocol.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/device/UInputDevice.hpp>
#include <pensteer/device/UInputPort.hpp>
#include <pensteer/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace pensteer::device {

namespace {

input_event makeEvent(core::u16 type, core::u16 code, core::i32 value) noexcept
{
    input_event ev{};
    ev.type  = type;
    ev.code  = code;
    ev.value = value;
    return ev;
}

} // anonymous namespace

UInputDevice::UInputDevice(PrivateTag, std::unique_ptr<IUInputPort> port, core::u32 resolution) noexcept
    : _port{std::move(port)}
    , _resolution{static_cast<core::f32>(resolution)}
{}

UInputDevice::~UInputDevice()
{
    // Resetting the port tears the kernel device down before members go.
    _port.reset();
    core::Log::info("UInput", "virtual wheel destroyed");
}

core::Expected<void> UInputDevice::validate(const DeviceConfig& config)
{
    if (config.resolution == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "device resolution must be positive");
    }
    if (config.resolution > core::kMaxDeviceResolution)
    {
        return core::makeError(core::ErrorCode::kOutOfRange,
                               "device resolution " + std::to_string(config.resolution) +
                               " exceeds " + std::to_string(core::kMaxDeviceResolution));
    }
    if (config.name.size() >= UINPUT_MAX_NAME_SIZE)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "device name longer than " + std::to_string(UINPUT_MAX_NAME_SIZE - 1) +
                               " characters");
    }
    return {};
}

UInputSetup UInputDevice::describe(const DeviceConfig& config)
{
    const auto resolution = static_cast<core::i32>(config.resolution);

    UInputSetup setup;
    setup.name         = config.name;
    setup.bustype      = BUS_USB;
    setup.vendor       = config.vendor;
    setup.product      = config.product;
    setup.version      = config.version;
    setup.ffEffectsMax = core::kMaxFfEffects;

    setup.keys = {kHornKey, BTN_THUMBL, BTN_NORTH, BTN_EAST, BTN_SOUTH, BTN_WEST};

    setup.ffBits = {FF_CONSTANT,
                    FF_AUTOCENTER, FF_PERIODIC, FF_RUMBLE, FF_DAMPER, FF_INERTIA, FF_RAMP,
                    FF_SINE, FF_SQUARE, FF_TRIANGLE, FF_SAW_UP, FF_SAW_DOWN};

    setup.absAxis       = ABS_X;
    setup.absMinimum    = -resolution;
    setup.absMaximum    = resolution;
    setup.absResolution = resolution;
    return setup;
}

core::Expected<std::unique_ptr<UInputDevice>> UInputDevice::create(const DeviceConfig& config)
{
    PENSTEER_TRY_VOID(validate(config));
    auto port = PENSTEER_TRY(UInputPort::open());
    return create(config, std::move(port));
}

core::Expected<std::unique_ptr<UInputDevice>> UInputDevice::create(
    const DeviceConfig& config, std::unique_ptr<IUInputPort> port)
{
    PENSTEER_TRY_VOID(validate(config));
    PENSTEER_TRY_VOID(port->create(describe(config)));

    core::Log::info("UInput", "created virtual wheel '" + config.name + "'");
    return std::make_unique<UInputDevice>(PrivateTag{}, std::move(port), config.resolution);
}

std::optional<core::f32> UInputDevice::feedback() const
{
    return _effects.magnitude();
}

void UInputDevice::setWheel(core::f32 normalizedAngle)
{
    const core::f32 clamped = std::isfinite(normalizedAngle)
                            ? std::clamp(normalizedAngle, -1.0f, 1.0f)
                            : 0.0f;
    // nearbyint honours the default round-half-to-even mode.
    _pendingAxis = static_cast<core::i32>(std::nearbyint(clamped * _resolution));
}

void UInputDevice::setHorn(bool pressed)
{
    _pendingHorn = pressed;
}

core::Expected<void> UInputDevice::apply()
{
    core::usize count = 0;

    if (const auto axis = std::exchange(_pendingAxis, std::nullopt))
        _events[count++] = makeEvent(EV_ABS, ABS_X, *axis);

    if (const auto horn = std::exchange(_pendingHorn, std::nullopt))
        _events[count++] = makeEvent(EV_KEY, kHornKey, *horn ? 1 : 0);

    if (count == 0)
        return {};

    _events[count++] = makeEvent(EV_SYN, SYN_REPORT, 0);

    auto written = _port->write(std::span<const input_event>(_events.data(), count));
    if (!written.has_value())
        return std::unexpected(written.error().withContext("could not write events"));
    return {};
}

core::Expected<void> UInputDevice::handleEvents()
{
    for (;;)
    {
        const auto ev = PENSTEER_TRY(_port->read());
        if (!ev.has_value())
            return {};

        switch (ev->type)
        {
            case EV_UINPUT:
                if (ev->code == UI_FF_UPLOAD)
                    PENSTEER_TRY_VOID(handleUpload(static_cast<core::u32>(ev->value)));
                else if (ev->code == UI_FF_ERASE)
                    PENSTEER_TRY_VOID(handleErase(static_cast<core::u32>(ev->value)));
                else
                    core::Log::debug("UInput", "unexpected EV_UINPUT code " + std::to_string(ev->code));
                break;

            case EV_FF:
                _effects.onPlayback(ev->code, ev->value);
                break;

            default:
                // LED and similar feedback to the device is not modelled.
                core::Log::debug("UInput", "ignored event type " + std::to_string(ev->type));
                break;
        }
    }
}

core::Expected<void> UInputDevice::handleUpload(core::u32 requestId)
{
    uinput_ff_upload upload{};
    upload.request_id = requestId;
    PENSTEER_TRY_VOID(_port->beginUpload(upload));

    upload.retval = _effects.onUpload(upload.request_id, upload.effect);

    return _port->endUpload(upload);
}

core::Expected<void> UInputDevice::handleErase(core::u32 requestId)
{
    uinput_ff_erase erase{};
    erase.request_id = requestId;
    PENSTEER_TRY_VOID(_port->beginErase(erase));

    _effects.onErase(erase.effect_id);
    erase.retval = 0;

    return _port->endErase(erase);
}

} // namespace pensteer::device
