/**
 * @file FfEffectTracker.cpp
 * @brief Force-feedback effect decoding and tracking.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/device/FfEffectTracker.hpp>
#include <pensteer/core/Log.hpp>

#include <cerrno>
#include <limits>
#include <string>

namespace pensteer::device {

DecodedEffect decodeEffect(const ff_effect& effect) noexcept
{
    if (effect.type == FF_CONSTANT)
    {
        return ConstantForce{effect.id, effect.u.constant.level};
    }
    return OtherEffect{effect.id, effect.type};
}

bool isAdvertisedEffect(core::u16 type) noexcept
{
    switch (type)
    {
        case FF_CONSTANT:
        case FF_PERIODIC:
        case FF_RAMP:
        case FF_SPRING:
        case FF_FRICTION:
        case FF_DAMPER:
        case FF_INERTIA:
        case FF_RUMBLE:
            return true;
        default:
            return false;
    }
}

core::i32 FfEffectTracker::onUpload(core::u32 requestId, const ff_effect& effect)
{
    const DecodedEffect decoded = decodeEffect(effect);

    if (const auto* other = std::get_if<OtherEffect>(&decoded))
    {
        if (!isAdvertisedEffect(other->type))
        {
            core::Log::debug("UInput", "rejected upload of effect type " + std::to_string(other->type));
            return -EINVAL;
        }
        core::Log::debug("UInput", "accepted cosmetic effect type " + std::to_string(other->type));
        return 0;
    }

    const auto& constant = std::get<ConstantForce>(decoded);
    const bool sameEffect = _tracked.has_value() && _tracked->effectId == constant.effectId;

    FfEffectState next;
    next.requestId = requestId;
    next.effectId  = constant.effectId;
    next.force     = constant.level;
    next.playing   = sameEffect && _tracked->playing;
    _tracked = next;
    return 0;
}

void FfEffectTracker::onErase(core::u32 erasedId)
{
    if (_tracked.has_value() && _tracked->requestId == erasedId)
    {
        _tracked.reset();
    }
}

void FfEffectTracker::onPlayback(core::u16 code, core::i32 value)
{
    if (code >= FF_GAIN)
    {
        // FF_GAIN / FF_AUTOCENTER and friends share the EV_FF type.
        core::Log::debug("UInput", "ignored FF control code " + std::to_string(code));
        return;
    }

    if (_tracked.has_value() && _tracked->effectId == static_cast<core::i16>(code))
    {
        _tracked->playing = value > 0;
    }
}

core::f32 FfEffectTracker::magnitude() const noexcept
{
    if (!_tracked.has_value() || !_tracked->playing)
        return 0.0f;

    constexpr auto kMax = static_cast<core::f32>(std::numeric_limits<core::i16>::max());
    const core::f32 value = static_cast<core::f32>(_tracked->force) / kMax;
    return value < -1.0f ? -1.0f : value;
}

} // namespace pensteer::device
