/**
 * @file FfEffectTracker.hpp
 * @brief Decoding of uploaded force-feedback effects and tracking of the
 *        active constant force.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_DEVICE_FFEFFECTTRACKER_HPP
    #define PENSTEER_DEVICE_FFEFFECTTRACKER_HPP

#include <pensteer/core/Types.hpp>

#include <linux/input.h>

#include <optional>
#include <variant>

namespace pensteer::device {

/** @brief Payload of an FF_CONSTANT effect. */
struct ConstantForce
{
    core::i16 effectId{-1};
    core::i16 level{0};
};

/** @brief Any other effect type; only its tag is read. */
struct OtherEffect
{
    core::i16 effectId{-1};
    core::u16 type{0};
};

using DecodedEffect = std::variant<ConstantForce, OtherEffect>;

/**
 * @brief Reads an uploaded effect through its type tag.
 *
 * The constant-force member of the payload union is only touched once the
 * tag says FF_CONSTANT.
 */
[[nodiscard]] DecodedEffect decodeEffect(const ff_effect& effect) noexcept;

/** @brief Whether the device advertises @p type (functional or not). */
[[nodiscard]] bool isAdvertisedEffect(core::u16 type) noexcept;

/** @brief The constant-force effect currently followed. */
struct FfEffectState
{
    core::u32 requestId{0};
    core::i16 effectId{-1};
    bool      playing{false};
    core::i16 force{0};
};

/**
 * @class FfEffectTracker
 * @brief Follows at most one constant-force effect (last upload wins).
 *
 * Uploading marks the effect loaded, EV_FF playback events start and stop
 * it, and an erase only clears it when the erased id equals the request id
 * the effect was uploaded with.
 */
class FfEffectTracker
{
public:
    /**
     * @brief Handles one upload request.
     * @return Value for uinput_ff_upload::retval (0 or a negative errno).
     */
    [[nodiscard]] core::i32 onUpload(core::u32 requestId, const ff_effect& effect);

    /** @brief Handles one erase request; clears the effect whose request id is @p erasedId. */
    void onErase(core::u32 erasedId);

    /** @brief Handles an EV_FF event (code = effect id, value = play count). */
    void onPlayback(core::u16 code, core::i32 value);

    /** @brief Normalized force in [-1, 1]; 0 unless an effect is playing. */
    [[nodiscard]] core::f32 magnitude() const noexcept;

    [[nodiscard]] const std::optional<FfEffectState>& tracked() const noexcept { return _tracked; }

private:
    std::optional<FfEffectState> _tracked;
};

} // namespace pensteer::device

#endif // PENSTEER_DEVICE_FFEFFECTTRACKER_HPP
