/**
 * @file EvdevSource.hpp
 * @brief Pen source reading a Linux evdev tablet.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef PENSTEER_INPUT_EVDEVSOURCE_HPP
    #define PENSTEER_INPUT_EVDEVSOURCE_HPP

#include <pensteer/input/ISource.hpp>
#include <pensteer/math/Vec2.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pensteer::input {

/** @brief Range and resolution of one absolute axis, as reported by EVIOCGABS. */
struct AxisRange
{
    core::i32 minimum{0};
    core::i32 maximum{0};
    core::i32 resolution{0};
};

/**
 * @class TabletNormalizer
 * @brief Converts raw tablet coordinates to [-1, 1] without distortion.
 *
 * Both axes are first stretched to [-1, 1]. The shorter physical side then
 * keeps that range while the longer side is rescaled to the same units and
 * clamped, so a circle drawn on the tablet stays a circle.
 */
class TabletNormalizer
{
public:
    TabletNormalizer(AxisRange x, AxisRange y) noexcept;

    [[nodiscard]] math::Vec2 normalize(core::i32 rawX, core::i32 rawY) const noexcept;

    /** @brief Physical width divided by physical height. */
    [[nodiscard]] core::f32 aspectRatio() const noexcept { return _aspectRatio; }

private:
    AxisRange _x;
    AxisRange _y;
    core::f32 _aspectRatio{1.0f};
};

/** @brief An event node that looks like a pen tablet. */
struct TabletInfo
{
    std::string path;
    std::string name;
};

/**
 * @brief Scans /dev/input for devices exposing ABS_X, ABS_Y and ABS_PRESSURE.
 *
 * Nodes that cannot be opened (usually permissions) are skipped silently.
 */
[[nodiscard]] core::Expected<std::vector<TabletInfo>> enumerateTablets();

/**
 * @class EvdevSource
 * @brief Reads absolute pen events from a non-blocking evdev node.
 *
 * Axis updates accumulate until SYN_REPORT, which publishes one sample.
 * After SYN_DROPPED the partial frame is discarded up to the next report.
 */
class EvdevSource final : public ISource,
                          public core::NonCopyable<EvdevSource>
{
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    EvdevSource(PrivateTag, int fd, std::string deviceName, TabletNormalizer normalizer) noexcept;
    ~EvdevSource() override;

    /**
     * @brief Opens the tablet named @p preferredName, or the first tablet
     *        found when no name is given.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<EvdevSource>> create(
        const std::optional<std::string>& preferredName);

    /** @brief Opens a specific event node. */
    [[nodiscard]] static core::Expected<std::unique_ptr<EvdevSource>> openPath(const std::string& path);

    [[nodiscard]] core::Expected<std::optional<PenSample>> poll() override;

    [[nodiscard]] const char* name() const noexcept override { return "EvdevSource"; }

    [[nodiscard]] const std::string& deviceName() const noexcept { return _deviceName; }

private:
    int              _fd{-1};
    std::string      _deviceName;
    TabletNormalizer _normalizer;
    core::i32        _rawX{0};
    core::i32        _rawY{0};
    core::u32        _pressure{0};
    core::u8         _buttons{0};
    bool             _dropping{false};
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_EVDEVSOURCE_HPP
