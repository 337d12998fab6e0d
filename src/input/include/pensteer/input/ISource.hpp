/**
 * @file ISource.hpp
 * @brief Abstract pen source interface (UDP, evdev, dummy).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef PENSTEER_INPUT_ISOURCE_HPP
    #define PENSTEER_INPUT_ISOURCE_HPP

#include <pensteer/input/PenSample.hpp>
#include <pensteer/core/Expected.hpp>

#include <optional>

namespace pensteer::input {

/**
 * @class ISource
 * @brief Strategy interface for polled pen sources.
 *
 * A source is fully opened by its factory; destroying it releases the
 * underlying socket or device.
 */
class ISource
{
public:
    virtual ~ISource() = default;

    /**
     * @brief Drains pending input without blocking.
     * @return The newest complete sample, std::nullopt when nothing new
     *         arrived since the previous poll, or an I/O error.
     */
    [[nodiscard]] virtual core::Expected<std::optional<PenSample>> poll() = 0;

    /** @brief Returns a human-readable name. */
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/**
 * @class DummySource
 * @brief Source that never produces a sample.
 */
class DummySource final : public ISource
{
public:
    [[nodiscard]] core::Expected<std::optional<PenSample>> poll() override
    {
        return std::optional<PenSample>{};
    }

    [[nodiscard]] const char* name() const noexcept override { return "DummySource"; }
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_ISOURCE_HPP
