/**
 * @file Config.hpp
 * @brief Controller configuration (Builder pattern).
 *
 * Immutable snapshot constructed via a fluent Builder. Centralises the
 * physical parameters, the backend selection and the pen mapping.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_ENGINE_CONFIG_HPP
    #define PENSTEER_ENGINE_CONFIG_HPP

#include <pensteer/wheel/PhysicalConfig.hpp>
#include <pensteer/input/SourceFactory.hpp>
#include <pensteer/input/Mapping.hpp>
#include <pensteer/device/DeviceFactory.hpp>

#include <optional>
#include <string>

namespace pensteer::engine {

/// @brief Immutable controller configuration.
class Config
{
public:
    class Builder;

    /// @brief Platform defaults; same as Builder{}.build().
    Config() = default;

    /// @brief Builder seeded with this configuration, for editing one field.
    [[nodiscard]] Builder toBuilder() const;

    [[nodiscard]] const wheel::PhysicalConfig& physical() const noexcept { return physical_; }
    [[nodiscard]] const input::SourceConfig&   source()   const noexcept { return source_; }
    [[nodiscard]] const device::DeviceConfig&  device()   const noexcept { return device_; }
    [[nodiscard]] const input::Mapping&        mapping()  const noexcept { return mapping_; }

    [[nodiscard]] bool operator==(const Config&) const = default;

private:
    wheel::PhysicalConfig physical_{};
    input::SourceConfig   source_{input::SourceFactory::defaultKind()};
    device::DeviceConfig  device_{device::DeviceFactory::defaultKind()};
    input::Mapping        mapping_{};
};

/// @brief Fluent builder for Config.
class Config::Builder
{
public:
    Builder() = default;

    Builder& updateFrequency(core::u32 hz) noexcept;
    Builder& rangeDegrees(core::f32 degrees) noexcept;
    Builder& hornRadius(core::f32 radius) noexcept;
    Builder& baseRadius(core::f32 radius) noexcept;
    Builder& pressureThreshold(core::u32 threshold) noexcept;
    Builder& inertia(core::f32 value) noexcept;
    Builder& friction(core::f32 value) noexcept;
    Builder& spring(core::f32 value) noexcept;
    Builder& maxTorque(core::f32 value) noexcept;

    Builder& source(input::SourceKind kind) noexcept;
    Builder& netAddress(std::string address);
    Builder& preferredTablet(std::optional<std::string> name);

    Builder& device(device::DeviceKind kind) noexcept;
    Builder& deviceResolution(core::u32 resolution) noexcept;
    Builder& deviceName(std::string name);
    Builder& deviceVendor(core::u16 vendor) noexcept;
    Builder& deviceProduct(core::u16 product) noexcept;
    Builder& deviceVersion(core::u16 version) noexcept;

    Builder& mapping(const input::Mapping& mapping) noexcept;

    [[nodiscard]] Config build() const;

private:
    friend class Config;

    explicit Builder(const Config& seed) : config_{seed} {}

    Config config_;
};

inline Config::Builder Config::toBuilder() const
{
    return Builder{*this};
}

} // namespace pensteer::engine

#endif // PENSTEER_ENGINE_CONFIG_HPP
