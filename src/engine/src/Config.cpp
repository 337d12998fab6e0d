/**
 * @file Config.cpp
 * @brief Config::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/engine/Config.hpp>

#include <utility>

namespace pensteer::engine {

Config::Builder& Config::Builder::updateFrequency(core::u32 hz) noexcept
{
    config_.physical_.updateFrequency = hz;
    return *this;
}

Config::Builder& Config::Builder::rangeDegrees(core::f32 degrees) noexcept
{
    config_.physical_.rangeDegrees = degrees;
    return *this;
}

Config::Builder& Config::Builder::hornRadius(core::f32 radius) noexcept
{
    config_.physical_.hornRadius = radius;
    return *this;
}

Config::Builder& Config::Builder::baseRadius(core::f32 radius) noexcept
{
    config_.physical_.baseRadius = radius;
    return *this;
}

Config::Builder& Config::Builder::pressureThreshold(core::u32 threshold) noexcept
{
    config_.physical_.pressureThreshold = threshold;
    return *this;
}

Config::Builder& Config::Builder::inertia(core::f32 value) noexcept
{
    config_.physical_.inertia = value;
    return *this;
}

Config::Builder& Config::Builder::friction(core::f32 value) noexcept
{
    config_.physical_.friction = value;
    return *this;
}

Config::Builder& Config::Builder::spring(core::f32 value) noexcept
{
    config_.physical_.spring = value;
    return *this;
}

Config::Builder& Config::Builder::maxTorque(core::f32 value) noexcept
{
    config_.physical_.maxTorque = value;
    return *this;
}

Config::Builder& Config::Builder::source(input::SourceKind kind) noexcept
{
    config_.source_.kind = kind;
    return *this;
}

Config::Builder& Config::Builder::netAddress(std::string address)
{
    config_.source_.netAddress = std::move(address);
    return *this;
}

Config::Builder& Config::Builder::preferredTablet(std::optional<std::string> name)
{
    config_.source_.preferredTablet = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::device(device::DeviceKind kind) noexcept
{
    config_.device_.kind = kind;
    return *this;
}

Config::Builder& Config::Builder::deviceResolution(core::u32 resolution) noexcept
{
    config_.device_.resolution = resolution;
    return *this;
}

Config::Builder& Config::Builder::deviceName(std::string name)
{
    config_.device_.name = std::move(name);
    return *this;
}

Config::Builder& Config::Builder::deviceVendor(core::u16 vendor) noexcept
{
    config_.device_.vendor = vendor;
    return *this;
}

Config::Builder& Config::Builder::deviceProduct(core::u16 product) noexcept
{
    config_.device_.product = product;
    return *this;
}

Config::Builder& Config::Builder::deviceVersion(core::u16 version) noexcept
{
    config_.device_.version = version;
    return *this;
}

Config::Builder& Config::Builder::mapping(const input::Mapping& mapping) noexcept
{
    config_.mapping_ = mapping;
    return *this;
}

Config Config::Builder::build() const
{
    return config_;
}

} // namespace pensteer::engine
