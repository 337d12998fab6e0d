/**
 * @file TestDeviceFactory.cpp
 * @brief Unit tests for pensteer::device::DeviceFactory.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/device/DeviceFactory.hpp"
#include "pensteer/core/Platform.hpp"

#include <algorithm>
#include <string>

using namespace pensteer;
using namespace pensteer::device;

TEST_CASE("DeviceFactory creates the dummy device", "[device][factory]")
{
    DeviceConfig config;
    config.kind = DeviceKind::kNone;

    auto result = DeviceFactory::create(config);
    REQUIRE(result.has_value());

    auto& device = **result;
    REQUIRE_FALSE(device.feedback().has_value());
    device.setWheel(0.5f);
    device.setHorn(true);
    REQUIRE(device.apply().has_value());
    REQUIRE(device.handleEvents().has_value());
}

TEST_CASE("DeviceFactory validates the uinput config before opening", "[device][factory]")
{
    DeviceConfig config;
    config.kind = DeviceKind::kUInput;
    config.resolution = 70000;

    auto result = DeviceFactory::create(config);
    REQUIRE_FALSE(result.has_value());
#ifdef PENSTEER_OS_LINUX
    REQUIRE(result.error().code() == core::ErrorCode::kOutOfRange);
#else
    REQUIRE(result.error().code() == core::ErrorCode::kNotSupported);
#endif
}

TEST_CASE("DeviceFactory lists the default kind as available", "[device][factory]")
{
    const auto kinds = DeviceFactory::availableKinds();
    REQUIRE(std::find(kinds.begin(), kinds.end(), DeviceKind::kNone) != kinds.end());
    REQUIRE(std::find(kinds.begin(), kinds.end(), DeviceFactory::defaultKind()) != kinds.end());
    REQUIRE(toString(DeviceKind::kNone) == "Null");
}
