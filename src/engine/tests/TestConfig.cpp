/**
 * @file TestConfig.cpp
 * @brief Unit tests for pensteer::engine::Config and its Builder.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/engine/Config.hpp"

using namespace pensteer;
using namespace pensteer::engine;

TEST_CASE("Default config matches the documented defaults", "[engine][config]")
{
    const Config config = Config::Builder{}.build();
    const auto& physical = config.physical();

    REQUIRE(physical.updateFrequency == 125);
    REQUIRE(physical.rangeDegrees == 1800.0f);
    REQUIRE(physical.hornRadius == 0.3f);
    REQUIRE(physical.pressureThreshold == 10);
    REQUIRE(physical.baseRadius == 0.6f);
    REQUIRE(physical.inertia == 1.0f);
    REQUIRE(physical.friction == 25.0f);
    REQUIRE(physical.spring == 0.0f);
    REQUIRE(physical.maxTorque == 300.0f);

    REQUIRE(config.source().kind == input::SourceFactory::defaultKind());
    REQUIRE(config.source().netAddress == "127.0.0.1:16027");
    REQUIRE_FALSE(config.source().preferredTablet.has_value());

    REQUIRE(config.device().kind == device::DeviceFactory::defaultKind());
    REQUIRE(config.device().resolution == 32768);
    REQUIRE(config.device().name == "G29 Driving Force Racing Wheel [PS3]");
    REQUIRE(config.device().vendor == 0x046D);
    REQUIRE(config.device().product == 0xC24F);
    REQUIRE(config.device().version == 0x0003);

    REQUIRE(config.mapping() == input::Mapping{});
    REQUIRE(config == Config{});
}

TEST_CASE("Builder sets every group of fields", "[engine][config]")
{
    input::Mapping mapping;
    mapping.orientation = input::MapOrientation::k270;

    const Config config = Config::Builder{}
        .updateFrequency(250)
        .rangeDegrees(900.0f)
        .spring(4.0f)
        .source(input::SourceKind::kNet)
        .netAddress("0.0.0.0:4000")
        .preferredTablet("Wacom Intuos")
        .device(device::DeviceKind::kNone)
        .deviceResolution(1024)
        .deviceName("Test Wheel")
        .mapping(mapping)
        .build();

    REQUIRE(config.physical().updateFrequency == 250);
    REQUIRE(config.physical().rangeDegrees == 900.0f);
    REQUIRE(config.physical().spring == 4.0f);
    REQUIRE(config.source().kind == input::SourceKind::kNet);
    REQUIRE(config.source().netAddress == "0.0.0.0:4000");
    REQUIRE(config.source().preferredTablet == "Wacom Intuos");
    REQUIRE(config.device().kind == device::DeviceKind::kNone);
    REQUIRE(config.device().resolution == 1024);
    REQUIRE(config.device().name == "Test Wheel");
    REQUIRE(config.mapping().orientation == input::MapOrientation::k270);
}

TEST_CASE("toBuilder edits one field and keeps the rest", "[engine][config]")
{
    const Config base = Config::Builder{}.friction(5.0f).deviceVendor(0x1234).build();
    const Config edited = base.toBuilder().friction(7.0f).build();

    REQUIRE(edited.physical().friction == 7.0f);
    REQUIRE(edited.device().vendor == 0x1234);
    REQUIRE(base.physical().friction == 5.0f);
    REQUIRE_FALSE(edited == base);
}

TEST_CASE("halfRange is half the lock in radians", "[engine][config]")
{
    const Config config = Config::Builder{}.rangeDegrees(360.0f).build();
    REQUIRE(config.physical().halfRange() == math::kPi);
}
