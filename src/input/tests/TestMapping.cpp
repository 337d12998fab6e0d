/**
 * @file TestMapping.cpp
 * @brief Unit tests for pensteer::input::Mapping.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "pensteer/input/Mapping.hpp"

#include <cmath>
#include <limits>

using namespace pensteer;
using namespace pensteer::input;
using Catch::Matchers::WithinAbs;

namespace {

void requireVec(math::Vec2 actual, float x, float y)
{
    REQUIRE_THAT(actual.x, WithinAbs(x, 1e-6));
    REQUIRE_THAT(actual.y, WithinAbs(y, 1e-6));
}

} // namespace

TEST_CASE("Default mapping is the identity", "[input][mapping]")
{
    const Mapping mapping;

    for (int i = -10; i <= 10; ++i)
    {
        for (int j = -10; j <= 10; ++j)
        {
            const float x = 0.1f * static_cast<float>(i);
            const float y = 0.1f * static_cast<float>(j);
            requireVec(mapping.transform(x, y), x, y);
        }
    }
}

TEST_CASE("Mapping rotates by quarter turns", "[input][mapping]")
{
    Mapping mapping;

    mapping.orientation = MapOrientation::k90;
    requireVec(mapping.transform(0.5f, 0.25f), -0.25f, 0.5f);

    mapping.orientation = MapOrientation::k180;
    requireVec(mapping.transform(0.5f, 0.25f), -0.5f, -0.25f);

    mapping.orientation = MapOrientation::k270;
    requireVec(mapping.transform(0.5f, 0.25f), 0.25f, -0.5f);
}

TEST_CASE("Mapping inverts axes before rotating", "[input][mapping]")
{
    Mapping mapping;
    mapping.invertX = true;
    requireVec(mapping.transform(0.5f, 0.25f), -0.5f, 0.25f);

    mapping.invertY = true;
    mapping.orientation = MapOrientation::k90;
    requireVec(mapping.transform(0.5f, 0.25f), 0.25f, -0.5f);
}

TEST_CASE("Mapping windows and clamps the input range", "[input][mapping]")
{
    Mapping mapping;
    mapping.minIn = {0.0f, 0.0f};
    mapping.maxIn = {0.5f, 0.5f};

    requireVec(mapping.transform(0.25f, 0.0f), 0.0f, -1.0f);
    requireVec(mapping.transform(2.0f, -2.0f), 1.0f, -1.0f);
}

TEST_CASE("Mapping clamps the output to the unit square", "[input][mapping]")
{
    Mapping mapping;
    mapping.minOut = {-3.0f, -3.0f};
    mapping.maxOut = {3.0f, 3.0f};

    requireVec(mapping.transform(0.9f, -0.9f), 1.0f, -1.0f);
    requireVec(mapping.transform(0.1f, 0.0f), 0.3f, 0.0f);
}

TEST_CASE("Mapping sends non-finite input to the window centre", "[input][mapping]")
{
    const Mapping mapping;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    requireVec(mapping.transform(nan, 0.5f), 0.0f, 0.5f);

    Mapping collapsed;
    collapsed.maxIn = collapsed.minIn;
    requireVec(collapsed.transform(0.3f, 0.3f), 0.0f, 0.0f);
}

TEST_CASE("Mapping::apply keeps pressure and buttons", "[input][mapping]")
{
    Mapping mapping;
    mapping.orientation = MapOrientation::k180;

    const PenSample out = mapping.apply(PenSample{0.5f, -0.5f, 900, 0b10});
    REQUIRE_THAT(out.x, WithinAbs(-0.5, 1e-6));
    REQUIRE_THAT(out.y, WithinAbs(0.5, 1e-6));
    REQUIRE(out.pressure == 900);
    REQUIRE(out.buttons == 0b10);
}
