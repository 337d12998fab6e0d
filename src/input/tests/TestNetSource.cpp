/**
 * @file TestNetSource.cpp
 * @brief Loopback tests for pensteer::input::NetSource.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/input/NetSource.hpp"
#include "pensteer/input/PenDatagram.hpp"
#include "pensteer/net/transport/SocketTransport.hpp"

#include <array>
#include <chrono>
#include <thread>

using namespace pensteer;
using namespace pensteer::input;
using net::transport::Endpoint;
using net::transport::SocketTransport;

namespace {

struct Loopback {
    std::unique_ptr<NetSource> source;
    SocketTransport sender{Endpoint{"127.0.0.1", 0}};

    Loopback()
    {
        auto created = NetSource::create("127.0.0.1:0");
        REQUIRE(created.has_value());
        source = std::move(*created);
        REQUIRE(sender.open().has_value());
    }

    void send(std::span<const core::byte> data)
    {
        auto sent = sender.send(data, Endpoint{"127.0.0.1", source->localPort()});
        REQUIRE(sent.has_value());
    }

    // Loopback delivery is asynchronous; give the kernel a moment.
    void settle() { std::this_thread::sleep_for(std::chrono::milliseconds(20)); }
};

} // namespace

TEST_CASE("NetSource returns nothing when idle", "[input][net]")
{
    Loopback loop;
    auto polled = loop.source->poll();
    REQUIRE(polled.has_value());
    REQUIRE_FALSE(polled->has_value());
}

TEST_CASE("NetSource decodes a pen datagram", "[input][net]")
{
    Loopback loop;
    const PenSample sample{0.5f, -0.25f, 300, 1};
    loop.send(encodePenDatagram(sample));
    loop.settle();

    auto polled = loop.source->poll();
    REQUIRE(polled.has_value());
    REQUIRE(polled->has_value());
    REQUIRE(**polled == sample);
}

TEST_CASE("NetSource keeps the newest of several datagrams", "[input][net]")
{
    Loopback loop;
    loop.send(encodePenDatagram(PenSample{0.1f, 0.1f, 20, 0}));
    loop.send(encodePenDatagram(PenSample{0.2f, 0.2f, 40, 0}));
    loop.settle();

    auto polled = loop.source->poll();
    REQUIRE(polled.has_value());
    REQUIRE(polled->has_value());
    REQUIRE((*polled)->pressure == 40);
}

TEST_CASE("NetSource ignores a 10-byte datagram", "[input][net]")
{
    Loopback loop;
    const std::array<core::byte, 10> truncated{};
    loop.send(truncated);
    loop.settle();

    auto polled = loop.source->poll();
    REQUIRE(polled.has_value());
    REQUIRE_FALSE(polled->has_value());
}

TEST_CASE("NetSource skips malformed datagrams between valid ones", "[input][net]")
{
    Loopback loop;
    const std::array<core::byte, 100> oversized{};
    loop.send(encodePenDatagram(PenSample{0.3f, 0.0f, 50, 0}));
    loop.send(oversized);
    loop.settle();

    auto polled = loop.source->poll();
    REQUIRE(polled.has_value());
    REQUIRE(polled->has_value());
    REQUIRE((*polled)->pressure == 50);
}

TEST_CASE("NetSource rejects a bad address", "[input][net]")
{
    auto created = NetSource::create("not-an-address");
    REQUIRE_FALSE(created.has_value());
    REQUIRE(created.error().code() == core::ErrorCode::kInvalidArgument);
}
