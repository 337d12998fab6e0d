/**
 * @file TestSocketTransport.cpp
 * @brief Loopback tests for pensteer::net::transport::SocketTransport.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/net/transport/SocketTransport.hpp"

#include <array>

using namespace pensteer;
using namespace pensteer::net::transport;

TEST_CASE("SocketTransport binds an ephemeral port", "[net][socket]")
{
    SocketTransport socket{Endpoint{"127.0.0.1", 0}};
    REQUIRE_FALSE(socket.isOpen());

    REQUIRE(socket.open().has_value());
    REQUIRE(socket.isOpen());
    REQUIRE(socket.localPort() != 0);

    socket.close();
    REQUIRE_FALSE(socket.isOpen());
}

TEST_CASE("SocketTransport receive does not block when idle", "[net][socket]")
{
    SocketTransport socket{Endpoint{"127.0.0.1", 0}};
    REQUIRE(socket.open().has_value());

    std::array<core::byte, 16> buffer{};
    auto received = socket.receive(buffer);
    REQUIRE(received.has_value());
    REQUIRE_FALSE(received->has_value());
}

TEST_CASE("SocketTransport delivers a datagram over loopback", "[net][socket]")
{
    SocketTransport receiver{Endpoint{"127.0.0.1", 0}};
    SocketTransport sender{Endpoint{"127.0.0.1", 0}};
    REQUIRE(receiver.open().has_value());
    REQUIRE(sender.open().has_value());

    const std::array<core::byte, 3> payload{core::byte{1}, core::byte{2}, core::byte{3}};
    auto sent = sender.send(payload, Endpoint{"127.0.0.1", receiver.localPort()});
    REQUIRE(sent.has_value());
    REQUIRE(*sent == payload.size());

    std::array<core::byte, 16> buffer{};
    std::optional<core::usize> length;
    for (int attempt = 0; attempt < 1000 && !length; ++attempt)
    {
        auto received = receiver.receive(buffer);
        REQUIRE(received.has_value());
        length = *received;
    }

    REQUIRE(length == payload.size());
    REQUIRE(buffer[0] == core::byte{1});
    REQUIRE(buffer[2] == core::byte{3});
}

TEST_CASE("SocketTransport reports a port already in use", "[net][socket]")
{
    SocketTransport first{Endpoint{"127.0.0.1", 0}};
    REQUIRE(first.open().has_value());

    SocketTransport second{Endpoint{"127.0.0.1", first.localPort()}};
    auto result = second.open();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::kNetworkBindFailed);
}
