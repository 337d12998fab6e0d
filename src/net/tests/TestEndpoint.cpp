/**
 * @file TestEndpoint.cpp
 * @brief Unit tests for pensteer::net::transport::Endpoint.
 */

#include <catch2/catch_test_macros.hpp>

#include "pensteer/net/transport/Endpoint.hpp"

using namespace pensteer;
using namespace pensteer::net::transport;

TEST_CASE("Endpoint parses host:port", "[net][endpoint]")
{
    auto endpoint = Endpoint::parse("127.0.0.1:16027");
    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->host == "127.0.0.1");
    REQUIRE(endpoint->port == 16027);
    REQUIRE(endpoint->toString() == "127.0.0.1:16027");
}

TEST_CASE("Endpoint accepts the wildcard address", "[net][endpoint]")
{
    auto endpoint = Endpoint::parse("0.0.0.0:0");
    REQUIRE(endpoint.has_value());
    REQUIRE(endpoint->port == 0);
}

TEST_CASE("Endpoint rejects malformed addresses", "[net][endpoint]")
{
    for (const char* text : {"", "127.0.0.1", "127.0.0.1:", ":16027", "localhost:16027",
                             "127.0.0.1:65536", "127.0.0.1:12ab", "300.1.1.1:80"})
    {
        INFO(text);
        auto endpoint = Endpoint::parse(text);
        REQUIRE_FALSE(endpoint.has_value());
        REQUIRE(endpoint.error().code() == core::ErrorCode::kInvalidArgument);
    }
}
