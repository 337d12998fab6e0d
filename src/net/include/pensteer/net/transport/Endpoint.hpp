/**
 * @file Endpoint.hpp
 * @brief IPv4 "host:port" endpoint parsing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef PENSTEER_NET_TRANSPORT_ENDPOINT_HPP
    #define PENSTEER_NET_TRANSPORT_ENDPOINT_HPP

#include <pensteer/core/Types.hpp>
#include <pensteer/core/Expected.hpp>

#include <string>
#include <string_view>

namespace pensteer::net::transport {

/** @brief A numeric IPv4 address and UDP port. */
struct Endpoint
{
    std::string host;
    core::u16   port{0};

    /**
     * @brief Parses "a.b.c.d:port".
     * @return The endpoint, or kInvalidArgument when either part is malformed.
     */
    [[nodiscard]] static core::Expected<Endpoint> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;
};

} // namespace pensteer::net::transport

#endif // PENSTEER_NET_TRANSPORT_ENDPOINT_HPP
