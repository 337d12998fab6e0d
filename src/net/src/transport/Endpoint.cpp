/**
 * @file Endpoint.cpp
 * @brief Endpoint parsing.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/net/transport/Endpoint.hpp>

#include <arpa/inet.h>
#include <charconv>

namespace pensteer::net::transport {

core::Expected<Endpoint> Endpoint::parse(std::string_view text)
{
    const auto colon = text.rfind(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "expected host:port, got '" + std::string(text) + "'");
    }

    Endpoint endpoint;
    endpoint.host = std::string(text.substr(0, colon));

    in_addr parsed{};
    if (::inet_pton(AF_INET, endpoint.host.c_str(), &parsed) != 1)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "invalid IPv4 address '" + endpoint.host + "'");
    }

    const auto portText = text.substr(colon + 1);
    const auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(),
                                           endpoint.port);
    if (ec != std::errc{} || ptr != portText.data() + portText.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "invalid port '" + std::string(portText) + "'");
    }

    return endpoint;
}

std::string Endpoint::toString() const
{
    return host + ":" + std::to_string(port);
}

} // namespace pensteer::net::transport
