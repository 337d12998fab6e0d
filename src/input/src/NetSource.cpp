/**
 * @file NetSource.cpp
 * @brief UDP pen source implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/input/NetSource.hpp>
#include <pensteer/input/PenDatagram.hpp>
#include <pensteer/core/Log.hpp>

#include <array>

namespace pensteer::input {

NetSource::NetSource(PrivateTag, net::transport::Endpoint local)
    : _socket{std::move(local)}
{}

core::Expected<std::unique_ptr<NetSource>> NetSource::create(std::string_view address)
{
    auto endpoint = PENSTEER_TRY(net::transport::Endpoint::parse(address));

    auto source = std::make_unique<NetSource>(PrivateTag{}, std::move(endpoint));
    PENSTEER_TRY_VOID(source->_socket.open());

    core::Log::info("NetSource", "listening on " + std::string(address));
    return source;
}

core::Expected<std::optional<PenSample>> NetSource::poll()
{
    std::optional<PenSample> latest;
    std::array<core::byte, 64> buffer{};

    for (;;)
    {
        auto received = PENSTEER_TRY(_socket.receive(buffer));
        if (!received.has_value())
        {
            break;
        }

        const core::usize length = *received;
        if (length > buffer.size())
        {
            core::Log::debug("NetSource", "dropped oversized datagram");
            continue;
        }

        auto sample = decodePenDatagram(std::span<const core::byte>(buffer.data(), length));
        if (!sample.has_value())
        {
            core::Log::debug("NetSource", "dropped datagram of " + std::to_string(length) + " bytes");
            continue;
        }

        latest = *sample;
    }

    return latest;
}

} // namespace pensteer::input
