/**
 * @file NetSource.hpp
 * @brief Pen source fed by UDP datagrams.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef PENSTEER_INPUT_NETSOURCE_HPP
    #define PENSTEER_INPUT_NETSOURCE_HPP

#include <pensteer/input/ISource.hpp>
#include <pensteer/net/transport/SocketTransport.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <memory>
#include <string_view>

namespace pensteer::input {

/**
 * @class NetSource
 * @brief Receives 13-byte pen datagrams on a non-blocking UDP socket.
 *
 * Every poll drains the socket and keeps the newest well-formed sample.
 * Datagrams of any other length are dropped.
 */
class NetSource final : public ISource,
                        public core::NonCopyable<NetSource>
{
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    NetSource(PrivateTag, net::transport::Endpoint local);

    /**
     * @brief Binds a source to @p address ("host:port").
     * @return The opened source, or the parse / bind error.
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<NetSource>> create(std::string_view address);

    [[nodiscard]] core::Expected<std::optional<PenSample>> poll() override;

    [[nodiscard]] const char* name() const noexcept override { return "NetSource"; }

    /** @brief Port the socket is bound to. */
    [[nodiscard]] core::u16 localPort() const noexcept { return _socket.localPort(); }

private:
    net::transport::SocketTransport _socket;
};

} // namespace pensteer::input

#endif // PENSTEER_INPUT_NETSOURCE_HPP
