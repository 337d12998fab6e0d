/**
 * @file SocketTransport.hpp
 * @brief Standard POSIX UDP socket transport.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef PENSTEER_NET_TRANSPORT_SOCKETTRANSPORT_HPP
    #define PENSTEER_NET_TRANSPORT_SOCKETTRANSPORT_HPP

#include <pensteer/net/transport/Endpoint.hpp>
#include <pensteer/core/NonCopyable.hpp>

#include <memory>
#include <optional>
#include <span>

namespace pensteer::net::transport {

/**
 * @class SocketTransport
 * @brief POSIX UDP socket-based transport (non-blocking).
 *
 * Binds to a local endpoint on @ref open and uses @c sendto / @c recvfrom
 * for datagram exchange. The socket is closed on destruction.
 */
class SocketTransport final : public core::NonCopyable<SocketTransport>
{
public:
    /**
     * @brief Constructs a socket transport for the given local endpoint.
     * @param local Address to bind; port 0 picks an ephemeral port.
     */
    explicit SocketTransport(Endpoint local);
    ~SocketTransport();

    [[nodiscard]] core::Expected<void> open();
    void close();

    [[nodiscard]] bool isOpen() const noexcept;

    /** @brief Port actually bound (differs from the request when it was 0). */
    [[nodiscard]] core::u16 localPort() const noexcept;

    /**
     * @brief Sends one datagram.
     * @return Number of bytes sent, or error.
     */
    [[nodiscard]] core::Expected<core::usize> send(
        std::span<const core::byte> data,
        const Endpoint& to);

    /**
     * @brief Non-blocking receive of one datagram.
     * @param buffer Destination buffer. Longer datagrams are truncated but
     *               their full length is still reported.
     * @return Full datagram length, std::nullopt when nothing is pending,
     *         or error.
     */
    [[nodiscard]] core::Expected<std::optional<core::usize>> receive(
        std::span<core::byte> buffer);

    [[nodiscard]] const char* name() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace pensteer::net::transport

#endif // PENSTEER_NET_TRANSPORT_SOCKETTRANSPORT_HPP
