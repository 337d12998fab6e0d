/**
 * @file SocketTransport.cpp
 * @brief POSIX UDP socket transport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <pensteer/net/transport/SocketTransport.hpp>
#include <pensteer/core/Log.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace pensteer::net::transport {

namespace {

sockaddr_in toSockaddr(const Endpoint& endpoint)
{
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(endpoint.port);
    ::inet_pton(AF_INET, endpoint.host.c_str(), &addr.sin_addr);
    return addr;
}

} // anonymous namespace

struct SocketTransport::Impl
{
    Endpoint  local;
    int       fd{-1};
    core::u16 boundPort{0};

    explicit Impl(Endpoint e) : local{std::move(e)} {}
};

SocketTransport::SocketTransport(Endpoint local)
    : _impl{std::make_unique<Impl>(std::move(local))}
{}

SocketTransport::~SocketTransport()
{
    close();
}

core::Expected<void> SocketTransport::open()
{
    if (_impl->fd >= 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "socket already open");
    }

    _impl->fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::string("socket(): ") + std::strerror(errno));
    }

    const int flags = ::fcntl(_impl->fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(_impl->fd, F_SETFL, flags | O_NONBLOCK) < 0)
    {
        const int err = errno;
        close();
        return core::makeError(core::ErrorCode::kIoError,
                               std::string("fcntl(O_NONBLOCK): ") + std::strerror(err));
    }

    const sockaddr_in addr = toSockaddr(_impl->local);
    if (::bind(_impl->fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0)
    {
        const int err = errno;
        close();
        return core::makeError(core::ErrorCode::kNetworkBindFailed,
                               "bind(" + _impl->local.toString() + "): " + std::strerror(err));
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (::getsockname(_impl->fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) == 0)
    {
        _impl->boundPort = ntohs(bound.sin_port);
    }

    core::Log::info("SocketTransport", "bound to " + _impl->local.host + ":" +
                                       std::to_string(_impl->boundPort));
    return {};
}

void SocketTransport::close()
{
    if (_impl->fd >= 0)
    {
        ::close(_impl->fd);
        _impl->fd = -1;
        _impl->boundPort = 0;
    }
}

bool SocketTransport::isOpen() const noexcept
{
    return _impl->fd >= 0;
}

core::u16 SocketTransport::localPort() const noexcept
{
    return _impl->boundPort;
}

core::Expected<core::usize> SocketTransport::send(
    std::span<const core::byte> data,
    const Endpoint& to)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "socket not open");
    }

    const sockaddr_in addr = toSockaddr(to);
    const auto sent = ::sendto(_impl->fd,
                               data.data(),
                               data.size(),
                               0,
                               reinterpret_cast<const sockaddr*>(&addr),
                               sizeof(addr));

    if (sent < 0)
    {
        return core::makeError(core::ErrorCode::kIoError,
                               std::string("sendto(): ") + std::strerror(errno));
    }

    return static_cast<core::usize>(sent);
}

core::Expected<std::optional<core::usize>> SocketTransport::receive(
    std::span<core::byte> buffer)
{
    if (_impl->fd < 0)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "socket not open");
    }

    // MSG_TRUNC makes recv report the real datagram length even when the
    // buffer is shorter, so oversized datagrams can be told apart.
    const auto received = ::recv(_impl->fd, buffer.data(), buffer.size(), MSG_TRUNC);

    if (received < 0)
    {
        if (errno == EWOULDBLOCK || errno == EAGAIN)
        {
            return std::optional<core::usize>{};
        }
        return core::makeError(core::ErrorCode::kNetworkReceiveFailed,
                               std::string("recv(): ") + std::strerror(errno));
    }

    return std::optional<core::usize>{static_cast<core::usize>(received)};
}

const char* SocketTransport::name() const noexcept
{
    return "SocketTransport";
}

} // namespace pensteer::net::transport
