#include "readbuf/net.hpp"

#include <cerrno>
#include <cstring>

#include <netinet/tcp.h>

#include "readbuf/logger.hpp"

namespace readbuf::net
{

namespace
{
Result<> SetIntOption(int fd, int level, int name, int value)
{
    if (::setsockopt(fd, level, name, &value, sizeof(value)) < 0)
        return ErrorFromErrno(errno);
    return {};
}

Result<> SetTimeoutOption(int fd, int name, std::chrono::milliseconds timeout)
{
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(timeout);
    const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout - secs);
    timeval tv{.tv_sec = static_cast<time_t>(secs.count()), .tv_usec = static_cast<suseconds_t>(usecs.count())};
    if (::setsockopt(fd, SOL_SOCKET, name, &tv, sizeof(tv)) < 0)
        return ErrorFromErrno(errno);
    return {};
}
}  // namespace

// ----------------------------------------------------------------------------
// SocketAddress Implementation
// ----------------------------------------------------------------------------

SocketAddress SocketAddress::V4(uint16_t port, const char* ip)
{
    SocketAddress sa;
    auto* in = reinterpret_cast<sockaddr_in*>(&sa.addr);
    in->sin_family = AF_INET;
    in->sin_port = htons(port);
    if (ip && *ip)
    {
        inet_pton(AF_INET, ip, &in->sin_addr);
    }
    else
    {
        in->sin_addr.s_addr = INADDR_ANY;
    }
    sa.addrlen = sizeof(sockaddr_in);
    return sa;
}

SocketAddress SocketAddress::V6(uint16_t port, const char* ip)
{
    SocketAddress sa;
    auto* in6 = reinterpret_cast<sockaddr_in6*>(&sa.addr);
    in6->sin6_family = AF_INET6;
    in6->sin6_port = htons(port);
    if (ip && *ip)
    {
        inet_pton(AF_INET6, ip, &in6->sin6_addr);
    }
    else
    {
        in6->sin6_addr = in6addr_any;
    }
    sa.addrlen = sizeof(sockaddr_in6);
    return sa;
}

std::optional<std::string> SocketAddress::GetIp() const
{
    char buffer[INET6_ADDRSTRLEN];
    if (addr.ss_family == AF_INET)
    {
        const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
        if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)))
        {
            return std::string(buffer);
        }
    }
    else if (addr.ss_family == AF_INET6)
    {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)))
        {
            return std::string(buffer);
        }
    }
    return std::nullopt;
}

std::optional<uint16_t> SocketAddress::GetPort() const
{
    if (addr.ss_family == AF_INET)
    {
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6)
    {
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Socket Implementation
// ----------------------------------------------------------------------------

Result<std::pair<Socket, Socket>> Socket::Pair()
{
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0)
    {
        return ErrorFromErrno(errno);
    }
    return std::pair{Socket(fds[0]), Socket(fds[1])};
}

Result<> Socket::SetNodelay(bool enable) const
{
    return SetIntOption(Get(), IPPROTO_TCP, TCP_NODELAY, enable ? 1 : 0);
}

Result<> Socket::SetReuseAddr(bool enable) const
{
    return SetIntOption(Get(), SOL_SOCKET, SO_REUSEADDR, enable ? 1 : 0);
}

Result<> Socket::SetRecvBuffer(int size) const
{
    return SetIntOption(Get(), SOL_SOCKET, SO_RCVBUF, size);
}

Result<> Socket::SetSendBuffer(int size) const
{
    return SetIntOption(Get(), SOL_SOCKET, SO_SNDBUF, size);
}

Result<> Socket::SetReadTimeout(std::chrono::milliseconds timeout) const
{
    return SetTimeoutOption(Get(), SO_RCVTIMEO, timeout);
}

Result<> Socket::SetWriteTimeout(std::chrono::milliseconds timeout) const
{
    return SetTimeoutOption(Get(), SO_SNDTIMEO, timeout);
}

Result<> Socket::Apply(const SocketOptions& options) const
{
    if (options.nodelay)
        READBUF_TRY(SetNodelay(true));
    if (options.recv_buffer)
        READBUF_TRY(SetRecvBuffer(*options.recv_buffer));
    if (options.send_buffer)
        READBUF_TRY(SetSendBuffer(*options.send_buffer));
    if (options.read_timeout)
        READBUF_TRY(SetReadTimeout(*options.read_timeout));
    if (options.write_timeout)
        READBUF_TRY(SetWriteTimeout(*options.write_timeout));
    return {};
}

Result<> Socket::ShutdownWrite() const
{
    if (::shutdown(Get(), SHUT_WR) < 0)
        return ErrorFromErrno(errno);
    return {};
}

Result<SocketAddress> Socket::LocalAddress() const
{
    SocketAddress out;
    if (::getsockname(Get(), out.GetMutable(), &out.addrlen) < 0)
        return ErrorFromErrno(errno);
    return out;
}

// ----------------------------------------------------------------------------
// TcpListener / TcpStream Implementation
// ----------------------------------------------------------------------------

Result<Socket> TcpListener::Bind(const SocketAddress& addr, int backlog)
{
    const int fd = ::socket(addr.addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        const int err = errno;
        READBUF_LOG_ERROR("socket failed: {}", std::strerror(err));
        return ErrorFromErrno(err);
    }

    Socket sock(fd);

    if (auto r = sock.SetReuseAddr(); !r)
    {
        return std::unexpected(r.error());
    }

    if (::bind(fd, addr.Get(), addr.addrlen) < 0)
    {
        const int err = errno;
        READBUF_LOG_ERROR("bind to port {} failed: {}", addr.GetPort().value_or(0), std::strerror(err));
        return ErrorFromErrno(err);
    }

    if (::listen(fd, backlog) < 0)
    {
        return ErrorFromErrno(errno);
    }

    READBUF_LOG_DEBUG("listening on fd {}", fd);
    return sock;
}

Result<Socket> TcpListener::Bind(uint16_t port)
{
    return Bind(SocketAddress::V4(port));
}

Result<Socket> TcpListener::Accept(const Socket& listener, SocketAddress* peer)
{
    SocketAddress client;
    int fd;
    do
    {
        client.addrlen = sizeof(client.addr);
        fd = ::accept4(listener.Get(), client.GetMutable(), &client.addrlen, SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0)
    {
        return ErrorFromErrno(errno);
    }

    READBUF_LOG_DEBUG("accepted fd {} from {}:{}", fd, client.GetIp().value_or("?"), client.GetPort().value_or(0));
    if (peer)
    {
        *peer = client;
    }
    return Socket(fd);
}

Result<Socket> TcpStream::Connect(const SocketAddress& addr)
{
    const int fd = ::socket(addr.addr.ss_family, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        return ErrorFromErrno(errno);
    }

    Socket sock(fd);
    if (::connect(fd, addr.Get(), addr.addrlen) < 0)
    {
        const int err = errno;
        READBUF_LOG_DEBUG("connect to port {} failed: {}", addr.GetPort().value_or(0), std::strerror(err));
        return ErrorFromErrno(err);
    }
    return sock;
}

}  // namespace readbuf::net
