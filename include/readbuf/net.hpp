#pragma once
////////////////////////////////////////////////////////////////////////////////
// Blocking sockets
//
// Socket is a FileDesc, so it inherits the read(2)/readv(2) paths that fill
// uninitialized buffers directly. Everything here blocks; timeouts are the
// kernel's SO_RCVTIMEO / SO_SNDTIMEO, set through SocketOptions.
////////////////////////////////////////////////////////////////////////////////

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <sys/socket.h>

#include <arpa/inet.h>
#include <netinet/in.h>

#include "readbuf/fd.hpp"
#include "readbuf/result.hpp"

namespace readbuf::net
{

////////////////////////////////////////////////////////////////////////////////
// SocketAddress - IPv4/IPv6 wrapper, data only
////////////////////////////////////////////////////////////////////////////////

/// @brief Wrapper for sockaddr_storage supporting both IPv4 and IPv6.
///
/// @code
///   auto any = SocketAddress::V4(8080);                // 0.0.0.0:8080
///   auto local = SocketAddress::V4(8080, "127.0.0.1");
/// @endcode
struct SocketAddress
{
    sockaddr_storage addr{};
    socklen_t addrlen = sizeof(sockaddr_storage);

    SocketAddress() = default;

    /// @brief Creates an IPv4 address. Pass nullptr for INADDR_ANY.
    static SocketAddress V4(uint16_t port, const char* ip = nullptr);

    /// @brief Creates an IPv6 address. Pass nullptr for in6addr_any.
    static SocketAddress V6(uint16_t port, const char* ip = nullptr);

    [[nodiscard]] const sockaddr* Get() const { return reinterpret_cast<const sockaddr*>(&addr); }
    [[nodiscard]] sockaddr* GetMutable() { return reinterpret_cast<sockaddr*>(&addr); }

    [[nodiscard]] std::optional<std::string> GetIp() const;

    /// @brief Port in host byte order.
    [[nodiscard]] std::optional<uint16_t> GetPort() const;
};

/// @brief Per-socket settings applied by Socket::Apply(). Unset fields are left alone.
struct SocketOptions
{
    bool nodelay = false;
    std::optional<int> recv_buffer;
    std::optional<int> send_buffer;
    std::optional<std::chrono::milliseconds> read_timeout;
    std::optional<std::chrono::milliseconds> write_timeout;
};

////////////////////////////////////////////////////////////////////////////////
// Socket
////////////////////////////////////////////////////////////////////////////////

/// @brief RAII socket. Closes on destruction; move-only.
class Socket : public FileDesc
{
public:
    using FileDesc::FileDesc;

    /// @brief A connected AF_UNIX stream pair.
    static Result<std::pair<Socket, Socket>> Pair();

    /// @brief Enables/disables TCP_NODELAY (Nagle's algorithm).
    Result<> SetNodelay(bool enable = true) const;

    Result<> SetReuseAddr(bool enable = true) const;

    /// @brief Sets SO_RCVBUF.
    Result<> SetRecvBuffer(int size) const;

    /// @brief Sets SO_SNDBUF.
    Result<> SetSendBuffer(int size) const;

    /// @brief Sets SO_RCVTIMEO. A blocked read then fails with EAGAIN after `timeout`.
    Result<> SetReadTimeout(std::chrono::milliseconds timeout) const;

    /// @brief Sets SO_SNDTIMEO.
    Result<> SetWriteTimeout(std::chrono::milliseconds timeout) const;

    /// @brief Applies every set field of `options`, stopping at the first failure.
    Result<> Apply(const SocketOptions& options) const;

    /// @brief shutdown(2) of the write side; the peer then reads end of stream.
    Result<> ShutdownWrite() const;

    /// @brief getsockname(2).
    [[nodiscard]] Result<SocketAddress> LocalAddress() const;
};

////////////////////////////////////////////////////////////////////////////////
// TcpListener / TcpStream - factories for TCP sockets
////////////////////////////////////////////////////////////////////////////////

struct TcpListener
{
    /// @brief Creates a blocking listening socket with SO_REUSEADDR set.
    /// @param addr Address to bind; port 0 picks an ephemeral port (see Socket::LocalAddress).
    static Result<Socket> Bind(const SocketAddress& addr, int backlog = 128);

    /// @brief Binds to all IPv4 interfaces on `port`.
    static Result<Socket> Bind(uint16_t port);

    /// @brief Blocks until a client connects.
    /// @param peer Receives the client address when non-null.
    static Result<Socket> Accept(const Socket& listener, SocketAddress* peer = nullptr);
};

struct TcpStream
{
    /// @brief Blocking connect(2) to `addr`.
    static Result<Socket> Connect(const SocketAddress& addr);
};

}  // namespace readbuf::net
