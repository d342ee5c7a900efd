// examples/readbuf/02_echo_server.cpp
// Demonstrates: TcpListener, Accept, SocketOptions, Copy(socket, socket)
//
// Serves one connection at a time; each is echoed until the peer half-closes.

#include <chrono>

#include <gflags/gflags.h>

#include "readbuf/logger.hpp"
#include "readbuf/net.hpp"
#include "readbuf/read.hpp"

DEFINE_uint32(port, 8080, "Port to listen on");
DEFINE_string(bind, "0.0.0.0", "Address to bind");
DEFINE_bool(nodelay, true, "Set TCP_NODELAY on accepted connections");
DEFINE_int32(read_timeout_ms, 0, "Receive timeout per connection, 0 to disable");
DEFINE_string(log_level, "info", "debug, info, warn, error, critical or off");

using namespace readbuf;

namespace
{
void Serve(net::Socket conn, const net::SocketAddress& peer, const net::SocketOptions& options)
{
    const auto ip = peer.GetIp().value_or("?");
    const auto port = peer.GetPort().value_or(0);

    if (auto r = conn.Apply(options); !r)
    {
        READBUF_LOG_WARN("{}:{}: could not apply socket options: {}", ip, port, r.error().message());
    }

    auto copied = Copy(conn, conn);
    if (!copied)
    {
        READBUF_LOG_WARN("{}:{}: echo aborted: {}", ip, port, copied.error().message());
        return;
    }

    if (auto r = conn.ShutdownWrite(); !r)
    {
        READBUF_LOG_DEBUG("{}:{}: shutdown failed: {}", ip, port, r.error().message());
    }
    READBUF_LOG_INFO("{}:{}: echoed {} bytes", ip, port, *copied);
}
}  // namespace

int main(int argc, char** argv)
{
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    const auto level = log::ParseLevel(FLAGS_log_level);
    if (!level)
    {
        READBUF_LOG_ERROR("Unknown log level: {}", FLAGS_log_level);
        return 2;
    }
    log::SetLevel(*level);

    auto listener = net::TcpListener::Bind(net::SocketAddress::V4(static_cast<uint16_t>(FLAGS_port), FLAGS_bind.c_str()));
    if (!listener)
    {
        READBUF_LOG_ERROR("Failed to listen on {}:{}: {}", FLAGS_bind, FLAGS_port, listener.error().message());
        return 1;
    }

    net::SocketOptions options;
    options.nodelay = FLAGS_nodelay;
    if (FLAGS_read_timeout_ms > 0)
    {
        options.read_timeout = std::chrono::milliseconds(FLAGS_read_timeout_ms);
    }

    READBUF_LOG_INFO("Echo server listening on {}:{}", FLAGS_bind, FLAGS_port);

    while (true)
    {
        net::SocketAddress peer;
        auto conn = net::TcpListener::Accept(*listener, &peer);
        if (!conn)
        {
            READBUF_LOG_ERROR("accept failed: {}", conn.error().message());
            continue;
        }
        Serve(std::move(*conn), peer, options);
    }
}
