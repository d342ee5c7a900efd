// tests/readbuf/net_test.cpp
// Tests for TCP sockets: bind, accept, connect, options, and Copy over a stream

#include <gtest/gtest.h>

#include <array>
#include <thread>

#include "readbuf/net.hpp"
#include "test_helpers.hpp"

using namespace readbuf;
using namespace readbuf::test;
using namespace std::chrono_literals;

class NetTest : public ::testing::Test
{
protected:
    net::Socket listener_;
    uint16_t port_ = 0;

    void SetUp() override
    {
        auto listener = net::TcpListener::Bind(net::SocketAddress::V4(0, "127.0.0.1"));
        ASSERT_TRUE(listener.has_value()) << listener.error().message();
        listener_ = std::move(*listener);

        auto local = listener_.LocalAddress();
        ASSERT_TRUE(local.has_value());
        ASSERT_TRUE(local->GetPort().has_value());
        port_ = *local->GetPort();
        ASSERT_NE(port_, 0);
    }

    [[nodiscard]] net::SocketAddress Loopback() const { return net::SocketAddress::V4(port_, "127.0.0.1"); }
};

TEST(SocketAddressTest, V4RoundTrip)
{
    const auto addr = net::SocketAddress::V4(8080, "10.1.2.3");
    EXPECT_EQ(addr.GetIp().value_or(""), "10.1.2.3");
    EXPECT_EQ(addr.GetPort().value_or(0), 8080);
}

TEST(SocketAddressTest, V6Any)
{
    const auto addr = net::SocketAddress::V6(9000);
    EXPECT_EQ(addr.GetIp().value_or(""), "::");
    EXPECT_EQ(addr.GetPort().value_or(0), 9000);
}

TEST(SocketAddressTest, EmptyHasNoIp)
{
    const net::SocketAddress addr;
    EXPECT_FALSE(addr.GetIp().has_value());
    EXPECT_FALSE(addr.GetPort().has_value());
}

TEST_F(NetTest, ConnectAcceptAndExchange)
{
    auto client = net::TcpStream::Connect(Loopback());
    ASSERT_TRUE(client.has_value()) << client.error().message();

    net::SocketAddress peer;
    auto server = net::TcpListener::Accept(listener_, &peer);
    ASSERT_TRUE(server.has_value()) << server.error().message();
    EXPECT_EQ(peer.GetIp().value_or(""), "127.0.0.1");

    ASSERT_TRUE(client->WriteAll(AsBytes("ping")).has_value());

    std::array<UninitByte, 4> storage;
    auto buf = ReadBuf::Uninit(storage);
    ASSERT_TRUE(server->ReadBufExact(buf).has_value());
    EXPECT_EQ(AsString(buf.AsSlices().first), "ping");
}

TEST_F(NetTest, EchoWithCopy)
{
    const auto data = GenerateTestData(50000, 21);

    std::thread echo(
        [this]
        {
            auto conn = net::TcpListener::Accept(listener_);
            if (!conn)
                return;
            auto copied = Copy(*conn, *conn);
            if (copied)
                (void)conn->ShutdownWrite();
        });

    auto client = net::TcpStream::Connect(Loopback());
    ASSERT_TRUE(client.has_value()) << client.error().message();

    // Writer thread so the echo cannot stall on full socket buffers.
    std::thread sender(
        [&]
        {
            (void)client->WriteAll(data);
            (void)client->ShutdownWrite();
        });

    ByteVec received;
    auto n = client->ReadToEnd(received);
    sender.join();
    echo.join();

    ASSERT_TRUE(n.has_value()) << n.error().message();
    EXPECT_EQ(*n, data.size());
    EXPECT_TRUE(SpansEqual(received.Span(), data));
}

TEST_F(NetTest, ApplyOptions)
{
    auto client = net::TcpStream::Connect(Loopback());
    ASSERT_TRUE(client.has_value());

    net::SocketOptions options;
    options.nodelay = true;
    options.recv_buffer = 64 * 1024;
    options.send_buffer = 64 * 1024;
    options.read_timeout = 250ms;
    options.write_timeout = 250ms;
    EXPECT_TRUE(client->Apply(options).has_value());
}

TEST_F(NetTest, ReadTimeoutSurfacesAsError)
{
    auto client = net::TcpStream::Connect(Loopback());
    ASSERT_TRUE(client.has_value());
    auto server = net::TcpListener::Accept(listener_);
    ASSERT_TRUE(server.has_value());

    ASSERT_TRUE(server->SetReadTimeout(50ms).has_value());

    std::array<UninitByte, 16> storage;
    auto buf = ReadBuf::Uninit(storage);
    auto n = server->ReadIntoBuf(buf);
    ASSERT_FALSE(n.has_value());
    EXPECT_TRUE(n.error() == std::errc::resource_unavailable_try_again ||
                n.error() == std::errc::operation_would_block);
    EXPECT_EQ(buf.Initialized(), 0u);
}

TEST_F(NetTest, BindInUseFails)
{
    auto second = net::TcpListener::Bind(net::SocketAddress::V4(port_, "127.0.0.1"));
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), std::errc::address_in_use);
}

TEST(NetErrorTest, ConnectRefused)
{
    // Grab a free port, then close it so nothing listens there.
    uint16_t port = 0;
    {
        auto listener = net::TcpListener::Bind(net::SocketAddress::V4(0, "127.0.0.1"));
        ASSERT_TRUE(listener.has_value());
        port = listener->LocalAddress()->GetPort().value_or(0);
    }
    auto client = net::TcpStream::Connect(net::SocketAddress::V4(port, "127.0.0.1"));
    ASSERT_FALSE(client.has_value());
    EXPECT_EQ(client.error(), std::errc::connection_refused);
}
