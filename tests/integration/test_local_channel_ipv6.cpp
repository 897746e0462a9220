#include "sockcomm/socket/factory.hpp"
#include "sockcomm/socket/shim.hpp"
#include "sockcomm/socket/tcp.hpp"
#include "sockcomm/socket/udp.hpp"

#include <array>
#include <cerrno>
#include <cstdint>
#include <gtest/gtest.h>
#include <memory>
#include <span>
#include <string_view>

namespace {

using sockcomm::socket::factory;
using sockcomm::socket::options;
using sockcomm::socket::tcp_server_socket;
using sockcomm::socket::tcp_socket;
using sockcomm::socket::udp_socket;

constexpr std::string_view verbose_loopback =
    "0000:0000:0000:0000:0000:0000:0000:0001";

// Hosts without an IPv6 loopback cannot run these cases.
bool ipv6_loopback_available() {
    options opts;
    opts.local_host = "::1";
    const auto probe = factory::create_udp(opts);
    if (probe.has_value()) {
        return true;
    }
    const int value = probe.error().value();
    return value != EADDRNOTAVAIL && value != EAFNOSUPPORT;
}

// Ephemeral UDP port that was free on ::1 a moment ago.
std::uint16_t unused_udp_port() {
    options opts;
    opts.local_host = "::1";
    auto created = factory::create_udp(opts);
    if (!created.has_value()) {
        ADD_FAILURE() << created.error().message();
        return 0;
    }
    const auto port = created.value()->localport();
    static_cast<void>(created.value()->close());
    return port;
}

TEST(local_channel_ipv6_test, tcp_pair_on_loopback_reports_verbose_hosts) {
    if (!ipv6_loopback_available()) {
        GTEST_SKIP() << "no IPv6 loopback";
    }

    options listen_opts;
    listen_opts.local_host = "::1";
    auto listener_created = factory::create_tcp_server(listen_opts);
    ASSERT_TRUE(listener_created.has_value())
        << listener_created.error().message();
    auto* listener = dynamic_cast<tcp_server_socket*>(listener_created->get());
    ASSERT_NE(listener, nullptr);
    EXPECT_EQ(listener->localhost(), verbose_loopback);
    EXPECT_NE(listener->localport(), 0);

    const auto local = listener->getsockname();
    ASSERT_TRUE(local.has_value()) << local.error().message();
    EXPECT_EQ(local->family, sockcomm::addr::family_ipv6);

    options opts;
    opts.peer_host = "::1";
    opts.peer_port = listener->localport();
    auto client_created = factory::create_tcp(opts);
    ASSERT_TRUE(client_created.has_value())
        << client_created.error().message();
    auto* client = dynamic_cast<tcp_socket*>(client_created->get());
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->peerhost(), verbose_loopback);
    EXPECT_EQ(client->peerport(), listener->localport());
    EXPECT_EQ(client->localhost(), verbose_loopback);

    auto accepted = listener->accept();
    ASSERT_TRUE(accepted.has_value()) << accepted.error().message();
    EXPECT_EQ(accepted.value()->peerhost(), verbose_loopback);
    EXPECT_EQ(accepted.value()->peerport(), client->localport());

    const std::array<std::byte, 2> request{static_cast<std::byte>('v'),
                                           static_cast<std::byte>('6')};
    ASSERT_TRUE(sockcomm::socket::write_all(
                    *client, std::span<const std::byte>{request})
                    .has_value());
    std::array<std::byte, 2> inbound{};
    ASSERT_TRUE(sockcomm::socket::read_exact(*accepted.value(),
                                             std::span<std::byte>{inbound})
                    .has_value());
    EXPECT_EQ(inbound, request);
}

TEST(local_channel_ipv6_test, udp_exchange_on_loopback) {
    if (!ipv6_loopback_available()) {
        GTEST_SKIP() << "no IPv6 loopback";
    }

    options server_opts;
    server_opts.local_host = "::1";
    auto server_created = factory::create_udp(server_opts);
    ASSERT_TRUE(server_created.has_value())
        << server_created.error().message();
    auto* server = dynamic_cast<udp_socket*>(server_created->get());
    ASSERT_NE(server, nullptr);
    EXPECT_EQ(server->localhost(), verbose_loopback);

    options client_opts;
    client_opts.peer_host = "::1";
    client_opts.peer_port = server->localport();
    auto client_created = factory::create_udp(client_opts);
    ASSERT_TRUE(client_created.has_value())
        << client_created.error().message();
    auto* client = dynamic_cast<udp_socket*>(client_created->get());
    ASSERT_NE(client, nullptr);
    EXPECT_EQ(client->peerhost(), verbose_loopback);

    const std::array<std::byte, 3> payload{static_cast<std::byte>('a'),
                                           static_cast<std::byte>('b'),
                                           static_cast<std::byte>('c')};
    const auto sent = client->send(std::span<const std::byte>{payload});
    ASSERT_TRUE(sent.has_value()) << sent.error().message();

    std::array<std::byte, 16> inbound{};
    const auto received = server->recv_from(std::span<std::byte>{inbound});
    ASSERT_TRUE(received.has_value()) << received.error().message();
    EXPECT_EQ(received->size, payload.size());
    EXPECT_EQ(received->from.family, sockcomm::addr::family_ipv6);
    EXPECT_EQ(received->from.host, verbose_loopback);
    EXPECT_EQ(received->from.port, client->localport());
}

TEST(local_channel_ipv6_test, default_local_host_binds_ipv6_any_for_ipv6_peer) {
    if (!ipv6_loopback_available()) {
        GTEST_SKIP() << "no IPv6 loopback";
    }

    const auto local_port = unused_udp_port();
    ASSERT_NE(local_port, 0);

    options opts;
    opts.peer_host = "::1";
    opts.peer_port = 9;
    opts.local_port = local_port;
    auto created = factory::create_udp(opts);
    ASSERT_TRUE(created.has_value()) << created.error().message();

    const auto& socket = created.value();
    EXPECT_EQ(socket->localport(), local_port);
    EXPECT_EQ(socket->localhost(), verbose_loopback);

    const auto local = socket->getlocalname();
    ASSERT_TRUE(local.has_value()) << local.error().message();
    EXPECT_EQ(local->family, sockcomm::addr::family_ipv6);
    EXPECT_EQ(local->port, local_port);
}

TEST(local_channel_ipv6_test, source_address_toward_ipv6_loopback) {
    if (!ipv6_loopback_available()) {
        GTEST_SKIP() << "no IPv6 loopback";
    }

    const auto detected = sockcomm::socket::try_source_address("::1");
    ASSERT_TRUE(detected.has_value()) << detected.error().message();
    EXPECT_EQ(detected.value(), verbose_loopback);
}

} // namespace
