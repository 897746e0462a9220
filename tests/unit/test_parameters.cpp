#include "sockcomm/comm/local_channel.hpp"
#include "sockcomm/socket/parameters.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace {

using sockcomm::socket::options;
using sockcomm::socket::parameters;
using sockcomm::socket::protocol;

TEST(parameters_test, from_options_applies_defaults) {
    const auto params = parameters::from_options(options{});
    ASSERT_TRUE(params.has_value()) << params.error().message();

    EXPECT_EQ(params->peer_host, "");
    EXPECT_EQ(params->peer_port, 0);
    EXPECT_EQ(params->local_host, "0.0.0.0");
    EXPECT_EQ(params->local_port, 0);
    EXPECT_EQ(params->proto, protocol::tcp);
    EXPECT_FALSE(params->server);
    EXPECT_TRUE(params->context.empty());
    EXPECT_EQ(params->channel, sockcomm::comm::local_channel::instance());
}

TEST(parameters_test, from_options_copies_every_field) {
    options opts;
    opts.peer_host = "192.0.2.10";
    opts.peer_port = 8443;
    opts.local_host = "192.0.2.1";
    opts.local_port = 5555;
    opts.proto = "UDP";
    opts.server = true;
    opts.context["Owner"] = "scanner";

    const auto params = parameters::from_options(opts);
    ASSERT_TRUE(params.has_value()) << params.error().message();

    EXPECT_EQ(params->peer_host, "192.0.2.10");
    EXPECT_EQ(params->peer_port, 8443);
    EXPECT_EQ(params->local_host, "192.0.2.1");
    EXPECT_EQ(params->local_port, 5555);
    EXPECT_EQ(params->proto, protocol::udp);
    EXPECT_TRUE(params->is_udp());
    EXPECT_TRUE(params->server);
    EXPECT_EQ(params->context.at("Owner"), "scanner");
}

TEST(parameters_test, empty_local_host_keeps_any_address) {
    options opts;
    opts.local_host = "";

    const auto params = parameters::from_options(opts);
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->local_host, "0.0.0.0");
}

TEST(parameters_test, unknown_protocol_is_rejected) {
    options opts;
    opts.proto = "sctp";

    const auto params = parameters::from_options(opts);
    ASSERT_FALSE(params.has_value());
    EXPECT_EQ(params.error().value(), EINVAL);
}

TEST(parameters_test, protocol_names_round_trip) {
    EXPECT_EQ(sockcomm::socket::to_string(protocol::tcp), "tcp");
    EXPECT_EQ(sockcomm::socket::to_string(protocol::udp), "udp");
    EXPECT_EQ(sockcomm::socket::parse_protocol("Tcp").value(), protocol::tcp);
    EXPECT_EQ(sockcomm::socket::parse_protocol("udp").value(), protocol::udp);
}

TEST(options_test, from_map_reads_recognized_keys) {
    const std::map<std::string, std::string> values{
        {"PeerHost", "example.test"},
        {"PeerPort", "80"},
        {"LocalHost", "127.0.0.1"},
        {"LocalPort", "0"},
        {"Proto", "tcp"},
        {"Server", "TRUE"},
        {"Context.Module", "http_probe"},
    };

    const auto opts = options::from_map(values);
    ASSERT_TRUE(opts.has_value()) << opts.error().message();

    EXPECT_EQ(opts->peer_host, "example.test");
    EXPECT_EQ(opts->peer_port, 80);
    EXPECT_EQ(opts->local_host, "127.0.0.1");
    EXPECT_EQ(opts->local_port, 0);
    EXPECT_EQ(opts->proto, "tcp");
    EXPECT_EQ(opts->server, true);
    EXPECT_EQ(opts->context.at("Module"), "http_probe");
    EXPECT_FALSE(opts->channel);
}

TEST(options_test, from_map_rejects_bad_ports) {
    EXPECT_FALSE(options::from_map({{"PeerPort", "65536"}}).has_value());
    EXPECT_FALSE(options::from_map({{"PeerPort", "-1"}}).has_value());
    EXPECT_FALSE(options::from_map({{"LocalPort", ""}}).has_value());
    EXPECT_TRUE(options::from_map({{"LocalPort", "65535"}}).has_value());
}

TEST(options_test, from_map_rejects_unknown_keys_and_flags) {
    const auto unknown = options::from_map({{"Retries", "3"}});
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().value(), EINVAL);

    EXPECT_FALSE(options::from_map({{"Server", "maybe"}}).has_value());
    EXPECT_FALSE(options::from_map({{"Context.", "x"}}).has_value());
}

} // namespace
