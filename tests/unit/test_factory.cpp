#include "sockcomm/comm/channel.hpp"
#include "sockcomm/socket/factory.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <memory>
#include <optional>

namespace {

using sockcomm::socket::factory;
using sockcomm::socket::options;
using sockcomm::socket::parameters;
using sockcomm::socket::protocol;
using sockcomm::socket::socket_handle;

class recorded_handle final : public socket_handle {
public:
    explicit recorded_handle(const parameters& params)
        : socket_handle(sockcomm::unique_fd{}) {
        initsock(params);
    }
};

class recording_channel final : public sockcomm::comm::channel {
public:
    sockcomm::result<std::unique_ptr<socket_handle>>
    create(const parameters& params) override {
        ++calls;
        last = params;
        last.channel.reset();
        if (failure.has_value()) {
            return sockcomm::err<std::unique_ptr<socket_handle>>(*failure);
        }
        return std::make_unique<recorded_handle>(params);
    }

    int calls{0};
    parameters last;
    std::optional<sockcomm::error> failure;
};

options routed_to(const std::shared_ptr<recording_channel>& channel) {
    options opts;
    opts.peer_host = "198.51.100.4";
    opts.peer_port = 4444;
    opts.channel = channel;
    return opts;
}

TEST(factory_test, create_dispatches_to_injected_channel) {
    auto channel = std::make_shared<recording_channel>();
    auto opts = routed_to(channel);
    opts.context["Session"] = "7";

    const auto created = factory::create(opts);
    ASSERT_TRUE(created.has_value()) << created.error().message();
    EXPECT_EQ(channel->calls, 1);

    EXPECT_EQ(channel->last.peer_host, "198.51.100.4");
    EXPECT_EQ(channel->last.peer_port, 4444);
    EXPECT_EQ(channel->last.local_host, "0.0.0.0");
    EXPECT_EQ(channel->last.proto, protocol::tcp);
    EXPECT_FALSE(channel->last.server);

    const auto& handle = created.value();
    EXPECT_EQ(handle->peerhost(), "198.51.100.4");
    EXPECT_EQ(handle->peerport(), 4444);
    EXPECT_EQ(handle->localhost(), "0.0.0.0");
    EXPECT_EQ(handle->localport(), 0);
    EXPECT_EQ(handle->context().at("Session"), "7");
}

TEST(factory_test, create_tcp_forces_tcp) {
    auto channel = std::make_shared<recording_channel>();
    auto opts = routed_to(channel);
    opts.proto = "udp";

    ASSERT_TRUE(factory::create_tcp(opts).has_value());
    EXPECT_EQ(channel->last.proto, protocol::tcp);
    EXPECT_FALSE(channel->last.server);
}

TEST(factory_test, create_udp_forces_udp) {
    auto channel = std::make_shared<recording_channel>();

    ASSERT_TRUE(factory::create_udp(routed_to(channel)).has_value());
    EXPECT_EQ(channel->last.proto, protocol::udp);
}

TEST(factory_test, create_tcp_server_forces_tcp_and_server) {
    auto channel = std::make_shared<recording_channel>();
    auto opts = routed_to(channel);
    opts.proto = "udp";
    opts.server = false;

    ASSERT_TRUE(factory::create_tcp_server(opts).has_value());
    EXPECT_EQ(channel->last.proto, protocol::tcp);
    EXPECT_TRUE(channel->last.server);
}

TEST(factory_test, channel_failure_propagates_unchanged) {
    auto channel = std::make_shared<recording_channel>();
    channel->failure = sockcomm::make_error_from_errno(ECONNREFUSED);

    const auto created = factory::create_tcp(routed_to(channel));
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().code(),
              sockcomm::make_error_from_errno(ECONNREFUSED).code());
    EXPECT_EQ(channel->calls, 1);
}

TEST(factory_test, create_param_without_channel_is_routing_error) {
    parameters params;
    params.peer_host = "203.0.113.9";
    params.peer_port = 22;

    const auto created = factory::create_param(params);
    ASSERT_FALSE(created.has_value());
    EXPECT_TRUE(created.error().is(sockcomm::errc::routing_error));
}

TEST(factory_test, invalid_options_never_reach_channel) {
    auto channel = std::make_shared<recording_channel>();
    auto opts = routed_to(channel);
    opts.proto = "raw";

    const auto created = factory::create(opts);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().value(), EINVAL);
    EXPECT_EQ(channel->calls, 0);
}

TEST(socket_handle_test, base_type_name_is_not_supported) {
    const recorded_handle handle{parameters{}};

    const auto name = handle.type_name();
    ASSERT_FALSE(name.has_value());
    EXPECT_TRUE(name.error().is(sockcomm::errc::not_supported));
}

TEST(socket_handle_test, name_queries_on_empty_handle_report_ebadf) {
    const recorded_handle handle{parameters{}};
    EXPECT_FALSE(handle.valid());

    const auto local = handle.getsockname();
    ASSERT_FALSE(local.has_value());
    EXPECT_EQ(local.error().value(), EBADF);

    const auto peer = handle.getpeername();
    ASSERT_FALSE(peer.has_value());
    EXPECT_EQ(peer.error().value(), EBADF);
}

} // namespace
