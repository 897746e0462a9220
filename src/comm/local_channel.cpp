#include "sockcomm/comm/local_channel.hpp"

#include "sockcomm/addr/codec.hpp"
#include "sockcomm/core/log.hpp"
#include "sockcomm/socket/tcp.hpp"
#include "sockcomm/socket/udp.hpp"

#include <cerrno>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::comm {

namespace {

using socket::parameters;
using handle_result = result<std::unique_ptr<socket::socket_handle>>;

struct native_endpoint {
    sockaddr_storage storage{};
    socklen_t length{};
    int family{};
    std::string text;

    [[nodiscard]] const sockaddr* get() const noexcept {
        return reinterpret_cast<const sockaddr*>(&storage);
    }
};

bool is_any_host(std::string_view host) noexcept {
    return host.empty() || host == "0.0.0.0" || host == "::";
}

bool wants_local_bind(const parameters& params) noexcept {
    return params.local_port != 0 || !is_any_host(params.local_host);
}

std::string describe(std::string_view host, std::uint16_t port) {
    std::string text{host};
    text.push_back(':');
    text.append(std::to_string(port));
    return text;
}

handle_result fail(std::string_view step, const std::string& target,
                   error failure) {
    std::string message{"local channel: "};
    message.append(step);
    message.append(" ");
    message.append(target);
    message.append(" failed: ");
    message.append(failure.message());
    default_logger().debug(message);
    return err<std::unique_ptr<socket::socket_handle>>(failure);
}

result<native_endpoint> native_from(std::string_view host, std::uint16_t port) {
    const auto bytes = addr::to_sockaddr(host, port);
    if (!bytes.has_value()) {
        return err<native_endpoint>(bytes.error());
    }

    native_endpoint endpoint;
    std::memcpy(&endpoint.storage, bytes->data(), bytes->size());
    endpoint.length = static_cast<socklen_t>(bytes->size());
    endpoint.family = endpoint.storage.ss_family;
    endpoint.text = describe(host, port);
    return endpoint;
}

// The default any-address is IPv4; an IPv6 socket needs "::" instead.
result<native_endpoint> local_endpoint_for(int family,
                                           const parameters& params) {
    if (family == addr::family_ipv6 && params.local_host == "0.0.0.0") {
        return native_from("::", params.local_port);
    }
    return native_from(params.local_host, params.local_port);
}

result<unique_fd> open_socket(int family, int type) {
    const int fd = ::socket(family, type | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return err<unique_fd>(error::from_errno());
    }
    return unique_fd{fd};
}

result<void> bind_to(const unique_fd& fd, const native_endpoint& local) {
    if (::bind(fd.get(), local.get(), local.length) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

result<void> connect_to(const unique_fd& fd, const native_endpoint& remote) {
    if (::connect(fd.get(), remote.get(), remote.length) != 0) {
        return err<void>(error::from_errno());
    }
    return ok();
}

handle_result create_tcp_client(const parameters& params) {
    const auto target = describe(params.peer_host, params.peer_port);
    const auto remote = native_from(params.peer_host, params.peer_port);
    if (!remote.has_value()) {
        return fail("resolve", target, remote.error());
    }

    auto fd = open_socket(remote->family, SOCK_STREAM);
    if (!fd.has_value()) {
        return fail("socket for", target, fd.error());
    }

    if (wants_local_bind(params)) {
        const auto local = local_endpoint_for(remote->family, params);
        if (!local.has_value()) {
            return fail("resolve", describe(params.local_host, params.local_port),
                        local.error());
        }
        if (const auto bound = bind_to(fd.value(), local.value());
            !bound.has_value()) {
            return fail("bind", local->text, bound.error());
        }
    }

    if (const auto connected = connect_to(fd.value(), remote.value());
        !connected.has_value()) {
        return fail("connect to", target, connected.error());
    }

    return std::make_unique<socket::tcp_socket>(std::move(fd.value()), params);
}

handle_result create_tcp_server(const parameters& params) {
    const auto local = native_from(params.local_host, params.local_port);
    const auto target = describe(params.local_host, params.local_port);
    if (!local.has_value()) {
        return fail("resolve", target, local.error());
    }

    auto fd = open_socket(local->family, SOCK_STREAM);
    if (!fd.has_value()) {
        return fail("socket for", target, fd.error());
    }

    int enabled = 1;
    if (::setsockopt(fd->get(), SOL_SOCKET, SO_REUSEADDR, &enabled,
                     sizeof(enabled)) != 0) {
        return fail("SO_REUSEADDR on", target, error::from_errno());
    }

    if (const auto bound = bind_to(fd.value(), local.value());
        !bound.has_value()) {
        return fail("bind", target, bound.error());
    }

    if (::listen(fd->get(), local_channel::listen_backlog) != 0) {
        return fail("listen on", target, error::from_errno());
    }

    return std::make_unique<socket::tcp_server_socket>(std::move(fd.value()),
                                                       params);
}

handle_result create_udp(const parameters& params) {
    const bool has_peer = !params.peer_host.empty();

    std::optional<native_endpoint> remote;
    int family = addr::family_ipv4;
    if (has_peer) {
        auto resolved = native_from(params.peer_host, params.peer_port);
        if (!resolved.has_value()) {
            return fail("resolve", describe(params.peer_host, params.peer_port),
                        resolved.error());
        }
        remote = std::move(resolved.value());
        family = remote->family;
    }

    const auto local = local_endpoint_for(family, params);
    if (!local.has_value()) {
        return fail("resolve", describe(params.local_host, params.local_port),
                    local.error());
    }
    if (!has_peer) {
        family = local->family;
    }

    auto fd = open_socket(family, SOCK_DGRAM);
    if (!fd.has_value()) {
        return fail("socket for", local->text, fd.error());
    }

    if (wants_local_bind(params) || !has_peer) {
        if (const auto bound = bind_to(fd.value(), local.value());
            !bound.has_value()) {
            return fail("bind", local->text, bound.error());
        }
    }

    if (remote.has_value()) {
        if (const auto connected = connect_to(fd.value(), remote.value());
            !connected.has_value()) {
            return fail("connect to", remote->text, connected.error());
        }
    }

    return std::make_unique<socket::udp_socket>(std::move(fd.value()), params);
}

} // namespace

handle_result local_channel::create(const parameters& params) {
    default_logger().debug(
        std::string{"local channel: creating "} +
        std::string{socket::to_string(params.proto)} +
        (params.is_tcp() && params.server ? " server" : "") + " socket");

    if (params.is_udp()) {
        return create_udp(params);
    }
    if (params.server) {
        return create_tcp_server(params);
    }
    return create_tcp_client(params);
}

std::shared_ptr<local_channel> local_channel::instance() {
    static const auto shared = std::make_shared<local_channel>();
    return shared;
}

} // namespace sockcomm::comm
