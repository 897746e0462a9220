#include "sockcomm/socket/shim.hpp"

#include "sockcomm/core/log.hpp"
#include "sockcomm/socket/factory.hpp"
#include "sockcomm/socket/tcp.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::socket {

namespace {

bool pair_unavailable(int value) noexcept {
    return value == EAFNOSUPPORT || value == EOPNOTSUPP || value == ENOSYS ||
           value == EPROTONOSUPPORT;
}

} // namespace

result<std::string> try_source_address(std::string_view dest) {
    options probe;
    probe.peer_host = std::string{dest};
    probe.peer_port = probe_port;

    auto created = factory::create_udp(std::move(probe));
    if (!created.has_value()) {
        return err<std::string>(created.error());
    }

    const auto& handle = created.value();
    auto local = handle->getsockname();
    if (!local.has_value()) {
        return err<std::string>(local.error());
    }

    if (const auto closed = handle->close(); !closed.has_value()) {
        return err<std::string>(closed.error());
    }
    return std::move(local->host);
}

std::string source_address(std::string_view dest) {
    auto detected = try_source_address(dest);
    if (detected.has_value()) {
        return std::move(detected.value());
    }

    default_logger().debug("source address for " + std::string{dest} +
                           " unavailable (" + detected.error().message() +
                           "), using loopback");
    return std::string{fallback_source_address};
}

result<socket_pair_fds> socket_pair() {
    int fds[2] = {-1, -1};
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == 0) {
        return socket_pair_fds{.first = unique_fd{fds[0]},
                               .second = unique_fd{fds[1]}};
    }

    const int failure = errno;
    if (!pair_unavailable(failure)) {
        return err<socket_pair_fds>(make_error_from_errno(failure));
    }

    default_logger().warning("socketpair unavailable (" +
                             make_error_from_errno(failure).message() +
                             "), emulating over loopback tcp");
    return emulated_socket_pair();
}

result<socket_pair_fds> emulated_socket_pair() {
    options listen_opts;
    listen_opts.local_host = "127.0.0.1";
    listen_opts.local_port = 0;

    auto listener = factory::create_tcp_server(std::move(listen_opts));
    if (!listener.has_value()) {
        return err<socket_pair_fds>(listener.error());
    }

    auto* server = dynamic_cast<tcp_server_socket*>(listener->get());
    if (server == nullptr) {
        return err<socket_pair_fds>(errc::not_supported);
    }

    options connect_opts;
    connect_opts.peer_host = server->localhost();
    connect_opts.peer_port = server->localport();

    auto client = factory::create_tcp(std::move(connect_opts));
    if (!client.has_value()) {
        return err<socket_pair_fds>(client.error());
    }

    auto accepted = server->accept();
    if (!accepted.has_value()) {
        return err<socket_pair_fds>(accepted.error());
    }

    if (const auto closed = server->close(); !closed.has_value()) {
        return err<socket_pair_fds>(closed.error());
    }

    return socket_pair_fds{.first = accepted.value()->release(),
                           .second = client.value()->release()};
}

} // namespace sockcomm::socket
