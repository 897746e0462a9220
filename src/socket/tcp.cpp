#include "sockcomm/socket/tcp.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::socket {

tcp_socket::tcp_socket(unique_fd fd, const parameters& params)
    : socket_handle(std::move(fd)) {
    initsock(params);
    sync_endpoints();
}

result<std::string> tcp_socket::type_name() const {
    return std::string{"tcp"};
}

result<std::size_t>
tcp_socket::read_some(std::span<std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t read_count =
        ::recv(native_handle(), buffer.data(), buffer.size(), 0);
    if (read_count < 0) {
        return err<std::size_t>(error::from_errno());
    }

    return static_cast<std::size_t>(read_count);
}

result<std::size_t>
tcp_socket::write_some(std::span<const std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    if (buffer.empty()) {
        return static_cast<std::size_t>(0);
    }

    const ssize_t write_count =
        ::send(native_handle(), buffer.data(), buffer.size(), MSG_NOSIGNAL);
    if (write_count < 0) {
        return err<std::size_t>(error::from_errno());
    }

    return static_cast<std::size_t>(write_count);
}

tcp_server_socket::tcp_server_socket(unique_fd fd, const parameters& params)
    : socket_handle(std::move(fd)) {
    initsock(params);
    sync_endpoints();
}

result<std::string> tcp_server_socket::type_name() const {
    return std::string{"tcp"};
}

result<std::unique_ptr<tcp_socket>> tcp_server_socket::accept() {
    if (!valid()) {
        return err<std::unique_ptr<tcp_socket>>(make_error_from_errno(EBADF));
    }

    int accepted = -1;
    do {
        accepted = ::accept4(native_handle(), nullptr, nullptr, SOCK_CLOEXEC);
    } while (accepted < 0 && errno == EINTR);

    if (accepted < 0) {
        return err<std::unique_ptr<tcp_socket>>(error::from_errno());
    }

    parameters peer_params;
    peer_params.local_host = localhost();
    peer_params.local_port = localport();
    peer_params.context = context();
    return std::make_unique<tcp_socket>(unique_fd{accepted}, peer_params);
}

result<void> write_all(tcp_socket& stream,
                       std::span<const std::byte> buffer) noexcept {
    if (!stream.valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }

    while (!buffer.empty()) {
        const ssize_t write_count = ::send(stream.native_handle(), buffer.data(),
                                           buffer.size(), MSG_NOSIGNAL);
        if (write_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return err<void>(error::from_errno());
        }
        if (write_count == 0) {
            return err<void>(make_error_from_errno(EPIPE));
        }
        buffer = buffer.subspan(static_cast<std::size_t>(write_count));
    }

    return ok();
}

result<void> read_exact(tcp_socket& stream,
                        std::span<std::byte> buffer) noexcept {
    if (!stream.valid()) {
        return err<void>(make_error_from_errno(EBADF));
    }

    while (!buffer.empty()) {
        const ssize_t read_count =
            ::recv(stream.native_handle(), buffer.data(), buffer.size(), 0);
        if (read_count < 0) {
            if (errno == EINTR) {
                continue;
            }
            return err<void>(error::from_errno());
        }
        if (read_count == 0) {
            return err<void>(make_error_from_errno(ECONNRESET));
        }
        buffer = buffer.subspan(static_cast<std::size_t>(read_count));
    }

    return ok();
}

} // namespace sockcomm::socket
