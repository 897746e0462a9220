#include "sockcomm/socket/udp.hpp"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::socket {

udp_socket::udp_socket(unique_fd fd, const parameters& params)
    : socket_handle(std::move(fd)) {
    initsock(params);
    sync_endpoints();
}

result<std::string> udp_socket::type_name() const {
    return std::string{"udp"};
}

result<std::size_t>
udp_socket::send(std::span<const std::byte> buffer) noexcept {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    const ssize_t sent =
        ::send(native_handle(), buffer.data(), buffer.size(), MSG_NOSIGNAL);
    if (sent < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(sent);
}

result<std::size_t> udp_socket::send_to(std::span<const std::byte> buffer,
                                        std::string_view host,
                                        std::uint16_t port) {
    if (!valid()) {
        return err<std::size_t>(make_error_from_errno(EBADF));
    }

    const auto remote = addr::to_sockaddr(host, port);
    if (!remote.has_value()) {
        return err<std::size_t>(remote.error());
    }

    sockaddr_storage storage{};
    std::memcpy(&storage, remote->data(), remote->size());
    const ssize_t sent =
        ::sendto(native_handle(), buffer.data(), buffer.size(), MSG_NOSIGNAL,
                 reinterpret_cast<const sockaddr*>(&storage),
                 static_cast<socklen_t>(remote->size()));

    if (sent < 0) {
        return err<std::size_t>(error::from_errno());
    }
    return static_cast<std::size_t>(sent);
}

result<received_datagram>
udp_socket::recv_from(std::span<std::byte> buffer) {
    if (!valid()) {
        return err<received_datagram>(make_error_from_errno(EBADF));
    }

    if (buffer.empty()) {
        return err<received_datagram>(make_error_from_errno(EINVAL));
    }

    sockaddr_storage from_addr{};
    auto from_len = static_cast<socklen_t>(sizeof(from_addr));

    const ssize_t received =
        ::recvfrom(native_handle(), buffer.data(), buffer.size(), 0,
                   reinterpret_cast<sockaddr*>(&from_addr), &from_len);

    if (received < 0) {
        return err<received_datagram>(error::from_errno());
    }

    auto sender = addr::from_sockaddr(std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(&from_addr),
        static_cast<std::size_t>(from_len)});
    if (!sender.has_value()) {
        return err<received_datagram>(sender.error());
    }

    return received_datagram{.size = static_cast<std::size_t>(received),
                             .from = std::move(sender.value())};
}

} // namespace sockcomm::socket
