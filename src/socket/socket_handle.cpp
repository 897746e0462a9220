#include "sockcomm/socket/socket_handle.hpp"

#include <cerrno>
#include <cstddef>
#include <span>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::socket {

namespace {

enum class which_name { local, peer };

result<addr::sockaddr_info> query_name(int fd, which_name which) {
    if (fd < 0) {
        return err<addr::sockaddr_info>(make_error_from_errno(EBADF));
    }

    sockaddr_storage storage{};
    auto length = static_cast<socklen_t>(sizeof(storage));
    auto* raw = reinterpret_cast<sockaddr*>(&storage);
    const int status = which == which_name::local
                           ? ::getsockname(fd, raw, &length)
                           : ::getpeername(fd, raw, &length);
    if (status != 0) {
        return err<addr::sockaddr_info>(error::from_errno());
    }

    return addr::from_sockaddr(std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(&storage),
        static_cast<std::size_t>(length)});
}

} // namespace

socket_handle::socket_handle(unique_fd fd) noexcept : fd_(std::move(fd)) {}

const std::string& socket_handle::peerhost() const noexcept {
    return peer_host_;
}

std::uint16_t socket_handle::peerport() const noexcept {
    return peer_port_;
}

const std::string& socket_handle::localhost() const noexcept {
    return local_host_;
}

std::uint16_t socket_handle::localport() const noexcept {
    return local_port_;
}

const context_map& socket_handle::context() const noexcept {
    return context_;
}

result<addr::sockaddr_info> socket_handle::getsockname() const {
    return query_name(fd_.get(), which_name::local);
}

result<addr::sockaddr_info> socket_handle::getlocalname() const {
    return getsockname();
}

result<addr::sockaddr_info> socket_handle::getpeername() const {
    return query_name(fd_.get(), which_name::peer);
}

result<std::string> socket_handle::type_name() const {
    return err<std::string>(errc::not_supported);
}

int socket_handle::native_handle() const noexcept {
    return fd_.get();
}

bool socket_handle::valid() const noexcept {
    return fd_.valid();
}

result<void> socket_handle::shutdown(shutdown_mode how) noexcept {
    return fd_.shutdown(how);
}

result<void> socket_handle::close() noexcept {
    return fd_.close();
}

unique_fd socket_handle::release() noexcept {
    return std::move(fd_);
}

void socket_handle::initsock(const parameters& params) {
    peer_host_ = params.peer_host;
    peer_port_ = params.peer_port;
    local_host_ = params.local_host;
    local_port_ = params.local_port;
    context_ = params.context;
}

void socket_handle::sync_endpoints() {
    if (const auto local = getsockname(); local.has_value()) {
        local_host_ = local->host;
        local_port_ = local->port;
    }
    if (const auto peer = getpeername(); peer.has_value()) {
        peer_host_ = peer->host;
        peer_port_ = peer->port;
    }
}

} // namespace sockcomm::socket
