#pragma once

/**
 * @file
 * @brief State and queries shared by every concrete socket variant.
 */

#include "sockcomm/addr/codec.hpp"
#include "sockcomm/core/result.hpp"
#include "sockcomm/core/unique_fd.hpp"
#include "sockcomm/socket/parameters.hpp"

#include <cstdint>
#include <string>

namespace sockcomm::socket {

/**
 * @brief Base of all socket variants created by a channel.
 *
 * Endpoint fields and context are fixed during construction (`initsock`)
 * and read-only afterwards. The handle owns its descriptor.
 */
class socket_handle {
public:
    virtual ~socket_handle() = default;

    socket_handle(const socket_handle&) = delete;
    socket_handle& operator=(const socket_handle&) = delete;
    socket_handle(socket_handle&&) = delete;
    socket_handle& operator=(socket_handle&&) = delete;

    /// @return Peer host of a connected socket, empty otherwise.
    [[nodiscard]] const std::string& peerhost() const noexcept;
    [[nodiscard]] std::uint16_t peerport() const noexcept;
    [[nodiscard]] const std::string& localhost() const noexcept;
    [[nodiscard]] std::uint16_t localport() const noexcept;
    /// @return Attributes copied from the creating parameters.
    [[nodiscard]] const context_map& context() const noexcept;

    /// @return Decoded local address of the descriptor.
    [[nodiscard]] result<addr::sockaddr_info> getsockname() const;
    /// Same as `getsockname`.
    [[nodiscard]] result<addr::sockaddr_info> getlocalname() const;
    /// @return Decoded peer address of the descriptor.
    [[nodiscard]] result<addr::sockaddr_info> getpeername() const;

    /**
     * @brief Transport name of the variant, such as `"tcp"`.
     *
     * Variants must override; the base fails with `errc::not_supported`.
     */
    [[nodiscard]] virtual result<std::string> type_name() const;

    /// @return Native socket descriptor.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid socket is owned.
    [[nodiscard]] bool valid() const noexcept;

    [[nodiscard]] result<void> shutdown(shutdown_mode how = shutdown_mode::both) noexcept;
    [[nodiscard]] result<void> close() noexcept;
    /// Give up ownership of the descriptor; the handle becomes invalid.
    [[nodiscard]] unique_fd release() noexcept;

protected:
    explicit socket_handle(unique_fd fd) noexcept;

    /// Copy endpoint fields and context from the creating parameters.
    void initsock(const parameters& params);

    /**
     * @brief Overwrite endpoint fields with what the kernel reports.
     *
     * Fields whose query fails (e.g. no peer on a listener) keep the
     * values set by `initsock`.
     */
    void sync_endpoints();

private:
    unique_fd fd_;
    std::string peer_host_;
    std::uint16_t peer_port_{};
    std::string local_host_;
    std::uint16_t local_port_{};
    context_map context_;
};

} // namespace sockcomm::socket
