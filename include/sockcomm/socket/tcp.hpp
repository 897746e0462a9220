#pragma once

/**
 * @file
 * @brief Blocking TCP socket variants produced by the local channel.
 */

#include "sockcomm/socket/socket_handle.hpp"

#include <cstddef>
#include <memory>
#include <span>

namespace sockcomm::socket {

/**
 * @brief Connected TCP stream.
 */
class tcp_socket final : public socket_handle {
public:
    /**
     * @brief Adopt a connected descriptor.
     * @param fd Connected stream socket.
     * @param params Request the socket was created for.
     */
    tcp_socket(unique_fd fd, const parameters& params);

    /// @return `"tcp"`.
    [[nodiscard]] result<std::string> type_name() const override;

    /**
     * @brief Read up to `buffer.size()` bytes.
     * @return Number of bytes read, or 0 on peer shutdown.
     */
    [[nodiscard]] result<std::size_t>
    read_some(std::span<std::byte> buffer) noexcept;
    /**
     * @brief Write up to `buffer.size()` bytes.
     * @return Number of bytes written.
     */
    [[nodiscard]] result<std::size_t>
    write_some(std::span<const std::byte> buffer) noexcept;
};

/**
 * @brief Listening TCP socket.
 */
class tcp_server_socket final : public socket_handle {
public:
    tcp_server_socket(unique_fd fd, const parameters& params);

    /// @return `"tcp"`.
    [[nodiscard]] result<std::string> type_name() const override;

    /**
     * @brief Accept a single incoming connection.
     *
     * The stream inherits this listener's context; its endpoints come from
     * the accepted descriptor.
     */
    [[nodiscard]] result<std::unique_ptr<tcp_socket>> accept();
};

/**
 * @brief Keep writing until the entire buffer is transferred.
 */
[[nodiscard]] result<void>
write_all(tcp_socket& stream, std::span<const std::byte> buffer) noexcept;
/**
 * @brief Keep reading until the entire buffer is filled.
 *
 * Peer shutdown before the buffer is full fails with `ECONNRESET`.
 */
[[nodiscard]] result<void> read_exact(tcp_socket& stream,
                                      std::span<std::byte> buffer) noexcept;

} // namespace sockcomm::socket
