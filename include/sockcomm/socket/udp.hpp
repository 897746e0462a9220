#pragma once

/**
 * @file
 * @brief Blocking UDP socket variant produced by the local channel.
 */

#include "sockcomm/socket/socket_handle.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace sockcomm::socket {

/**
 * @brief Metadata returned by UDP receive operations.
 */
struct received_datagram {
    /// Number of bytes copied into caller buffer.
    std::size_t size{};
    /// Decoded sender address.
    addr::sockaddr_info from{};
};

/**
 * @brief UDP datagram socket, optionally connected to a default peer.
 */
class udp_socket final : public socket_handle {
public:
    udp_socket(unique_fd fd, const parameters& params);

    /// @return `"udp"`.
    [[nodiscard]] result<std::string> type_name() const override;

    /**
     * @brief Send a datagram to the connected peer.
     * @return Number of bytes sent.
     */
    [[nodiscard]] result<std::size_t>
    send(std::span<const std::byte> buffer) noexcept;
    /**
     * @brief Send a datagram to an explicit destination.
     * @param host Dotted quad, IPv6 literal or resolvable name.
     * @param port Destination port.
     */
    [[nodiscard]] result<std::size_t> send_to(std::span<const std::byte> buffer,
                                              std::string_view host,
                                              std::uint16_t port);
    /**
     * @brief Receive a datagram.
     * @return Size and sender address.
     */
    [[nodiscard]] result<received_datagram>
    recv_from(std::span<std::byte> buffer);
};

} // namespace sockcomm::socket
