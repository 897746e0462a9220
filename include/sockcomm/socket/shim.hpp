#pragma once

/**
 * @file
 * @brief Outbound source-address detection and connected local pairs.
 */

#include "sockcomm/core/result.hpp"
#include "sockcomm/core/unique_fd.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace sockcomm::socket {

/// Destination used to probe the outbound route when none is given.
inline constexpr std::string_view default_probe_destination = "1.2.3.4";
/// Port the probe socket is pointed at. Nothing is ever sent to it.
inline constexpr std::uint16_t probe_port = 31337;
/// Answer of `source_address` when the route cannot be determined.
inline constexpr std::string_view fallback_source_address = "127.0.0.1";

/**
 * @brief Local address the OS would use to reach `dest`.
 *
 * Connects a UDP socket to `dest:31337` (no packet leaves the host) and
 * reads back its local address.
 */
[[nodiscard]] result<std::string>
try_source_address(std::string_view dest = default_probe_destination);

/**
 * @brief `try_source_address`, returning `"127.0.0.1"` on any failure.
 */
[[nodiscard]] std::string
source_address(std::string_view dest = default_probe_destination);

/**
 * @brief Two connected, bidirectional stream endpoints.
 */
struct socket_pair_fds {
    unique_fd first;
    unique_fd second;
};

/**
 * @brief Connected pair for in-process duplex use.
 *
 * Uses `socketpair(AF_UNIX, SOCK_STREAM)`; falls back to
 * `emulated_socket_pair` when the platform lacks that primitive.
 */
[[nodiscard]] result<socket_pair_fds> socket_pair();

/**
 * @brief Loopback TCP emulation of `socket_pair`.
 *
 * Listens on an ephemeral loopback port, connects, accepts once and closes
 * the listener. Another local process connecting in between would be
 * accepted instead of our client.
 */
[[nodiscard]] result<socket_pair_fds> emulated_socket_pair();

} // namespace sockcomm::socket
