#pragma once

/**
 * @file
 * @brief Channel that opens sockets directly on the host network stack.
 */

#include "sockcomm/comm/channel.hpp"

#include <memory>

namespace sockcomm::comm {

/**
 * @brief Direct OS socket creation.
 *
 * - tcp client: optional local bind, then blocking connect
 * - tcp server: `SO_REUSEADDR`, bind, listen
 * - udp: optional local bind, connect when a peer host is given
 *
 * The socket domain follows the family `addr::to_sockaddr` picks for the
 * target address.
 */
class local_channel final : public channel {
public:
    /// Listen backlog used for tcp servers.
    static constexpr int listen_backlog = 128;

    [[nodiscard]] result<std::unique_ptr<socket::socket_handle>>
    create(const socket::parameters& params) override;

    /// @return Shared default instance.
    [[nodiscard]] static std::shared_ptr<local_channel> instance();
};

} // namespace sockcomm::comm
