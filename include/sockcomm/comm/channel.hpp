#pragma once

/**
 * @file
 * @brief Pluggable backend that turns socket parameters into a live socket.
 */

#include "sockcomm/core/result.hpp"
#include "sockcomm/socket/parameters.hpp"
#include "sockcomm/socket/socket_handle.hpp"

#include <memory>

namespace sockcomm::comm {

/**
 * @brief Socket-creation capability.
 *
 * `local_channel` talks to the host network stack. Relay channels that
 * originate sockets through an established tunnel implement the same
 * interface and are injected through `parameters::channel`; picking one for
 * a destination is the caller's business.
 *
 * Implementations report transport failures as-is and never retry.
 */
class channel {
public:
    virtual ~channel() = default;

    /**
     * @brief Create the socket described by `params`.
     * @param params Normalized request; `params.channel` refers to `*this`.
     */
    [[nodiscard]] virtual result<std::unique_ptr<socket::socket_handle>>
    create(const socket::parameters& params) = 0;
};

} // namespace sockcomm::comm
