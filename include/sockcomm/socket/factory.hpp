#pragma once

/**
 * @file
 * @brief Public entry point: build a socket from declarative options.
 */

#include "sockcomm/core/result.hpp"
#include "sockcomm/socket/parameters.hpp"
#include "sockcomm/socket/socket_handle.hpp"

#include <memory>

namespace sockcomm::socket {

/// Owning pointer to whichever socket variant a channel produced.
using socket_ptr = std::unique_ptr<socket_handle>;

/**
 * @brief Static factory normalizing options and dispatching to a channel.
 *
 * Never opens a socket itself and holds no state, so concurrent callers
 * need no coordination. Channel errors are returned unchanged.
 */
class factory {
public:
    /// Normalize `opts` and create the socket through its channel.
    [[nodiscard]] static result<socket_ptr> create(const options& opts);

    /**
     * @brief Create a socket from already-normalized parameters.
     * @return `errc::routing_error` when `params.channel` is null.
     */
    [[nodiscard]] static result<socket_ptr>
    create_param(const parameters& params);

    /// `create` with the protocol forced to tcp.
    [[nodiscard]] static result<socket_ptr> create_tcp(options opts);
    /// `create` with the protocol forced to tcp and server mode on.
    [[nodiscard]] static result<socket_ptr> create_tcp_server(options opts);
    /// `create` with the protocol forced to udp.
    [[nodiscard]] static result<socket_ptr> create_udp(options opts);

private:
    factory() = delete;
};

} // namespace sockcomm::socket
