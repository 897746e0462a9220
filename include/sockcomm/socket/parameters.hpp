#pragma once

/**
 * @file
 * @brief Declarative socket request: caller options and their normalized form.
 */

#include "sockcomm/core/result.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sockcomm::comm {
class channel;
} // namespace sockcomm::comm

namespace sockcomm::socket {

/// @brief Transport protocol of a requested socket.
enum class protocol {
    tcp,
    udp,
};

/// @return `"tcp"` or `"udp"`.
[[nodiscard]] std::string_view to_string(protocol value) noexcept;

/// Parse a protocol name, case-insensitively.
[[nodiscard]] result<protocol> parse_protocol(std::string_view text);

/// Free-form, caller-owned attributes carried along with a socket.
using context_map = std::map<std::string, std::string>;

/**
 * @brief Caller-facing socket request; unset fields take defaults.
 */
struct options {
    std::optional<std::string> peer_host;
    std::optional<std::uint16_t> peer_port;
    std::optional<std::string> local_host;
    std::optional<std::uint16_t> local_port;
    /// `"tcp"` or `"udp"`, any case.
    std::optional<std::string> proto;
    std::optional<bool> server;
    /// Channel that creates the socket. Null selects the local channel.
    std::shared_ptr<comm::channel> channel;
    context_map context;

    /**
     * @brief Build options from textual key/value pairs.
     *
     * Recognized keys: `PeerHost`, `PeerPort`, `LocalHost`, `LocalPort`,
     * `Proto`, `Server` and `Context.<name>`. Unknown keys, non-numeric or
     * out-of-range ports, and unrecognized booleans fail with `EINVAL`.
     */
    [[nodiscard]] static result<options>
    from_map(const std::map<std::string, std::string>& values);
};

/**
 * @brief Normalized socket request handed to a channel.
 *
 * `proto` and `server` together select the socket variant: tcp client,
 * tcp server, or udp (where `server` has no effect).
 */
struct parameters {
    std::string peer_host;
    std::uint16_t peer_port{};
    std::string local_host{"0.0.0.0"};
    std::uint16_t local_port{};
    protocol proto{protocol::tcp};
    bool server{false};
    std::shared_ptr<comm::channel> channel;
    context_map context;

    /**
     * @brief Apply defaults to caller options.
     *
     * Missing channel resolves to `comm::local_channel::instance()`.
     */
    [[nodiscard]] static result<parameters> from_options(const options& opts);

    [[nodiscard]] bool is_tcp() const noexcept { return proto == protocol::tcp; }
    [[nodiscard]] bool is_udp() const noexcept { return proto == protocol::udp; }
};

} // namespace sockcomm::socket
