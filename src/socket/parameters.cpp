#include "sockcomm/socket/parameters.hpp"

#include "sockcomm/comm/local_channel.hpp"

#include <cctype>
#include <cerrno>

namespace sockcomm::socket {

namespace {

constexpr std::string_view context_prefix = "Context.";

std::string lowercase(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (const char ch : text) {
        lower.push_back(static_cast<char>(
            std::tolower(static_cast<unsigned char>(ch))));
    }
    return lower;
}

result<std::uint16_t> parse_port(std::string_view text) {
    if (text.empty()) {
        return err<std::uint16_t>(make_error_from_errno(EINVAL));
    }

    std::uint32_t port = 0;
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return err<std::uint16_t>(make_error_from_errno(EINVAL));
        }
        port = port * 10U + static_cast<std::uint32_t>(ch - '0');
        if (port > 65535U) {
            return err<std::uint16_t>(make_error_from_errno(EINVAL));
        }
    }
    return static_cast<std::uint16_t>(port);
}

result<bool> parse_bool(std::string_view text) {
    const auto lower = lowercase(text);
    if (lower == "true" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "0") {
        return false;
    }
    return err<bool>(make_error_from_errno(EINVAL));
}

} // namespace

std::string_view to_string(protocol value) noexcept {
    switch (value) {
    case protocol::tcp:
        return "tcp";
    case protocol::udp:
        return "udp";
    }
    return "unknown";
}

result<protocol> parse_protocol(std::string_view text) {
    const auto lower = lowercase(text);
    if (lower == "tcp") {
        return protocol::tcp;
    }
    if (lower == "udp") {
        return protocol::udp;
    }
    return err<protocol>(make_error_from_errno(EINVAL));
}

result<options>
options::from_map(const std::map<std::string, std::string>& values) {
    options opts;
    for (const auto& [key, value] : values) {
        if (key == "PeerHost") {
            opts.peer_host = value;
        } else if (key == "LocalHost") {
            opts.local_host = value;
        } else if (key == "Proto") {
            opts.proto = value;
        } else if (key == "PeerPort" || key == "LocalPort") {
            const auto port = parse_port(value);
            if (!port.has_value()) {
                return err<options>(port.error());
            }
            (key == "PeerPort" ? opts.peer_port : opts.local_port) = port.value();
        } else if (key == "Server") {
            const auto flag = parse_bool(value);
            if (!flag.has_value()) {
                return err<options>(flag.error());
            }
            opts.server = flag.value();
        } else if (key.starts_with(context_prefix) &&
                   key.size() > context_prefix.size()) {
            opts.context[key.substr(context_prefix.size())] = value;
        } else {
            return err<options>(make_error_from_errno(EINVAL));
        }
    }
    return opts;
}

result<parameters> parameters::from_options(const options& opts) {
    parameters params;
    params.peer_host = opts.peer_host.value_or("");
    params.peer_port = opts.peer_port.value_or(0);
    if (opts.local_host.has_value() && !opts.local_host->empty()) {
        params.local_host = opts.local_host.value();
    }
    params.local_port = opts.local_port.value_or(0);
    params.server = opts.server.value_or(false);
    params.context = opts.context;

    if (opts.proto.has_value()) {
        const auto proto = parse_protocol(opts.proto.value());
        if (!proto.has_value()) {
            return err<parameters>(proto.error());
        }
        params.proto = proto.value();
    }

    if (opts.channel) {
        params.channel = opts.channel;
    } else {
        params.channel = comm::local_channel::instance();
    }
    return params;
}

} // namespace sockcomm::socket
