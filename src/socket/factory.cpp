#include "sockcomm/socket/factory.hpp"

#include "sockcomm/comm/channel.hpp"

#include <string>
#include <utility>

namespace sockcomm::socket {

result<socket_ptr> factory::create(const options& opts) {
    const auto params = parameters::from_options(opts);
    if (!params.has_value()) {
        return err<socket_ptr>(params.error());
    }
    return create_param(params.value());
}

result<socket_ptr> factory::create_param(const parameters& params) {
    if (!params.channel) {
        return err<socket_ptr>(errc::routing_error);
    }
    return params.channel->create(params);
}

result<socket_ptr> factory::create_tcp(options opts) {
    opts.proto = std::string{to_string(protocol::tcp)};
    return create(opts);
}

result<socket_ptr> factory::create_tcp_server(options opts) {
    opts.server = true;
    return create_tcp(std::move(opts));
}

result<socket_ptr> factory::create_udp(options opts) {
    opts.proto = std::string{to_string(protocol::udp)};
    return create(opts);
}

} // namespace sockcomm::socket
