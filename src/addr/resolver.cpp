#include "sockcomm/addr/resolver.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <netdb.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <utility>

namespace sockcomm::addr {

namespace {

int map_resolve_status(int status) noexcept {
    if (status == EAI_AGAIN) {
        return EAGAIN;
    }
    if (status == EAI_NONAME) {
        return ENOENT;
    }
    if (status == EAI_MEMORY) {
        return ENOMEM;
    }
#ifdef EAI_NODATA
    if (status == EAI_NODATA) {
        return ENOENT;
    }
#endif
    return EHOSTUNREACH;
}

host_entry entry_from(const addrinfo* info, std::string name) {
    host_entry entry;
    entry.name = std::move(name);
    entry.family = info->ai_family;

    if (info->ai_family == AF_INET) {
        const auto* ipv4 = reinterpret_cast<const sockaddr_in*>(info->ai_addr);
        const auto* bytes =
            reinterpret_cast<const std::uint8_t*>(&ipv4->sin_addr);
        entry.address.assign(bytes, bytes + sizeof(ipv4->sin_addr));
    } else {
        const auto* ipv6 = reinterpret_cast<const sockaddr_in6*>(info->ai_addr);
        const auto* bytes =
            reinterpret_cast<const std::uint8_t*>(&ipv6->sin6_addr);
        entry.address.assign(bytes, bytes + sizeof(ipv6->sin6_addr));
    }
    return entry;
}

class getaddrinfo_resolver final : public name_resolver {
public:
    result<std::string> resolve(std::string_view host) const override {
        const auto entry = lookup(host);
        if (!entry.has_value()) {
            return err<std::string>(entry.error());
        }

        std::array<char, INET6_ADDRSTRLEN> buffer{};
        const char* converted =
            ::inet_ntop(entry->family, entry->address.data(), buffer.data(),
                        static_cast<socklen_t>(buffer.size()));
        if (converted == nullptr) {
            return err<std::string>(error::from_errno());
        }
        return std::string{converted};
    }

    result<host_entry> lookup(std::string_view host) const override {
        const std::string name{host};

        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_CANONNAME;

        addrinfo* raw_result = nullptr;
        const int status =
            ::getaddrinfo(name.c_str(), nullptr, &hints, &raw_result);
        if (status != 0) {
            return err<host_entry>(
                make_error_from_errno(map_resolve_status(status)));
        }

        const addrinfo* chosen = nullptr;
        for (const addrinfo* cursor = raw_result; cursor != nullptr;
             cursor = cursor->ai_next) {
            if (cursor->ai_addr == nullptr) {
                continue;
            }
            if (cursor->ai_family == AF_INET) {
                chosen = cursor;
                break;
            }
            if (cursor->ai_family == AF_INET6 && chosen == nullptr) {
                chosen = cursor;
            }
        }

        if (chosen == nullptr) {
            ::freeaddrinfo(raw_result);
            return err<host_entry>(make_error_from_errno(ENOENT));
        }

        // Only the first record carries the canonical name.
        auto entry = entry_from(chosen, raw_result->ai_canonname != nullptr
                                            ? std::string{raw_result->ai_canonname}
                                            : name);
        ::freeaddrinfo(raw_result);
        return entry;
    }
};

} // namespace

const name_resolver& system_resolver() noexcept {
    static const getaddrinfo_resolver instance;
    return instance;
}

} // namespace sockcomm::addr
