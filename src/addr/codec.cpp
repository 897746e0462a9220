#include "sockcomm/addr/codec.hpp"

#include <arpa/inet.h>
#include <array>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <optional>
#include <utility>

namespace sockcomm::addr {

namespace {

static_assert(sizeof(sockaddr_in) == 16, "unexpected sockaddr_in layout");
static_assert(sizeof(sockaddr_in6) == 28, "unexpected sockaddr_in6 layout");

constexpr std::size_t header_size = sizeof(sa_family_t) + sizeof(in_port_t);

using octets = std::array<std::uint8_t, 4>;

std::optional<octets> parse_dotted(std::string_view text) noexcept {
    octets parsed{};
    std::size_t index = 0;
    std::size_t cursor = 0;

    while (index < parsed.size()) {
        unsigned value = 0;
        std::size_t digits = 0;
        while (cursor < text.size() && text[cursor] >= '0' &&
               text[cursor] <= '9') {
            value = value * 10U + static_cast<unsigned>(text[cursor] - '0');
            ++digits;
            ++cursor;
            if (digits > 3) {
                return std::nullopt;
            }
        }
        if (digits == 0 || value > 255U) {
            return std::nullopt;
        }
        parsed[index++] = static_cast<std::uint8_t>(value);

        if (index < parsed.size()) {
            if (cursor >= text.size() || text[cursor] != '.') {
                return std::nullopt;
            }
            ++cursor;
        }
    }

    if (cursor != text.size()) {
        return std::nullopt;
    }
    return parsed;
}

bool has_colon(std::string_view text) noexcept {
    return text.find(':') != std::string_view::npos;
}

std::uint32_t load_be32(const std::uint8_t* bytes) noexcept {
    return (static_cast<std::uint32_t>(bytes[0]) << 24U) |
           (static_cast<std::uint32_t>(bytes[1]) << 16U) |
           (static_cast<std::uint32_t>(bytes[2]) << 8U) |
           static_cast<std::uint32_t>(bytes[3]);
}

template <class Sockaddr>
sockaddr_bytes image_of(const Sockaddr& addr) {
    sockaddr_bytes bytes(sizeof(addr));
    std::memcpy(bytes.data(), &addr, sizeof(addr));
    return bytes;
}

std::string verbose_ipv6(const std::uint8_t* bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string text;
    text.reserve(39);
    for (std::size_t i = 0; i < 16; ++i) {
        if (i != 0 && i % 2 == 0) {
            text.push_back(':');
        }
        text.push_back(digits[bytes[i] >> 4U]);
        text.push_back(digits[bytes[i] & 0x0FU]);
    }
    return text;
}

} // namespace

bool dotted_ip(std::string_view addr) noexcept {
    return parse_dotted(addr).has_value();
}

result<std::string> getaddress(std::string_view addr,
                               const name_resolver& resolver) {
    if (dotted_ip(addr)) {
        return std::string{addr};
    }
    return resolver.resolve(addr);
}

result<std::string> resolv_to_dotted(std::string_view host,
                                     const name_resolver& resolver) {
    return getaddress(host, resolver);
}

result<bool> is_ipv4(std::string_view addr, const name_resolver& resolver) {
    const auto resolved = getaddress(addr, resolver);
    if (!resolved.has_value()) {
        return err<bool>(resolved.error());
    }
    return !has_colon(resolved.value());
}

result<bool> is_ipv6(std::string_view addr, const name_resolver& resolver) {
    const auto resolved = getaddress(addr, resolver);
    if (!resolved.has_value()) {
        return err<bool>(resolved.error());
    }
    return has_colon(resolved.value());
}

result<host_entry> gethostbyname(std::string_view host,
                                 const name_resolver& resolver) {
    const auto parsed = parse_dotted(host);
    if (!parsed.has_value()) {
        return resolver.lookup(host);
    }

    host_entry entry;
    entry.name = std::string{host};
    entry.aliases.emplace_back(host);
    entry.family = family_ipv4;
    entry.address.assign(parsed->begin(), parsed->end());
    return entry;
}

result<sockaddr_bytes> to_sockaddr(std::string_view ip, std::uint16_t port,
                                   const name_resolver& resolver) {
    const auto resolved = getaddress(ip.empty() ? "0.0.0.0" : ip, resolver);
    if (!resolved.has_value()) {
        return err<sockaddr_bytes>(resolved.error());
    }
    const std::string& text = resolved.value();

    if (has_colon(text)) {
        sockaddr_in6 addr{};
        addr.sin6_family = family_ipv6;
        addr.sin6_port = htons(port);
        if (::inet_pton(AF_INET6, text.c_str(), &addr.sin6_addr) != 1) {
            return err<sockaddr_bytes>(errc::invalid_address_format);
        }
        return image_of(addr);
    }

    const auto parsed = parse_dotted(text);
    if (!parsed.has_value()) {
        return err<sockaddr_bytes>(errc::invalid_address_format);
    }

    sockaddr_in addr{};
    addr.sin_family = family_ipv4;
    addr.sin_port = htons(port);
    std::memcpy(&addr.sin_addr, parsed->data(), parsed->size());
    return image_of(addr);
}

result<sockaddr_info> from_sockaddr(std::span<const std::byte> bytes) {
    if (bytes.size() < header_size) {
        return err<sockaddr_info>(errc::invalid_address_format);
    }

    sa_family_t family{};
    std::memcpy(&family, bytes.data(), sizeof(family));
    const auto* raw = reinterpret_cast<const std::uint8_t*>(bytes.data());
    const auto port = static_cast<std::uint16_t>(
        (static_cast<unsigned>(raw[sizeof(family)]) << 8U) |
        static_cast<unsigned>(raw[sizeof(family) + 1]));

    if (family == family_ipv6) {
        if (bytes.size() < offsetof(sockaddr_in6, sin6_addr) + 16) {
            return err<sockaddr_info>(errc::invalid_address_format);
        }
        return sockaddr_info{
            .family = family_ipv6,
            .host = verbose_ipv6(raw + offsetof(sockaddr_in6, sin6_addr)),
            .port = port};
    }

    if (family == family_ipv4) {
        if (bytes.size() < header_size + 4) {
            return err<sockaddr_info>(errc::invalid_address_format);
        }
        return sockaddr_info{.family = family_ipv4,
                             .host = addr_itoa(load_be32(raw + header_size)),
                             .port = port};
    }

    return err<sockaddr_info>(errc::unsupported_family);
}

result<std::vector<std::uint8_t>> resolv_nbo(std::string_view host,
                                             const name_resolver& resolver) {
    const auto resolved = getaddress(host, resolver);
    if (!resolved.has_value()) {
        return err<std::vector<std::uint8_t>>(resolved.error());
    }

    auto entry = gethostbyname(resolved.value(), resolver);
    if (!entry.has_value()) {
        return err<std::vector<std::uint8_t>>(entry.error());
    }
    return std::move(entry->address);
}

result<uint128> resolv_nbo_i(std::string_view host,
                             const name_resolver& resolver) {
    const auto raw = resolv_nbo(host, resolver);
    if (!raw.has_value()) {
        return err<uint128>(raw.error());
    }

    const auto& bytes = raw.value();
    if (bytes.size() % 4 != 0) {
        return err<uint128>(errc::invalid_address_format);
    }

    const std::size_t words = bytes.size() / 4;
    if (words == 1) {
        return static_cast<uint128>(load_be32(bytes.data()));
    }
    if (words == 4) {
        uint128 value = 0;
        for (std::size_t i = 0; i < words; ++i) {
            value += static_cast<uint128>(load_be32(bytes.data() + i * 4))
                     << (96U - i * 32U);
        }
        return value;
    }
    return err<uint128>(errc::invalid_address_format);
}

result<unsigned> net2bitmask(std::string_view netmask,
                             const name_resolver& resolver) {
    const auto raw = resolv_nbo(netmask, resolver);
    if (!raw.has_value()) {
        return err<unsigned>(raw.error());
    }
    if (raw->size() < 4) {
        return err<unsigned>(errc::invalid_address_format);
    }

    const std::uint32_t mask = load_be32(raw->data());
    for (unsigned bit = 0; bit < 32; ++bit) {
        if ((mask & (std::uint32_t{1} << bit)) != 0) {
            return 32U - bit;
        }
    }
    return 0U;
}

result<std::string> bit2netmask(unsigned bits) {
    if (bits > 32) {
        return err<std::string>(make_error_from_errno(EINVAL));
    }
    const std::uint64_t host_span = std::uint64_t{1} << (32U - bits);
    return addr_itoa(
        static_cast<std::uint32_t>(~(host_span - 1) & 0xFFFFFFFFULL));
}

result<std::uint32_t> addr_atoi(std::string_view addr) {
    const auto parsed = parse_dotted(addr);
    if (!parsed.has_value()) {
        return err<std::uint32_t>(make_error_from_errno(EINVAL));
    }
    return load_be32(parsed->data());
}

std::string addr_itoa(std::uint32_t value) {
    std::string text;
    text.reserve(15);
    for (int shift = 24; shift >= 0; shift -= 8) {
        text.append(std::to_string((value >> shift) & 0xFFU));
        if (shift != 0) {
            text.push_back('.');
        }
    }
    return text;
}

result<address_range> cidr_crack(std::string_view cidr) {
    const std::size_t slash = cidr.find('/');
    if (slash == std::string_view::npos || slash + 1 >= cidr.size()) {
        return err<address_range>(make_error_from_errno(EINVAL));
    }

    const auto base_addr = addr_atoi(cidr.substr(0, slash));
    if (!base_addr.has_value()) {
        return err<address_range>(base_addr.error());
    }

    unsigned prefix = 0;
    for (const char ch : cidr.substr(slash + 1)) {
        if (ch < '0' || ch > '9') {
            return err<address_range>(make_error_from_errno(EINVAL));
        }
        prefix = prefix * 10U + static_cast<unsigned>(ch - '0');
        if (prefix > 32U) {
            return err<address_range>(make_error_from_errno(EINVAL));
        }
    }

    const std::uint64_t span = std::uint64_t{1} << (32U - prefix);
    const std::uint64_t mask = (std::uint64_t{1} << 32U) - span;
    const std::uint64_t base = base_addr.value() & mask;
    const std::uint64_t last = base + span - 1;

    return address_range{.first = addr_itoa(static_cast<std::uint32_t>(base)),
                         .last = addr_itoa(static_cast<std::uint32_t>(last))};
}

} // namespace sockcomm::addr
