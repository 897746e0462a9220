#pragma once

/**
 * @file
 * @brief Conversions between textual addresses, raw bytes, integers and
 * native sockaddr buffers, plus CIDR/netmask arithmetic.
 *
 * Everything here is stateless. Functions that may have to resolve a name
 * take a `name_resolver` and default to the system one; dotted-quad input
 * never reaches the resolver.
 */

#include "sockcomm/addr/resolver.hpp"
#include "sockcomm/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <vector>

namespace sockcomm::addr {

/// IPv4 family code of the platform.
inline constexpr int family_ipv4 = AF_INET;
/// IPv6 family code of the platform.
inline constexpr int family_ipv6 = AF_INET6;

/// Native sockaddr image (16 bytes for IPv4, 28 for IPv6).
using sockaddr_bytes = std::vector<std::byte>;

/// Unsigned integer wide enough for an IPv6 address.
__extension__ typedef unsigned __int128 uint128;

/**
 * @brief Decoded sockaddr.
 */
struct sockaddr_info {
    /// `family_ipv4` or `family_ipv6`.
    int family{};
    /// Dotted-quad, or verbose colon-hex for IPv6 (see `from_sockaddr`).
    std::string host;
    /// Port in host byte order.
    std::uint16_t port{};

    friend bool operator==(const sockaddr_info&, const sockaddr_info&) = default;
};

/**
 * @brief Inclusive host range covered by a CIDR block.
 */
struct address_range {
    std::string first;
    std::string last;

    friend bool operator==(const address_range&, const address_range&) = default;
};

/**
 * @brief Strict dotted-quad check.
 *
 * Four dot-separated octets of one to three decimal digits, each at most
 * 255. Leading zeros are accepted (`"010.0.0.1"`).
 */
[[nodiscard]] bool dotted_ip(std::string_view addr) noexcept;

/**
 * @brief Return a textual address for `addr`.
 *
 * Dotted quads come back unchanged without touching the resolver; anything
 * else is forward-resolved.
 */
[[nodiscard]] result<std::string>
getaddress(std::string_view addr,
           const name_resolver& resolver = system_resolver());

/// Same as `getaddress`.
[[nodiscard]] result<std::string>
resolv_to_dotted(std::string_view host,
                 const name_resolver& resolver = system_resolver());

/// @return `true` when the resolved form of `addr` has no colon.
[[nodiscard]] result<bool>
is_ipv4(std::string_view addr,
        const name_resolver& resolver = system_resolver());

/// @return `true` when the resolved form of `addr` contains a colon.
[[nodiscard]] result<bool>
is_ipv6(std::string_view addr,
        const name_resolver& resolver = system_resolver());

/**
 * @brief Host record lookup that short-circuits dotted quads.
 *
 * A dotted quad yields `{host, {host}, AF_INET, packed bytes}` with no
 * resolver call.
 */
[[nodiscard]] result<host_entry>
gethostbyname(std::string_view host,
              const name_resolver& resolver = system_resolver());

/**
 * @brief Build a native sockaddr image.
 *
 * An empty `ip` means `"0.0.0.0"`. Layouts:
 * - IPv4 (16): family(2) port(2, BE) address(4) zero(8)
 * - IPv6 (28): family(2) port(2, BE) flowinfo=0(4) address(16) scope=0(4)
 */
[[nodiscard]] result<sockaddr_bytes>
to_sockaddr(std::string_view ip, std::uint16_t port,
            const name_resolver& resolver = system_resolver());

/**
 * @brief Decode a native sockaddr image.
 *
 * IPv6 addresses are rendered in the verbose form: eight groups of four
 * lower-case hex digits, no zero compression
 * (`"0000:0000:0000:0000:0000:0000:0000:0001"`). The IPv6 address is read
 * after the 4-byte flowinfo field (offset 8), matching `to_sockaddr`; it
 * is not taken from the 16 bytes that directly follow the port.
 *
 * @return `errc::unsupported_family` for families other than IPv4/IPv6,
 * `errc::invalid_address_format` when the buffer is too short.
 */
[[nodiscard]] result<sockaddr_info>
from_sockaddr(std::span<const std::byte> bytes);

/// @return Raw address bytes of `host` in network order.
[[nodiscard]] result<std::vector<std::uint8_t>>
resolv_nbo(std::string_view host,
           const name_resolver& resolver = system_resolver());

/**
 * @brief Address of `host` as an unsigned integer.
 *
 * One big-endian word gives a 32-bit value, four words a 128-bit value.
 * Any other length fails with `errc::invalid_address_format`.
 */
[[nodiscard]] result<uint128>
resolv_nbo_i(std::string_view host,
             const name_resolver& resolver = system_resolver());

/**
 * @brief Netmask to prefix length (`"255.255.255.240"` -> 28).
 *
 * Precondition: the mask is contiguous and left-aligned. The result is the
 * distance from bit 32 to the lowest set bit, so a non-contiguous mask
 * gives a meaningless (but stable) answer. No set bit gives 0.
 */
[[nodiscard]] result<unsigned>
net2bitmask(std::string_view netmask,
            const name_resolver& resolver = system_resolver());

/// Prefix length to dotted netmask (28 -> `"255.255.255.240"`), `bits <= 32`.
[[nodiscard]] result<std::string> bit2netmask(unsigned bits);

/// Dotted quad to its big-endian 32-bit value.
[[nodiscard]] result<std::uint32_t> addr_atoi(std::string_view addr);

/// Big-endian 32-bit value to dotted quad.
[[nodiscard]] std::string addr_itoa(std::uint32_t value);

/**
 * @brief Expand `"A.B.C.D/N"` into its first and last address.
 *
 * Host bits of the given address are cleared before computing the range.
 */
[[nodiscard]] result<address_range> cidr_crack(std::string_view cidr);

} // namespace sockcomm::addr
