#pragma once

/**
 * @file
 * @brief Name-resolution seam used by the address codec.
 */

#include "sockcomm/core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sockcomm::addr {

/**
 * @brief Host record in the shape of a classic `gethostbyname` answer.
 */
struct host_entry {
    /// Official (canonical) host name.
    std::string name;
    /// Alternative names.
    std::vector<std::string> aliases;
    /// Address family (`AF_INET` or `AF_INET6`).
    int family{};
    /// Packed address bytes in network order (4 or 16 bytes).
    std::vector<std::uint8_t> address;
};

/**
 * @brief Forward name resolution.
 *
 * Implementations must be safe to call from several threads at once.
 */
class name_resolver {
public:
    virtual ~name_resolver() = default;

    /**
     * @brief Resolve a name to one textual address.
     * @param host Hostname or literal address.
     * @return Dotted-quad or colon-hex text. IPv4 answers win when both exist.
     */
    [[nodiscard]] virtual result<std::string>
    resolve(std::string_view host) const = 0;

    /**
     * @brief Resolve a name to a full host record.
     * @param host Hostname or literal address.
     */
    [[nodiscard]] virtual result<host_entry>
    lookup(std::string_view host) const = 0;
};

/// @return Process-wide resolver backed by `getaddrinfo`.
[[nodiscard]] const name_resolver& system_resolver() noexcept;

} // namespace sockcomm::addr
