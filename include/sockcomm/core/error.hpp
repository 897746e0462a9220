#pragma once

/**
 * @file
 * @brief Error value and library error category used by `result<T>`.
 */

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace sockcomm {

/**
 * @brief Library-level failure conditions.
 *
 * Transport failures (refused, timed out, address in use, unreachable) are
 * not listed here: they stay errno values in the system category.
 */
enum class errc {
    /// No channel was available to create the requested socket.
    routing_error = 1,
    /// A sockaddr carried an address family this layer cannot decode.
    unsupported_family,
    /// Raw address bytes or text had an unexpected shape.
    invalid_address_format,
    /// Operation is not implemented by this socket variant.
    not_supported,
};

/// @return Category object for `errc` values.
[[nodiscard]] const std::error_category& sockcomm_category() noexcept;

/// @return `std::error_code` for an `errc` value.
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * This type wraps `std::error_code` while providing helper constructors
 * for errno-based and library-specific failures.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from a library condition.
    explicit error(errc value) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     * @return Converted `error` in the system category.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;

    /// @return `true` when this error carries the given library condition.
    [[nodiscard]] bool is(errc value) const noexcept;

private:
    std::error_code code_;
};

/**
 * @brief Convenience helper that wraps an errno value into `error`.
 * @param value errno value to convert.
 */
[[nodiscard]] error make_error_from_errno(int value) noexcept;

/// @brief Convenience helper that wraps an `errc` value into `error`.
[[nodiscard]] error make_error(errc value) noexcept;

} // namespace sockcomm

namespace std {

template <>
struct is_error_code_enum<sockcomm::errc> : true_type {};

} // namespace std
