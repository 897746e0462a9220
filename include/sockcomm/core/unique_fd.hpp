#pragma once

/**
 * @file
 * @brief RAII ownership of socket descriptors and shutdown-mode constants.
 */

#include "sockcomm/core/result.hpp"

#include <sys/socket.h>

namespace sockcomm {

/**
 * @brief Which half of a connection `shutdown` closes.
 *
 * Values mirror the platform socket API so they can be passed straight
 * to `::shutdown`.
 */
enum class shutdown_mode : int {
    read = SHUT_RD,
    write = SHUT_WR,
    both = SHUT_RDWR,
};

/**
 * @brief Move-only owner of a socket descriptor.
 */
class unique_fd {
public:
    /// Construct an empty handle (`fd == -1`).
    unique_fd() noexcept = default;
    /// Take ownership of an existing descriptor.
    explicit unique_fd(int fd) noexcept;
    /// Close the descriptor if still owned.
    ~unique_fd() noexcept;

    unique_fd(const unique_fd&) = delete;
    unique_fd& operator=(const unique_fd&) = delete;

    unique_fd(unique_fd&& other) noexcept;
    unique_fd& operator=(unique_fd&& other) noexcept;

    /// @return Owned file descriptor or `-1`.
    [[nodiscard]] int get() const noexcept;
    /// @return `true` when the object owns a valid descriptor.
    [[nodiscard]] bool valid() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept;

    /**
     * @brief Release ownership without closing.
     * @return Previously owned descriptor or `-1`.
     */
    [[nodiscard]] int release() noexcept;
    /**
     * @brief Replace the owned descriptor, closing the old one silently.
     * @param fd New descriptor. Defaults to `-1` (close and clear).
     */
    void reset(int fd = -1) noexcept;

    /**
     * @brief Close the owned descriptor and report the outcome.
     *
     * The handle is empty afterwards even when `close` fails.
     */
    [[nodiscard]] result<void> close() noexcept;

    /**
     * @brief Shut down one or both directions of the socket.
     * @param how Direction(s) to shut down.
     */
    [[nodiscard]] result<void> shutdown(shutdown_mode how) const noexcept;

private:
    int fd_{-1};
};

} // namespace sockcomm
