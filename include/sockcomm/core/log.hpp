#pragma once

/**
 * @file
 * @brief Leveled logger with pluggable sinks.
 *
 * The library writes diagnostics to `default_logger()`, which starts with
 * no sinks attached. Applications opt in by adding a sink.
 */

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sockcomm {

/// @brief Message severity, lowest first.
enum class log_level {
    debug,
    info,
    warning,
    error,
};

/// @return Upper-case label for a level (`"DEBUG"`, ...).
[[nodiscard]] std::string_view to_string(log_level level) noexcept;

/**
 * @brief Destination for formatted log lines.
 *
 * Sinks drop messages below their own threshold (`info` by default).
 */
class log_sink {
public:
    virtual ~log_sink() = default;

    /// Write one message; implementations apply `level()` filtering.
    virtual void write(log_level level, std::string_view message) = 0;

    void set_level(log_level level) noexcept { min_level_ = level; }
    [[nodiscard]] log_level level() const noexcept { return min_level_; }

protected:
    [[nodiscard]] bool accepts(log_level level) const noexcept {
        return level >= min_level_;
    }

    log_level min_level_{log_level::info};
};

/// @brief Sink printing `[LEVEL] message` lines to standard error.
class stderr_sink final : public log_sink {
public:
    void write(log_level level, std::string_view message) override;
};

/// @brief Sink retaining formatted lines in memory (tests, UIs).
class memory_sink final : public log_sink {
public:
    void write(log_level level, std::string_view message) override;

    /// @return Copy of every retained line, oldest first.
    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

/**
 * @brief Fan-out logger dispatching to every attached sink.
 *
 * Sinks are invoked without the logger's lock held, so a sink may itself
 * log or add and remove sinks.
 */
class logger {
public:
    logger() = default;
    explicit logger(std::string name);

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    void add_sink(std::shared_ptr<log_sink> sink);
    /// Detach every sink; subsequent messages are discarded.
    void clear_sinks();

    void log(log_level level, std::string_view message);

    void debug(std::string_view message) { log(log_level::debug, message); }
    void info(std::string_view message) { log(log_level::info, message); }
    void warning(std::string_view message) { log(log_level::warning, message); }
    void error(std::string_view message) { log(log_level::error, message); }

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    std::string name_{"sockcomm"};
    std::mutex mutex_;
    std::vector<std::shared_ptr<log_sink>> sinks_;
};

/// @return Process-wide logger used by the library.
[[nodiscard]] logger& default_logger() noexcept;

} // namespace sockcomm
