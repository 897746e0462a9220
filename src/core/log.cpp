#include "sockcomm/core/log.hpp"

#include <iostream>
#include <utility>

namespace sockcomm {

namespace {

std::string format_line(log_level level, std::string_view message) {
    std::string line;
    line.reserve(message.size() + 12);
    line.push_back('[');
    line.append(to_string(level));
    line.append("] ");
    line.append(message);
    return line;
}

} // namespace

std::string_view to_string(log_level level) noexcept {
    switch (level) {
    case log_level::debug:
        return "DEBUG";
    case log_level::info:
        return "INFO";
    case log_level::warning:
        return "WARNING";
    case log_level::error:
        return "ERROR";
    }
    return "UNKNOWN";
}

void stderr_sink::write(log_level level, std::string_view message) {
    if (!accepts(level)) {
        return;
    }
    std::cerr << format_line(level, message) << '\n';
}

void memory_sink::write(log_level level, std::string_view message) {
    if (!accepts(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(format_line(level, message));
}

std::vector<std::string> memory_sink::lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

std::size_t memory_sink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

void memory_sink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

logger::logger(std::string name) : name_(std::move(name)) {}

void logger::add_sink(std::shared_ptr<log_sink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void logger::log(log_level level, std::string_view message) {
    // Sinks run unlocked so they may log or reconfigure this logger.
    std::vector<std::shared_ptr<log_sink>> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        targets = sinks_;
    }
    for (const auto& sink : targets) {
        sink->write(level, message);
    }
}

logger& default_logger() noexcept {
    static logger instance;
    return instance;
}

} // namespace sockcomm
