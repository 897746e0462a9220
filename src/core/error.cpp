#include "sockcomm/core/error.hpp"

namespace sockcomm {

namespace {

class sockcomm_error_category final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "sockcomm";
    }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::routing_error:
            return "no channel available for destination";
        case errc::unsupported_family:
            return "unsupported address family";
        case errc::invalid_address_format:
            return "invalid address format";
        case errc::not_supported:
            return "operation not supported by this socket";
        }
        return "unknown sockcomm error";
    }
};

} // namespace

const std::error_category& sockcomm_category() noexcept {
    static const sockcomm_error_category category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), sockcomm_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(errc value) noexcept : code_(make_error_code(value)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

bool error::is(errc value) const noexcept {
    return code_ == make_error_code(value);
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

error make_error(errc value) noexcept {
    return error{value};
}

} // namespace sockcomm
