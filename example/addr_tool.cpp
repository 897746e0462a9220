#include "sockcomm/sockcomm.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>

namespace {

int usage() {
    std::cerr << "usage: sockcomm_addr_tool <command> [argument]\n"
                 "  cidr A.B.C.D/N     first and last address of a block\n"
                 "  netmask N          prefix length to dotted netmask\n"
                 "  bits MASK          dotted netmask to prefix length\n"
                 "  atoi A.B.C.D       dotted quad to integer\n"
                 "  itoa N             integer to dotted quad\n"
                 "  resolve HOST       textual address of a host\n"
                 "  source [DEST]      outbound local address toward DEST\n";
    return 2;
}

template <class T>
int report(const sockcomm::result<T>& value) {
    if (!value.has_value()) {
        std::cerr << "error: " << value.error().message() << '\n';
        return 1;
    }
    std::cout << value.value() << '\n';
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        return usage();
    }

    const std::string command = argv[1];
    const std::string argument = argc > 2 ? argv[2] : "";

    if (command == "source") {
        std::cout << (argument.empty()
                          ? sockcomm::socket::source_address()
                          : sockcomm::socket::source_address(argument))
                  << '\n';
        return 0;
    }

    if (argument.empty()) {
        return usage();
    }

    if (command == "cidr") {
        const auto range = sockcomm::addr::cidr_crack(argument);
        if (!range.has_value()) {
            std::cerr << "error: " << range.error().message() << '\n';
            return 1;
        }
        std::cout << range->first << ' ' << range->last << '\n';
        return 0;
    }

    if (command == "bits") {
        return report(sockcomm::addr::net2bitmask(argument));
    }

    if (command == "atoi") {
        return report(sockcomm::addr::addr_atoi(argument));
    }

    if (command == "resolve") {
        return report(sockcomm::addr::getaddress(argument));
    }

    if (command == "netmask" || command == "itoa") {
        unsigned long parsed = 0;
        try {
            std::size_t consumed = 0;
            parsed = std::stoul(argument, &consumed);
            if (consumed != argument.size() || parsed > 0xFFFFFFFFUL) {
                std::cerr << "invalid numeric argument\n";
                return 2;
            }
        } catch (const std::exception&) {
            std::cerr << "invalid numeric argument\n";
            return 2;
        }

        if (command == "netmask") {
            return report(
                sockcomm::addr::bit2netmask(static_cast<unsigned>(parsed)));
        }
        std::cout << sockcomm::addr::addr_itoa(static_cast<std::uint32_t>(parsed))
                  << '\n';
        return 0;
    }

    return usage();
}
