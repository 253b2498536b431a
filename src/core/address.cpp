/**
 * @file address.cpp
 * @brief Address parsing.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/address.hpp"

#include <cctype>

namespace nsqsub {
namespace core {

std::optional<Address> Address::parse(const std::string& text) {
    auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return std::nullopt;
    }

    std::string host = text.substr(0, colon);
    std::string portText = text.substr(colon + 1);

    // An unbracketed host containing ':' is ambiguous
    if (host.find(':') != std::string::npos &&
        (host.front() != '[' || host.back() != ']')) {
        return std::nullopt;
    }

    if (portText.size() > 5) {
        return std::nullopt;
    }
    unsigned long port = 0;
    for (char c : portText) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) {
        return std::nullopt;
    }

    return Address(std::move(host), static_cast<uint16_t>(port));
}

std::string Address::toString() const {
    return connectionId(host, port);
}

std::string connectionId(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

}  // namespace core
}  // namespace nsqsub
