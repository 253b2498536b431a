/**
 * @file address.hpp
 * @brief Broker target addresses and their canonical connection keys.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace nsqsub {
namespace core {

/**
 * @struct Address
 * @brief A (host, port) pair naming one broker node.
 */
struct NSQSUB_CORE_API Address {
    std::string host;
    uint16_t port = 0;

    Address() = default;
    Address(std::string h, uint16_t p) : host(std::move(h)), port(p) {}

    /**
     * @brief Parse "host:port".
     *
     * The last ':' separates host from port so bare IPv6 literals work when
     * bracketed ("[::1]:4150"); the brackets are kept in the host.
     * @return The address, or nullopt when the host is empty or the port is
     *         not a decimal number in 1..65535.
     */
    static std::optional<Address> parse(const std::string& text);

    std::string toString() const;

    bool operator==(const Address& other) const {
        return host == other.host && port == other.port;
    }
    bool operator!=(const Address& other) const { return !(*this == other); }
};

/**
 * @brief Canonical deduplication key for a broker target ("host:port").
 */
NSQSUB_CORE_API std::string connectionId(const std::string& host, uint16_t port);

}  // namespace core
}  // namespace nsqsub
