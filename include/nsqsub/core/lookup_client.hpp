/**
 * @file lookup_client.hpp
 * @brief Query interface to the discovery service.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/export.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @struct LookupNode
 * @brief A broker node advertised for a topic.
 */
struct NSQSUB_CORE_API LookupNode {
    std::string broadcast_address;
    uint16_t tcp_port = 0;
};

/**
 * @class LookupClient
 * @brief Asks one discovery endpoint which brokers serve a topic.
 *
 * The callback may run on any thread; callers re-post it onto their own
 * timeline.
 */
class NSQSUB_CORE_API LookupClient {
public:
    using Callback = std::function<void(bool success, const std::vector<LookupNode>& nodes)>;

    virtual ~LookupClient() = default;

    virtual void lookup(const std::string& endpoint, const std::string& topic,
                        Callback callback) = 0;
};

}  // namespace core
}  // namespace nsqsub
