/**
 * @file message_router.hpp
 * @brief Deliver-or-discard classification of inbound messages.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection.hpp"
#include "nsqsub/core/export.hpp"
#include "nsqsub/core/reader_events.hpp"

#include <cstdint>
#include <memory>

namespace nsqsub {
namespace core {

enum class Disposition {
    kDeliver,
    kDiscard
};

/**
 * @class MessageRouter
 * @brief Emits each message exactly once, on `message` or on `discard`.
 *
 * A message is delivered while its attempt count is below maxAttempts.
 * Attempts are counted by the broker; the router keeps no state.
 */
class NSQSUB_CORE_API MessageRouter {
public:
    MessageRouter(uint32_t maxAttempts, std::shared_ptr<ReaderEvents> events);

    static Disposition classify(uint32_t attempts, uint32_t maxAttempts) {
        return attempts < maxAttempts ? Disposition::kDeliver : Disposition::kDiscard;
    }

    Disposition route(const MessagePtr& message);

    uint32_t maxAttempts() const { return maxAttempts_; }

private:
    uint32_t maxAttempts_;
    std::shared_ptr<ReaderEvents> events_;
};

}  // namespace core
}  // namespace nsqsub
