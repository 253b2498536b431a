/**
 * @file message_router.cpp
 * @brief MessageRouter implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/message_router.hpp"
#include "nsqsub/utils/logger.hpp"

namespace nsqsub {
namespace core {

MessageRouter::MessageRouter(uint32_t maxAttempts, std::shared_ptr<ReaderEvents> events)
    : maxAttempts_(maxAttempts)
    , events_(std::move(events))
{
}

Disposition MessageRouter::route(const MessagePtr& message) {
    if (!message) {
        return Disposition::kDiscard;
    }

    Disposition disposition = classify(message->attempts, maxAttempts_);
    if (disposition == Disposition::kDeliver) {
        events_->message.emit(message);
    } else {
        LOG_DEBUG("Router", "Discarding message {} after {} attempt(s) (max {})",
                  message->id, message->attempts, maxAttempts_);
        events_->discard.emit(message);
    }
    return disposition;
}

}  // namespace core
}  // namespace nsqsub
