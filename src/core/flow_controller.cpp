/**
 * @file flow_controller.cpp
 * @brief BasicFlowController implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/flow_controller.hpp"
#include "nsqsub/utils/logger.hpp"

#include <algorithm>

namespace nsqsub {
namespace core {

BasicFlowController::BasicFlowController(uint32_t maxInFlight,
                                         std::chrono::milliseconds maxBackoffDuration)
    : maxInFlight_(maxInFlight)
    , maxBackoffDuration_(maxBackoffDuration)
{
}

void BasicFlowController::addConnection(const ConnectionPtr& connection) {
    if (!connection) {
        return;
    }
    if (closed_) {
        LOG_DEBUG("FlowControl", "Closing {}:{} added after close",
                  connection->host(), connection->port());
        connection->close();
        return;
    }

    std::weak_ptr<BasicFlowController> weakSelf = weak_from_this();
    Connection* raw = connection.get();

    connection->events().connected.connect([weakSelf, raw]() {
        if (auto self = weakSelf.lock()) {
            self->onConnected(raw);
        }
    });
    connection->events().closed.connect([weakSelf, raw]() {
        if (auto self = weakSelf.lock()) {
            self->removeConnection(raw);
        }
    });

    entries_.push_back(Entry{connection, false});
}

void BasicFlowController::pause() {
    if (paused_) {
        return;
    }
    paused_ = true;
    LOG_INFO("FlowControl", "Paused");
    rebalance();
}

void BasicFlowController::unpause() {
    if (!paused_) {
        return;
    }
    paused_ = false;
    LOG_INFO("FlowControl", "Unpaused");
    rebalance();
}

void BasicFlowController::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    // close() may emit `closed` synchronously, which edits entries_
    auto entries = entries_;
    LOG_INFO("FlowControl", "Closing {} connection(s)", entries.size());
    for (auto& entry : entries) {
        entry.connection->close();
    }
}

uint32_t BasicFlowController::perConnectionReady() const {
    if (paused_) {
        return 0;
    }
    auto connected = static_cast<uint32_t>(std::count_if(
        entries_.begin(), entries_.end(),
        [](const Entry& e) { return e.connected; }));
    if (connected == 0) {
        return 0;
    }
    return std::max<uint32_t>(1, maxInFlight_ / connected);
}

void BasicFlowController::onConnected(Connection* connection) {
    for (auto& entry : entries_) {
        if (entry.connection.get() == connection) {
            entry.connected = true;
            break;
        }
    }
    rebalance();
}

void BasicFlowController::removeConnection(Connection* connection) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [connection](const Entry& e) {
                               return e.connection.get() == connection;
                           });
    if (it == entries_.end()) {
        return;
    }
    entries_.erase(it);
    rebalance();
}

void BasicFlowController::rebalance() {
    if (closed_) {
        return;
    }
    uint32_t ready = perConnectionReady();
    for (auto& entry : entries_) {
        if (entry.connected) {
            entry.connection->setReady(ready);
        }
    }
    LOG_TRACE("FlowControl", "RDY {} across {} connection(s)", ready, entries_.size());
}

}  // namespace core
}  // namespace nsqsub
