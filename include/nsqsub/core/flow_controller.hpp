/**
 * @file flow_controller.hpp
 * @brief In-flight budget and pause state shared by a Reader's connections.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection.hpp"
#include "nsqsub/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @class FlowController
 * @brief Owns RDY distribution, backoff and the pause flag.
 *
 * The Reader registers every new connection here and forwards
 * pause/unpause/close. isPaused() is the only source of pause state.
 */
class NSQSUB_CORE_API FlowController {
public:
    virtual ~FlowController() = default;

    virtual void addConnection(const ConnectionPtr& connection) = 0;

    /**
     * @brief Forget a closed connection and redistribute its budget.
     *
     * Called by the owner ahead of its own close notifications. Unknown or
     * already removed connections are ignored.
     */
    virtual void removeConnection(Connection* connection) = 0;

    virtual void pause() = 0;
    virtual void unpause() = 0;
    virtual bool isPaused() const = 0;

    /**
     * @brief Close every connection this controller manages.
     */
    virtual void close() = 0;
};

/**
 * @class BasicFlowController
 * @brief Even split of the in-flight budget, without backoff.
 *
 * Each connected connection gets max(1, maxInFlight / connected) RDY, or 0
 * while paused. Connections are forgotten when they close. After close(),
 * connections added later are closed immediately.
 */
class NSQSUB_CORE_API BasicFlowController
    : public FlowController
    , public std::enable_shared_from_this<BasicFlowController> {
public:
    BasicFlowController(uint32_t maxInFlight, std::chrono::milliseconds maxBackoffDuration);

    ~BasicFlowController() override = default;

    BasicFlowController(const BasicFlowController&) = delete;
    BasicFlowController& operator=(const BasicFlowController&) = delete;

    void addConnection(const ConnectionPtr& connection) override;
    void removeConnection(Connection* connection) override;
    void pause() override;
    void unpause() override;
    bool isPaused() const override { return paused_; }
    void close() override;

    bool isClosed() const { return closed_; }

    /// Connections currently tracked (connected or connecting).
    size_t connectionCount() const { return entries_.size(); }

    /// RDY currently granted to each connected connection.
    uint32_t perConnectionReady() const;

    uint32_t maxInFlight() const { return maxInFlight_; }
    std::chrono::milliseconds maxBackoffDuration() const { return maxBackoffDuration_; }

private:
    struct Entry {
        ConnectionPtr connection;
        bool connected = false;
    };

    void onConnected(Connection* connection);
    void rebalance();

    uint32_t maxInFlight_;
    std::chrono::milliseconds maxBackoffDuration_;
    bool paused_ = false;
    bool closed_ = false;
    std::vector<Entry> entries_;
};

}  // namespace core
}  // namespace nsqsub
