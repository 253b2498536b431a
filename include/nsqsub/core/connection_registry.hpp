/**
 * @file connection_registry.hpp
 * @brief Deduplicated ownership of a Reader's broker connections.
 *
 * The ConnectionRegistry maintains:
 * - At most one live connection per "host:port"
 * - The relays from each connection's events to the Reader's events
 * - Registration of every new connection with the flow controller
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection.hpp"
#include "nsqsub/core/export.hpp"
#include "nsqsub/core/flow_controller.hpp"
#include "nsqsub/core/message_router.hpp"
#include "nsqsub/core/reader_config.hpp"
#include "nsqsub/core/reader_events.hpp"
#include "nsqsub/core/scheduler.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @class ConnectionRegistry
 * @brief Turns target addresses into connections, one per address.
 *
 * A connection's identifier is tracked from the moment submit() starts its
 * connect sequence until the connection emits `closed`. Not thread-safe:
 * all calls and all connection events happen on the scheduler timeline.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<ConnectionRegistry>(
 *     config, scheduler, factory, flow, router, events);
 * registry->submit("10.0.0.5", 4150);   // connects
 * registry->submit("10.0.0.5", 4150);   // no-op while the first is live
 * @endcode
 */
class NSQSUB_CORE_API ConnectionRegistry
    : public std::enable_shared_from_this<ConnectionRegistry> {
public:
    ConnectionRegistry(const ReaderConfig& config,
                       Scheduler& scheduler,
                       ConnectionFactory factory,
                       std::shared_ptr<FlowController> flow,
                       std::shared_ptr<MessageRouter> router,
                       std::shared_ptr<ReaderEvents> events);

    ~ConnectionRegistry() = default;

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Connect to a broker unless a connection to it is already live.
     * @return True if a new connect sequence was started.
     */
    bool submit(const std::string& host, uint16_t port);

    bool contains(const std::string& connectionId) const {
        return connections_.count(connectionId) != 0;
    }

    /// Number of tracked connection identifiers.
    size_t size() const { return connections_.size(); }

    std::vector<std::string> connectionIds() const;

private:
    void attachRelays(const std::string& id, const std::string& host, uint16_t port,
                      const ConnectionPtr& connection);
    void onClosed(const std::string& id, Connection* connection,
                  const std::string& host, uint16_t port);
    void untrack(const std::string& id, Connection* connection);

    ConnectionParams paramsTemplate_;
    Scheduler& scheduler_;
    ConnectionFactory factory_;
    std::shared_ptr<FlowController> flow_;
    std::shared_ptr<MessageRouter> router_;
    std::shared_ptr<ReaderEvents> events_;

    // connection id ("host:port") -> live connection
    std::unordered_map<std::string, ConnectionPtr> connections_;
};

}  // namespace core
}  // namespace nsqsub
