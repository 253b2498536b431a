/**
 * @file connection_registry.cpp
 * @brief ConnectionRegistry implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/connection_registry.hpp"
#include "nsqsub/utils/logger.hpp"

#include <exception>

namespace nsqsub {
namespace core {

ConnectionRegistry::ConnectionRegistry(const ReaderConfig& config,
                                       Scheduler& scheduler,
                                       ConnectionFactory factory,
                                       std::shared_ptr<FlowController> flow,
                                       std::shared_ptr<MessageRouter> router,
                                       std::shared_ptr<ReaderEvents> events)
    : scheduler_(scheduler)
    , factory_(std::move(factory))
    , flow_(std::move(flow))
    , router_(std::move(router))
    , events_(std::move(events))
{
    paramsTemplate_.topic = config.topic();
    paramsTemplate_.channel = config.channel();
    paramsTemplate_.client_name = config.name();
    paramsTemplate_.requeue_delay = config.requeueDelay();
    paramsTemplate_.heartbeat_interval = config.heartbeatInterval();
    paramsTemplate_.max_in_flight = config.maxInFlight();
}

bool ConnectionRegistry::submit(const std::string& host, uint16_t port) {
    std::string id = connectionId(host, port);
    if (connections_.count(id)) {
        LOG_TRACE("Registry", "Already connected to {}", id);
        return false;
    }

    ConnectionParams params = paramsTemplate_;
    params.host = host;
    params.port = port;

    ConnectionPtr connection;
    try {
        connection = factory_(params);
    } catch (const std::exception& e) {
        LOG_ERROR("Registry", "Failed to create connection to {}: {}", id, e.what());
        events_->error.emit(ConnectionError{host, port, e.what()});
        return false;
    }
    if (!connection) {
        LOG_ERROR("Registry", "Connection factory returned no connection for {}", id);
        events_->error.emit(ConnectionError{host, port, "connection factory returned null"});
        return false;
    }

    connections_.emplace(id, connection);
    LOG_DEBUG("Registry", "Connecting to {} ({} tracked)", id, connections_.size());

    // Relays go first so they observe every event before outside listeners
    attachRelays(id, host, port, connection);
    flow_->addConnection(connection);

    try {
        connection->connect();
    } catch (const std::exception& e) {
        LOG_ERROR("Registry", "Connect to {} failed: {}", id, e.what());
        untrack(id, connection.get());
        events_->error.emit(ConnectionError{host, port, e.what()});
        connection->close();
        return false;
    }
    return true;
}

std::vector<std::string> ConnectionRegistry::connectionIds() const {
    std::vector<std::string> ids;
    ids.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
        ids.push_back(id);
    }
    return ids;
}

void ConnectionRegistry::attachRelays(const std::string& id, const std::string& host,
                                      uint16_t port, const ConnectionPtr& connection) {
    std::weak_ptr<ConnectionRegistry> weakSelf = weak_from_this();
    Connection* raw = connection.get();

    auto& events = connection->events();

    events.connected.connect([weakSelf, id, host, port]() {
        auto self = weakSelf.lock();
        if (!self) {
            return;
        }
        LOG_INFO("Registry", "Connected to {}", id);
        self->events_->nsqdConnected.emit(host, port);
    });

    events.error.connect([weakSelf, id, host, port](const ConnectionError& error) {
        auto self = weakSelf.lock();
        if (!self) {
            return;
        }
        LOG_WARN("Registry", "Connection {} error: {}", id, error.message);
        ConnectionError relayed = error;
        if (relayed.host.empty()) {
            relayed.host = host;
            relayed.port = port;
        }
        self->events_->error.emit(relayed);
    });

    auto closedSeen = std::make_shared<bool>(false);
    events.closed.connect([weakSelf, id, raw, host, port, closedSeen]() {
        if (*closedSeen) {
            return;
        }
        *closedSeen = true;
        if (auto self = weakSelf.lock()) {
            self->onClosed(id, raw, host, port);
        }
    });

    events.message.connect([weakSelf](const MessagePtr& message) {
        auto self = weakSelf.lock();
        if (!self) {
            return;
        }
        // Route after the connection finishes delivering this event
        std::weak_ptr<MessageRouter> weakRouter = self->router_;
        self->scheduler_.post([weakRouter, message]() {
            if (auto router = weakRouter.lock()) {
                router->route(message);
            }
        });
    });
}

void ConnectionRegistry::onClosed(const std::string& id, Connection* connection,
                                  const std::string& host, uint16_t port) {
    // Listeners must see the updated count and the redistributed RDY
    untrack(id, connection);
    flow_->removeConnection(connection);
    LOG_INFO("Registry", "Connection to {} closed ({} tracked)", id, connections_.size());
    events_->nsqdClosed.emit(host, port);
}

void ConnectionRegistry::untrack(const std::string& id, Connection* connection) {
    auto it = connections_.find(id);
    // A newer connection to the same address may already own this id
    if (it != connections_.end() && it->second.get() == connection) {
        connections_.erase(it);
    }
}

}  // namespace core
}  // namespace nsqsub
