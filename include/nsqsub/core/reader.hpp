/**
 * @file reader.hpp
 * @brief Consumer of one topic/channel across many broker nodes.
 *
 * The Reader composes configuration, discovery, the connection registry,
 * message routing and the flow controller, and exposes the lifecycle
 * operations applications call: connect, pause, unpause, close.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection.hpp"
#include "nsqsub/core/connection_registry.hpp"
#include "nsqsub/core/discovery_engine.hpp"
#include "nsqsub/core/export.hpp"
#include "nsqsub/core/flow_controller.hpp"
#include "nsqsub/core/lookup_client.hpp"
#include "nsqsub/core/message_router.hpp"
#include "nsqsub/core/reader_config.hpp"
#include "nsqsub/core/reader_events.hpp"
#include "nsqsub/core/scheduler.hpp"

#include <memory>
#include <string>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @struct ReaderCollaborators
 * @brief External pieces a Reader is wired to.
 *
 * Only connection_factory is always required. lookup_client is required
 * when no static broker addresses are configured. flow_controller and
 * random default to BasicFlowController and makeDefaultRandomSource().
 */
struct NSQSUB_CORE_API ReaderCollaborators {
    ConnectionFactory connection_factory;
    std::shared_ptr<LookupClient> lookup_client;
    std::shared_ptr<FlowController> flow_controller;
    RandomSource random;
};

/**
 * @class Reader
 * @brief Keeps one subscribed connection per live broker and routes messages.
 *
 * All operations must be called on the scheduler's timeline (for an
 * EventLoop, from inside a posted task). The scheduler must outlive the
 * Reader.
 *
 * Usage:
 * @code
 * EventLoop loop;
 * loop.start();
 *
 * ReaderOptions options;
 * options.discovery_addresses = {"http://10.0.0.2:4161", "http://10.0.0.3:4161"};
 * options.max_in_flight = 25;
 *
 * ReaderCollaborators collaborators;
 * collaborators.connection_factory = makeTcpConnection;
 * collaborators.lookup_client = std::make_shared<lookup::GrpcLookupClient>();
 *
 * std::unique_ptr<Reader> reader;
 * loop.post([&] {
 *     reader = std::make_unique<Reader>("orders", "billing", options, loop, collaborators);
 *     reader->events().message.connect([](const MessagePtr& msg) { ... });
 *     reader->connect();
 * });
 * @endcode
 */
class NSQSUB_CORE_API Reader {
public:
    /**
     * @throws ConfigError if the options are invalid; nothing is started.
     * @throws std::invalid_argument if a required collaborator is missing.
     */
    Reader(const std::string& topic,
           const std::string& channel,
           const ReaderOptions& options,
           Scheduler& scheduler,
           ReaderCollaborators collaborators);

    /**
     * @brief Destructor - closes the reader if still open.
     */
    ~Reader();

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    /**
     * @brief Start discovery: one pass now, then periodic passes.
     * @return False (and nothing started) if already connected or closed.
     */
    bool connect();

    /**
     * @brief Stop receiving. Existing connections stay open and discovery
     *        passes become no-ops until unpause().
     */
    void pause();

    /**
     * @brief Resume. Takes effect on the next scheduled pass.
     */
    void unpause();

    bool isPaused() const;

    /**
     * @brief Cancel discovery and close every connection.
     *
     * Messages in flight are not drained. Idempotent.
     */
    void close();

    bool isClosed() const { return closed_; }

    ReaderEvents& events() { return *events_; }
    const ReaderConfig& config() const { return config_; }

    size_t connectionCount() const { return registry_->size(); }
    std::vector<std::string> connectionIds() const { return registry_->connectionIds(); }

    DiscoveryMode mode() const { return discovery_->mode(); }

private:
    ReaderConfig config_;
    std::shared_ptr<ReaderEvents> events_;
    std::shared_ptr<FlowController> flow_;
    std::shared_ptr<MessageRouter> router_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<DiscoveryEngine> discovery_;
    bool closed_ = false;
};

}  // namespace core
}  // namespace nsqsub
