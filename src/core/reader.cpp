/**
 * @file reader.cpp
 * @brief Reader implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/reader.hpp"
#include "nsqsub/utils/logger.hpp"

#include <stdexcept>

namespace nsqsub {
namespace core {

Reader::Reader(const std::string& topic,
               const std::string& channel,
               const ReaderOptions& options,
               Scheduler& scheduler,
               ReaderCollaborators collaborators)
    : config_(ReaderConfig::resolve(topic, channel, options))
    , events_(std::make_shared<ReaderEvents>())
{
    if (!collaborators.connection_factory) {
        throw std::invalid_argument("Reader requires a connection factory");
    }

    flow_ = collaborators.flow_controller;
    if (!flow_) {
        flow_ = std::make_shared<BasicFlowController>(
            config_.maxInFlight(), config_.maxBackoffDuration());
    }

    router_ = std::make_shared<MessageRouter>(config_.maxAttempts(), events_);
    registry_ = std::make_shared<ConnectionRegistry>(
        config_, scheduler, std::move(collaborators.connection_factory),
        flow_, router_, events_);
    discovery_ = std::make_shared<DiscoveryEngine>(
        config_, scheduler, registry_, flow_,
        std::move(collaborators.lookup_client), std::move(collaborators.random));

    LOG_INFO("Reader", "Created reader '{}' for {}/{}",
             config_.name(), config_.topic(), config_.channel());
}

Reader::~Reader() {
    close();
}

bool Reader::connect() {
    if (closed_) {
        LOG_WARN("Reader", "connect() on closed reader '{}'", config_.name());
        return false;
    }
    if (discovery_->isStarted()) {
        LOG_WARN("Reader", "connect() called twice on reader '{}'", config_.name());
        return false;
    }
    return discovery_->start();
}

void Reader::pause() {
    LOG_DEBUG("Reader", "Pausing '{}'", config_.name());
    flow_->pause();
}

void Reader::unpause() {
    LOG_DEBUG("Reader", "Unpausing '{}'", config_.name());
    flow_->unpause();
}

bool Reader::isPaused() const {
    return flow_->isPaused();
}

void Reader::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    LOG_INFO("Reader", "Closing reader '{}' ({} connection(s))",
             config_.name(), registry_->size());
    discovery_->stop();
    flow_->close();
}

}  // namespace core
}  // namespace nsqsub
