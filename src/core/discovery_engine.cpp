/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/discovery_engine.hpp"
#include "nsqsub/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace nsqsub {
namespace core {

RandomSource makeDefaultRandomSource() {
    auto engine = std::make_shared<std::mt19937_64>(std::random_device{}());
    return [engine]() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(*engine);
    };
}

DiscoveryEngine::DiscoveryEngine(const ReaderConfig& config,
                                 Scheduler& scheduler,
                                 std::shared_ptr<ConnectionRegistry> registry,
                                 std::shared_ptr<FlowController> flow,
                                 std::shared_ptr<LookupClient> lookupClient,
                                 RandomSource random)
    : topic_(config.topic())
    , staticBrokers_(config.staticBrokerAddresses())
    , interval_(config.pollInterval())
    , jitter_(config.pollJitter())
    , mode_(config.usesStaticAddresses() ? DiscoveryMode::kDirect : DiscoveryMode::kDiscovery)
    , scheduler_(scheduler)
    , registry_(std::move(registry))
    , flow_(std::move(flow))
    , lookupClient_(std::move(lookupClient))
    , random_(random ? std::move(random) : makeDefaultRandomSource())
    , endpoints_(config.discoveryAddresses())
{
    if (mode_ == DiscoveryMode::kDiscovery && !lookupClient_) {
        throw std::invalid_argument("discovery mode requires a lookup client");
    }
    LOG_DEBUG("Discovery", "Using {} mode for topic '{}'", discoveryModeToString(mode_), topic_);
}

DiscoveryEngine::~DiscoveryEngine() {
    stop();
}

bool DiscoveryEngine::start() {
    if (started_ || stopped_) {
        LOG_WARN("Discovery", "Engine for '{}' already {}", topic_,
                 stopped_ ? "stopped" : "started");
        return false;
    }
    started_ = true;

    runPass();

    double draw = std::clamp(random_(), 0.0, 1.0);
    startupDelay_ = std::chrono::milliseconds(static_cast<int64_t>(
        std::llround(draw * jitter_ * static_cast<double>(interval_.count()))));

    std::weak_ptr<DiscoveryEngine> weakSelf = weak_from_this();
    poller_ = std::make_unique<PeriodicTask>(scheduler_, interval_, [weakSelf]() {
        if (auto self = weakSelf.lock()) {
            self->runPass();
        }
    });
    poller_->start(startupDelay_);

    LOG_INFO("Discovery", "Started {} mode for '{}': every {}ms after {}ms",
             discoveryModeToString(mode_), topic_, interval_.count(), startupDelay_.count());
    return true;
}

void DiscoveryEngine::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    if (poller_) {
        poller_->stop();
    }
    LOG_DEBUG("Discovery", "Stopped engine for '{}'", topic_);
}

void DiscoveryEngine::runPass() {
    if (stopped_ || flow_->isPaused()) {
        return;
    }
    if (mode_ == DiscoveryMode::kDirect) {
        directPass();
    } else {
        discoveryPass();
    }
}

void DiscoveryEngine::directPass() {
    // Count-based: a missing address is only retried once fewer connections
    // are tracked than addresses are configured
    if (registry_->size() >= staticBrokers_.size()) {
        return;
    }
    for (const auto& address : staticBrokers_) {
        registry_->submit(address.host, address.port);
    }
}

void DiscoveryEngine::discoveryPass() {
    std::string endpoint = endpoints_.next();
    LOG_TRACE("Discovery", "Querying {} for '{}'", endpoint, topic_);

    std::weak_ptr<DiscoveryEngine> weakSelf = weak_from_this();
    lookupClient_->lookup(endpoint, topic_,
        [weakSelf, endpoint](bool success, const std::vector<LookupNode>& nodes) {
            auto self = weakSelf.lock();
            if (!self) {
                return;
            }
            self->scheduler_.post([weakSelf, endpoint, success, nodes]() {
                if (auto engine = weakSelf.lock()) {
                    engine->onLookupResult(endpoint, success, nodes);
                }
            });
        });
}

void DiscoveryEngine::onLookupResult(const std::string& endpoint, bool success,
                                     const std::vector<LookupNode>& nodes) {
    if (stopped_) {
        LOG_DEBUG("Discovery", "Ignoring late lookup result from {}", endpoint);
        return;
    }
    if (!success) {
        LOG_WARN("Discovery", "Lookup of '{}' against {} failed, retrying next pass",
                 topic_, endpoint);
        return;
    }

    LOG_DEBUG("Discovery", "{} returned {} node(s) for '{}'", endpoint, nodes.size(), topic_);
    for (const auto& node : nodes) {
        registry_->submit(node.broadcast_address, node.tcp_port);
    }
}

}  // namespace core
}  // namespace nsqsub
