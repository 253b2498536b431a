/**
 * @file discovery_engine.hpp
 * @brief Scheduled production of broker targets for the registry.
 *
 * The DiscoveryEngine handles:
 * - Choosing direct mode (static brokers) or discovery-polling mode
 * - One immediate pass on start, then passes every poll interval after a
 *   randomized startup delay
 * - Skipping passes while the reader is paused
 * - Round-robin rotation over discovery endpoints
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection_registry.hpp"
#include "nsqsub/core/export.hpp"
#include "nsqsub/core/flow_controller.hpp"
#include "nsqsub/core/lookup_client.hpp"
#include "nsqsub/core/reader_config.hpp"
#include "nsqsub/core/round_robin_list.hpp"
#include "nsqsub/core/scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace nsqsub {
namespace core {

/// Uniform random value in [0, 1).
using RandomSource = std::function<double()>;

/**
 * @brief Default RandomSource backed by a randomly seeded mt19937_64.
 */
NSQSUB_CORE_API RandomSource makeDefaultRandomSource();

enum class DiscoveryMode {
    kDirect,
    kDiscovery
};

inline const char* discoveryModeToString(DiscoveryMode mode) {
    switch (mode) {
        case DiscoveryMode::kDirect: return "direct";
        case DiscoveryMode::kDiscovery: return "discovery";
        default: return "unknown";
    }
}

/**
 * @class DiscoveryEngine
 * @brief Decides, on a schedule, which brokers the registry should reach.
 *
 * Usage:
 * @code
 * auto engine = std::make_shared<DiscoveryEngine>(
 *     config, scheduler, registry, flow, lookupClient, makeDefaultRandomSource());
 * engine->start();
 * // ... run ...
 * engine->stop();
 * @endcode
 */
class NSQSUB_CORE_API DiscoveryEngine
    : public std::enable_shared_from_this<DiscoveryEngine> {
public:
    /**
     * @param lookupClient Required in discovery mode, ignored in direct mode.
     * @throws std::invalid_argument if discovery mode has no lookup client.
     */
    DiscoveryEngine(const ReaderConfig& config,
                    Scheduler& scheduler,
                    std::shared_ptr<ConnectionRegistry> registry,
                    std::shared_ptr<FlowController> flow,
                    std::shared_ptr<LookupClient> lookupClient,
                    RandomSource random);

    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Run one pass now and schedule the recurring passes.
     * @return False if already started or stopped.
     */
    bool start();

    /**
     * @brief Cancel recurring passes. Late lookup results become no-ops.
     */
    void stop();

    /**
     * @brief Run one pass immediately (no-op while paused or stopped).
     */
    void runPass();

    DiscoveryMode mode() const { return mode_; }
    bool isStarted() const { return started_; }
    bool isStopped() const { return stopped_; }

    /// Randomized delay chosen by start(), zero before that.
    std::chrono::milliseconds startupDelay() const { return startupDelay_; }

private:
    void directPass();
    void discoveryPass();
    void onLookupResult(const std::string& endpoint, bool success,
                        const std::vector<LookupNode>& nodes);

    std::string topic_;
    std::vector<Address> staticBrokers_;
    std::chrono::milliseconds interval_;
    double jitter_;
    DiscoveryMode mode_;

    Scheduler& scheduler_;
    std::shared_ptr<ConnectionRegistry> registry_;
    std::shared_ptr<FlowController> flow_;
    std::shared_ptr<LookupClient> lookupClient_;
    RandomSource random_;
    RoundRobinList<std::string> endpoints_;

    std::unique_ptr<PeriodicTask> poller_;
    std::chrono::milliseconds startupDelay_{0};
    bool started_ = false;
    bool stopped_ = false;
};

}  // namespace core
}  // namespace nsqsub
