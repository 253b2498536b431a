/**
 * @file reader_config.cpp
 * @brief ReaderConfig resolution and validation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/reader_config.hpp"
#include "nsqsub/utils/logger.hpp"

#include <cmath>
#include <limits>

namespace nsqsub {
namespace core {

namespace {

// Largest millisecond count a double can hold without reaching the int64 limit
const double kMaxMillis = std::nextafter(
    static_cast<double>(std::chrono::milliseconds::max().count()), 0.0);

// Finite, non-negative and representable as std::chrono::milliseconds
bool fitsMillis(double seconds) {
    return std::isfinite(seconds) && seconds >= 0 && seconds * 1000.0 <= kMaxMillis;
}

std::chrono::milliseconds secondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

[[noreturn]] void fail(ConfigErrc code, const std::string& detail) {
    LOG_ERROR("ReaderConfig", "{}: {}", configErrcToString(code), detail);
    throw ConfigError(code, detail);
}

}  // namespace

const char* configErrcToString(ConfigErrc code) {
    switch (code) {
        case ConfigErrc::kEmptyTopic: return "empty_topic";
        case ConfigErrc::kInvalidMaxInFlight: return "invalid_max_in_flight";
        case ConfigErrc::kInvalidHeartbeatInterval: return "invalid_heartbeat_interval";
        case ConfigErrc::kInvalidMaxBackoffDuration: return "invalid_max_backoff_duration";
        case ConfigErrc::kInvalidPollInterval: return "invalid_poll_interval";
        case ConfigErrc::kInvalidPollJitter: return "invalid_poll_jitter";
        case ConfigErrc::kNoAddressSource: return "no_address_source";
        case ConfigErrc::kInvalidBrokerAddress: return "invalid_broker_address";
        default: return "unknown";
    }
}

// =============================================================================
// AddressOption
// =============================================================================

AddressOption::AddressOption(const char* address) {
    if (address != nullptr) {
        entries_.emplace_back(std::string(address));
    }
}

AddressOption::AddressOption(std::string address) {
    entries_.emplace_back(std::move(address));
}

AddressOption::AddressOption(std::vector<std::string> addresses) {
    entries_.reserve(addresses.size());
    for (auto& address : addresses) {
        entries_.emplace_back(std::move(address));
    }
}

AddressOption::AddressOption(std::vector<std::optional<std::string>> addresses)
    : entries_(std::move(addresses))
{
}

AddressOption::AddressOption(std::initializer_list<std::string> addresses)
    : AddressOption(std::vector<std::string>(addresses))
{
}

std::vector<std::string> AddressOption::normalize() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry && !entry->empty()) {
            result.push_back(*entry);
        }
    }
    return result;
}

// =============================================================================
// ReaderConfig
// =============================================================================

ReaderConfig ReaderConfig::resolve(const std::string& topic,
                                   const std::string& channel,
                                   const ReaderOptions& options) {
    ReaderConfig config;
    config.topic_ = topic;
    config.channel_ = channel;

    if (topic.empty()) {
        fail(ConfigErrc::kEmptyTopic, "topic must be a non-empty string");
    }

    int64_t maxInFlight = options.max_in_flight.value_or(kDefaultMaxInFlight);
    if (maxInFlight <= 0 || maxInFlight > std::numeric_limits<uint32_t>::max()) {
        fail(ConfigErrc::kInvalidMaxInFlight,
             "maxInFlight must be a positive number, got " + std::to_string(maxInFlight));
    }
    config.maxInFlight_ = static_cast<uint32_t>(maxInFlight);

    double heartbeat = options.heartbeat_interval.value_or(kDefaultHeartbeatInterval);
    if (!fitsMillis(heartbeat) || heartbeat <= 0) {
        fail(ConfigErrc::kInvalidHeartbeatInterval,
             "heartbeatInterval must be a positive number");
    }
    config.heartbeatInterval_ = secondsToMillis(heartbeat);

    double maxBackoff = options.max_backoff_duration.value_or(kDefaultMaxBackoffDuration);
    if (!fitsMillis(maxBackoff) || maxBackoff <= 0) {
        fail(ConfigErrc::kInvalidMaxBackoffDuration,
             "maxBackoffDuration must be a number greater than 0");
    }
    config.maxBackoffDuration_ = secondsToMillis(maxBackoff);

    config.name_ = options.name ? *options.name : topic + ":" + channel;

    double pollInterval = options.discovery_poll_interval.value_or(kDefaultPollInterval);
    if (!fitsMillis(pollInterval)) {
        fail(ConfigErrc::kInvalidPollInterval,
             "discoveryPollInterval must be a non-negative number");
    }
    config.pollInterval_ = secondsToMillis(pollInterval);

    double jitter = options.discovery_poll_jitter.value_or(kDefaultPollJitter);
    if (!(jitter >= 0 && jitter <= 1)) {
        fail(ConfigErrc::kInvalidPollJitter,
             "discoveryPollJitter must be a number in [0, 1]");
    }
    config.pollJitter_ = jitter;

    auto brokers = options.static_broker_addresses.normalize();
    config.discoveryAddresses_ = options.discovery_addresses.normalize();
    if (brokers.empty() && config.discoveryAddresses_.empty()) {
        fail(ConfigErrc::kNoAddressSource,
             "either static broker addresses or discovery addresses are required");
    }

    for (const auto& text : brokers) {
        auto address = Address::parse(text);
        if (!address) {
            fail(ConfigErrc::kInvalidBrokerAddress,
                 "static broker address must be host:port, got '" + text + "'");
        }
        config.staticBrokerAddresses_.push_back(std::move(*address));
    }

    config.maxAttempts_ = options.max_attempts.value_or(kDefaultMaxAttempts);

    // Not validated; a negative delay requeues immediately, a huge one saturates
    double requeueDelay = options.requeue_delay.value_or(kDefaultRequeueDelay);
    if (fitsMillis(requeueDelay)) {
        config.requeueDelay_ = secondsToMillis(requeueDelay);
    } else if (requeueDelay > 0) {
        config.requeueDelay_ = std::chrono::milliseconds::max();
    } else {
        config.requeueDelay_ = std::chrono::milliseconds(0);
    }

    LOG_DEBUG("ReaderConfig", "Resolved '{}' ({} static broker(s), {} discovery endpoint(s), "
              "poll every {}ms)", config.name_, config.staticBrokerAddresses_.size(),
              config.discoveryAddresses_.size(), config.pollInterval_.count());

    return config;
}

}  // namespace core
}  // namespace nsqsub
