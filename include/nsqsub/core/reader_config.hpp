/**
 * @file reader_config.hpp
 * @brief Reader options, defaults and validation.
 *
 * ReaderOptions is what applications fill in; every field may be left
 * unset. ReaderConfig::resolve() merges the options over the defaults,
 * validates them in one pass and produces an immutable configuration.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/address.hpp"
#include "nsqsub/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nsqsub {
namespace core {

/**
 * @enum ConfigErrc
 * @brief Which validation rule rejected a configuration.
 */
enum class ConfigErrc {
    kEmptyTopic,
    kInvalidMaxInFlight,
    kInvalidHeartbeatInterval,
    kInvalidMaxBackoffDuration,
    kInvalidPollInterval,
    kInvalidPollJitter,
    kNoAddressSource,
    kInvalidBrokerAddress
};

NSQSUB_CORE_API const char* configErrcToString(ConfigErrc code);

/**
 * @class ConfigError
 * @brief Thrown by ReaderConfig::resolve() when an option is invalid.
 */
class NSQSUB_CORE_API ConfigError : public std::invalid_argument {
public:
    ConfigError(ConfigErrc code, const std::string& what)
        : std::invalid_argument(what), code_(code) {}

    ConfigErrc code() const { return code_; }

private:
    ConfigErrc code_;
};

/**
 * @class AddressOption
 * @brief An address-list option given as one string, a list, or nothing.
 *
 * Null entries (nullopt) and empty strings are dropped by normalize();
 * the remaining order is preserved.
 */
class NSQSUB_CORE_API AddressOption {
public:
    AddressOption() = default;
    AddressOption(std::nullopt_t) {}
    AddressOption(const char* address);
    AddressOption(std::string address);
    AddressOption(std::vector<std::string> addresses);
    AddressOption(std::vector<std::optional<std::string>> addresses);
    AddressOption(std::initializer_list<std::string> addresses);

    std::vector<std::string> normalize() const;

private:
    std::vector<std::optional<std::string>> entries_;
};

/**
 * @struct ReaderOptions
 * @brief Caller-supplied options. Unset fields take the defaults below.
 */
struct NSQSUB_CORE_API ReaderOptions {
    std::optional<std::string> name;                ///< Default "topic:channel"
    std::optional<int64_t> max_in_flight;           ///< Default 1
    std::optional<double> heartbeat_interval;       ///< Seconds, default 30
    std::optional<double> max_backoff_duration;     ///< Seconds, default 128
    std::optional<uint32_t> max_attempts;           ///< Default 5
    std::optional<double> requeue_delay;            ///< Seconds, default 90
    AddressOption static_broker_addresses;          ///< "host:port" broker list
    AddressOption discovery_addresses;              ///< Discovery service endpoints
    std::optional<double> discovery_poll_interval;  ///< Seconds, default 60
    std::optional<double> discovery_poll_jitter;    ///< Fraction of interval, default 0.3
};

/**
 * @class ReaderConfig
 * @brief Resolved, validated and read-only Reader configuration.
 *
 * Usage:
 * @code
 * ReaderOptions options;
 * options.discovery_addresses = "http://127.0.0.1:4161";
 * options.max_in_flight = 50;
 * auto config = ReaderConfig::resolve("orders", "billing", options);
 * @endcode
 */
class NSQSUB_CORE_API ReaderConfig {
public:
    static constexpr int64_t kDefaultMaxInFlight = 1;
    static constexpr double kDefaultHeartbeatInterval = 30;
    static constexpr double kDefaultMaxBackoffDuration = 128;
    static constexpr uint32_t kDefaultMaxAttempts = 5;
    static constexpr double kDefaultRequeueDelay = 90;
    static constexpr double kDefaultPollInterval = 60;
    static constexpr double kDefaultPollJitter = 0.3;

    /**
     * @brief Merge options over defaults and validate.
     * @throws ConfigError naming the first rule that failed.
     */
    static ReaderConfig resolve(const std::string& topic,
                                const std::string& channel,
                                const ReaderOptions& options = ReaderOptions());

    const std::string& topic() const { return topic_; }
    const std::string& channel() const { return channel_; }
    const std::string& name() const { return name_; }
    uint32_t maxInFlight() const { return maxInFlight_; }
    std::chrono::milliseconds heartbeatInterval() const { return heartbeatInterval_; }
    std::chrono::milliseconds maxBackoffDuration() const { return maxBackoffDuration_; }
    uint32_t maxAttempts() const { return maxAttempts_; }
    std::chrono::milliseconds requeueDelay() const { return requeueDelay_; }
    const std::vector<Address>& staticBrokerAddresses() const { return staticBrokerAddresses_; }
    const std::vector<std::string>& discoveryAddresses() const { return discoveryAddresses_; }
    std::chrono::milliseconds pollInterval() const { return pollInterval_; }
    double pollJitter() const { return pollJitter_; }

    /// Direct mode: static addresses win when both sources are configured.
    bool usesStaticAddresses() const { return !staticBrokerAddresses_.empty(); }

private:
    ReaderConfig() = default;

    std::string topic_;
    std::string channel_;
    std::string name_;
    uint32_t maxInFlight_ = 0;
    std::chrono::milliseconds heartbeatInterval_{0};
    std::chrono::milliseconds maxBackoffDuration_{0};
    uint32_t maxAttempts_ = 0;
    std::chrono::milliseconds requeueDelay_{0};
    std::vector<Address> staticBrokerAddresses_;
    std::vector<std::string> discoveryAddresses_;
    std::chrono::milliseconds pollInterval_{0};
    double pollJitter_ = 0;
};

}  // namespace core
}  // namespace nsqsub
