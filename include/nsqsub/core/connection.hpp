/**
 * @file connection.hpp
 * @brief Interface of a single broker connection as seen by the Reader.
 *
 * The wire protocol (framing, heartbeats, subscribe handshake, FIN/REQ
 * encoding) lives behind this interface. The Reader only relies on the
 * four lifecycle events a connection emits and on connect()/close().
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/export.hpp"
#include "nsqsub/core/signal.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace nsqsub {
namespace core {

/**
 * @struct Message
 * @brief A message delivered by a broker.
 */
struct NSQSUB_CORE_API Message {
    std::string id;             ///< Broker-assigned message ID
    int64_t timestamp_ns = 0;   ///< Broker receive time (ns since epoch)
    uint32_t attempts = 0;      ///< Delivery attempts, counted by the broker
    std::string body;           ///< Opaque payload
};

using MessagePtr = std::shared_ptr<const Message>;

/**
 * @struct ConnectionError
 * @brief Error reported by a broker connection.
 */
struct NSQSUB_CORE_API ConnectionError {
    std::string host;
    uint16_t port = 0;
    std::string message;
};

/**
 * @struct ConnectionParams
 * @brief Everything a connection needs to subscribe to the reader's topic.
 */
struct NSQSUB_CORE_API ConnectionParams {
    std::string host;
    uint16_t port = 0;
    std::string topic;
    std::string channel;
    std::string client_name;                    ///< Reader name ("topic:channel" by default)
    std::chrono::milliseconds requeue_delay{90000};      ///< Delay used when requeueing failed messages
    std::chrono::milliseconds heartbeat_interval{30000};
    uint32_t max_in_flight = 1;
};

/**
 * @class Connection
 * @brief One subscribed connection to one broker node.
 *
 * Implementations emit every event on the Reader's scheduler timeline and
 * emit `closed` once the connection is finished, whatever the cause. The
 * Reader may drop its last reference from inside a `closed` listener, so an
 * implementation keeps itself alive (shared_from_this) while emitting.
 */
class NSQSUB_CORE_API Connection {
public:
    struct Events {
        Signal<> connected;
        Signal<const ConnectionError&> error;
        Signal<const MessagePtr&> message;
        Signal<> closed;
    };

    virtual ~Connection() = default;

    /**
     * @brief Begin the connect sequence (TCP connect, identify, subscribe).
     * Completion is reported through events().connected or events().error.
     */
    virtual void connect() = 0;

    /**
     * @brief Close the connection without draining in-flight messages.
     */
    virtual void close() = 0;

    /**
     * @brief Update how many messages the broker may push before waiting.
     */
    virtual void setReady(uint32_t count) = 0;

    virtual const std::string& host() const = 0;
    virtual uint16_t port() const = 0;

    Events& events() { return events_; }

protected:
    Events events_;
};

using ConnectionPtr = std::shared_ptr<Connection>;

/**
 * @brief Creates an unconnected Connection for the given parameters.
 */
using ConnectionFactory = std::function<ConnectionPtr(const ConnectionParams&)>;

}  // namespace core
}  // namespace nsqsub
