/**
 * @file reader_events.hpp
 * @brief Public notification channels of a Reader.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/connection.hpp"
#include "nsqsub/core/signal.hpp"

#include <cstdint>
#include <string>

namespace nsqsub {
namespace core {

/**
 * @struct ReaderEvents
 * @brief Everything an application can observe on a Reader.
 *
 * Usage:
 * @code
 * reader.events().message.connect([](const MessagePtr& msg) { ... });
 * reader.events().discard.connect([](const MessagePtr& msg) { ... });
 * reader.events().nsqdClosed.connect([](const std::string& host, uint16_t port) { ... });
 * @endcode
 */
struct ReaderEvents {
    Signal<const ConnectionError&> error;
    Signal<const MessagePtr&> message;
    Signal<const MessagePtr&> discard;
    Signal<const std::string&, uint16_t> nsqdConnected;
    Signal<const std::string&, uint16_t> nsqdClosed;
};

}  // namespace core
}  // namespace nsqsub
