/**
 * @file signal.hpp
 * @brief Typed multi-listener notification channel.
 *
 * A Signal delivers each emitted value to its listeners in the order they
 * were connected. Components register their internal listeners before an
 * object is handed out, which makes internal listeners observe every event
 * ahead of listeners added later by applications.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace nsqsub {
namespace core {

using SlotId = uint64_t;

/**
 * @class Signal
 * @brief Ordered publish/subscribe channel carrying Args.
 *
 * Not thread-safe: a signal is connected to and emitted from a single
 * scheduler timeline.
 *
 * Usage:
 * @code
 * Signal<const std::string&, uint16_t> closed;
 * auto id = closed.connect([](const std::string& host, uint16_t port) { ... });
 * closed.emit("127.0.0.1", 4150);
 * closed.disconnect(id);
 * @endcode
 */
template<typename... Args>
class Signal {
public:
    using Handler = std::function<void(Args...)>;

    Signal() = default;

    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;

    /**
     * @brief Register a listener.
     * @return Identifier usable with disconnect().
     */
    SlotId connect(Handler handler) {
        SlotId id = nextId_++;
        slots_.push_back(std::make_shared<Slot>(Slot{id, std::move(handler), true}));
        return id;
    }

    /**
     * @brief Remove a listener. Unknown identifiers are ignored.
     */
    void disconnect(SlotId id) {
        for (auto it = slots_.begin(); it != slots_.end(); ++it) {
            if ((*it)->id == id) {
                (*it)->active = false;
                slots_.erase(it);
                return;
            }
        }
    }

    void disconnectAll() {
        for (auto& slot : slots_) {
            slot->active = false;
        }
        slots_.clear();
    }

    /**
     * @brief Deliver to every listener registered before this call.
     *
     * Listeners connected during delivery start with the next emit;
     * listeners disconnected during delivery are skipped.
     */
    template<typename... EmitArgs>
    void emit(EmitArgs&&... args) const {
        auto snapshot = slots_;
        for (const auto& slot : snapshot) {
            if (slot->active) {
                slot->handler(args...);
            }
        }
    }

    size_t listenerCount() const { return slots_.size(); }

private:
    struct Slot {
        SlotId id;
        Handler handler;
        bool active;
    };

    std::vector<std::shared_ptr<Slot>> slots_;
    SlotId nextId_ = 1;
};

}  // namespace core
}  // namespace nsqsub
