/**
 * @file event_loop.hpp
 * @brief Thread-backed Scheduler used in production.
 *
 * The EventLoop owns one worker thread that runs posted tasks and expired
 * timers in order. It provides the single callback timeline the Reader
 * relies on: connection implementations and lookup clients hand their
 * results back through post().
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/export.hpp"
#include "nsqsub/core/scheduler.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace nsqsub {
namespace core {

/**
 * @class EventLoop
 * @brief Single worker thread executing tasks and one-shot timers.
 *
 * Usage:
 * @code
 * EventLoop loop;
 * loop.start();
 * loop.post([] { ... });
 * auto id = loop.scheduleAfter(std::chrono::seconds(1), [] { ... });
 * loop.cancel(id);
 * loop.stop();
 * @endcode
 */
class NSQSUB_CORE_API EventLoop : public Scheduler {
public:
    using Clock = std::chrono::steady_clock;

    EventLoop();

    /**
     * @brief Destructor - stops the loop if running.
     *
     * May be called from a task running on the loop; the worker thread then
     * exits once that task returns.
     */
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Start the worker thread.
     * @return False if already running.
     */
    bool start();

    /**
     * @brief Stop the worker thread and drop pending work.
     * Blocks until the thread has terminated. Calling it from the loop
     * thread only requests the stop.
     */
    void stop();

    bool isRunning() const { return state_->running.load(); }

    /**
     * @brief True when called from the loop's worker thread.
     */
    bool inLoopThread() const;

    void post(Task task) override;
    TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;

private:
    // Shared with the worker thread, which may outlive the EventLoop when a
    // task destroys its own loop.
    struct State {
        std::atomic<bool> running{false};
        std::mutex mutex;
        std::condition_variable wakeup;
        std::deque<Task> tasks;
        // Ordered by deadline; the id keeps insertion order for equal deadlines.
        std::map<std::pair<Clock::time_point, TimerId>, Task> timers;
        std::unordered_map<TimerId, Clock::time_point> timerDeadlines;
        TimerId nextTimerId = 1;
    };

    static void run(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

}  // namespace core
}  // namespace nsqsub
