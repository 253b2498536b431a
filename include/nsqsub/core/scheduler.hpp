/**
 * @file scheduler.hpp
 * @brief Callback timeline abstraction and cancellable periodic task.
 *
 * Every engine callback runs on one Scheduler. Production code uses
 * EventLoop; tests drive a virtual clock.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#pragma once

#include "nsqsub/core/export.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace nsqsub {
namespace core {

using TimerId = uint64_t;

/// Never returned by scheduleAfter().
constexpr TimerId kInvalidTimer = 0;

/**
 * @class Scheduler
 * @brief Single logical timeline for tasks and one-shot timers.
 */
class NSQSUB_CORE_API Scheduler {
public:
    using Task = std::function<void()>;

    virtual ~Scheduler() = default;

    /**
     * @brief Run a task on the timeline as soon as possible, after the
     *        currently executing task returns. Safe to call from any thread.
     */
    virtual void post(Task task) = 0;

    /**
     * @brief Run a task once after a delay.
     * @return Identifier for cancel().
     */
    virtual TimerId scheduleAfter(std::chrono::milliseconds delay, Task task) = 0;

    /**
     * @brief Cancel a pending timer. Unknown or fired timers are ignored.
     */
    virtual void cancel(TimerId id) = 0;
};

/**
 * @class PeriodicTask
 * @brief Runs a task at a fixed interval after an initial delay.
 *
 * start(d) invokes the task at d + interval, d + 2*interval, ... until
 * stop(). stop() is idempotent; once it returns on the scheduler's
 * timeline the task is never invoked again.
 */
class NSQSUB_CORE_API PeriodicTask {
public:
    PeriodicTask(Scheduler& scheduler, std::chrono::milliseconds interval,
                 Scheduler::Task task);

    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * @brief Begin the schedule.
     * @return False if already started or stopped.
     */
    bool start(std::chrono::milliseconds initialDelay);

    void stop();

    bool isRunning() const { return state_->running; }

    std::chrono::milliseconds interval() const { return interval_; }

private:
    // Shared with pending timer callbacks so a fired timer can tell that the
    // owning task was stopped or destroyed.
    struct State {
        bool running = false;
        bool stopped = false;
        TimerId pending = kInvalidTimer;
    };

    void arm(std::chrono::milliseconds delay, bool invokeOnFire);

    Scheduler& scheduler_;
    std::chrono::milliseconds interval_;
    Scheduler::Task task_;
    std::shared_ptr<State> state_;
};

}  // namespace core
}  // namespace nsqsub
