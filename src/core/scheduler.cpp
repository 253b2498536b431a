/**
 * @file scheduler.cpp
 * @brief PeriodicTask implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/scheduler.hpp"

#include <algorithm>

namespace nsqsub {
namespace core {

namespace {
// A zero interval would re-arm without ever yielding the timeline.
constexpr std::chrono::milliseconds kMinInterval{1};
}

PeriodicTask::PeriodicTask(Scheduler& scheduler, std::chrono::milliseconds interval,
                           Scheduler::Task task)
    : scheduler_(scheduler)
    , interval_(std::max(interval, kMinInterval))
    , task_(std::move(task))
    , state_(std::make_shared<State>())
{
}

PeriodicTask::~PeriodicTask() {
    stop();
}

bool PeriodicTask::start(std::chrono::milliseconds initialDelay) {
    if (state_->running || state_->stopped) {
        return false;
    }
    state_->running = true;
    arm(std::max(initialDelay, std::chrono::milliseconds(0)), false);
    return true;
}

void PeriodicTask::stop() {
    if (state_->stopped) {
        return;
    }
    state_->stopped = true;
    state_->running = false;
    if (state_->pending != kInvalidTimer) {
        scheduler_.cancel(state_->pending);
        state_->pending = kInvalidTimer;
    }
}

void PeriodicTask::arm(std::chrono::milliseconds delay, bool invokeOnFire) {
    std::weak_ptr<State> weakState = state_;
    state_->pending = scheduler_.scheduleAfter(delay, [this, weakState, invokeOnFire]() {
        auto state = weakState.lock();
        if (!state || !state->running) {
            return;
        }
        state->pending = kInvalidTimer;

        // Re-arm first: the task may stop or destroy this object.
        arm(interval_, true);
        if (invokeOnFire) {
            auto task = task_;
            task();
        }
    });
}

}  // namespace core
}  // namespace nsqsub
