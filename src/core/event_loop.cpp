/**
 * @file event_loop.cpp
 * @brief EventLoop implementation.
 *
 * @copyright Copyright (c) 2024 nsqsub Contributors
 * @license MIT License
 */

#include "nsqsub/core/event_loop.hpp"
#include "nsqsub/utils/logger.hpp"

#include <exception>

namespace nsqsub {
namespace core {

EventLoop::EventLoop()
    : state_(std::make_shared<State>())
{
}

EventLoop::~EventLoop() {
    stop();
    if (worker_.joinable()) {
        // Destroyed by one of its own tasks; run() keeps the state alive
        worker_.detach();
    }
}

bool EventLoop::start() {
    if (state_->running.load()) {
        LOG_WARN("EventLoop", "Loop already running");
        return false;
    }
    if (worker_.joinable()) {
        if (inLoopThread()) {
            LOG_WARN("EventLoop", "Cannot restart the loop from its own thread");
            return false;
        }
        // Stopped from inside the loop earlier; reap that thread first
        worker_.join();
    }

    state_->running.store(true);
    worker_ = std::thread(&EventLoop::run, state_);

    LOG_DEBUG("EventLoop", "Loop started");
    return true;
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->running.store(false);
    }
    state_->wakeup.notify_all();

    if (inLoopThread() || !worker_.joinable()) {
        return;
    }
    worker_.join();

    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->tasks.clear();
    state_->timers.clear();
    state_->timerDeadlines.clear();

    LOG_DEBUG("EventLoop", "Loop stopped");
}

bool EventLoop::inLoopThread() const {
    return worker_.get_id() == std::this_thread::get_id();
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->tasks.push_back(std::move(task));
    }
    state_->wakeup.notify_one();
}

TimerId EventLoop::scheduleAfter(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        id = state_->nextTimerId++;
        auto now = Clock::now();
        // Clamp so far-off deadlines cannot overflow the clock
        auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::time_point::max() - now);
        auto deadline = delay >= headroom ? Clock::time_point::max() : now + delay;
        state_->timers.emplace(std::make_pair(deadline, id), std::move(task));
        state_->timerDeadlines.emplace(id, deadline);
    }
    state_->wakeup.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->timerDeadlines.find(id);
    if (it == state_->timerDeadlines.end()) {
        return;
    }
    state_->timers.erase(std::make_pair(it->second, id));
    state_->timerDeadlines.erase(it);
}

void EventLoop::run(std::shared_ptr<State> state) {
    LOG_DEBUG("EventLoop", "Worker thread started");

    std::unique_lock<std::mutex> lock(state->mutex);
    while (state->running.load()) {
        Task next;

        if (!state->tasks.empty()) {
            next = std::move(state->tasks.front());
            state->tasks.pop_front();
        } else if (!state->timers.empty() &&
                   state->timers.begin()->first.first <= Clock::now()) {
            auto it = state->timers.begin();
            next = std::move(it->second);
            state->timerDeadlines.erase(it->first.second);
            state->timers.erase(it);
        } else if (!state->timers.empty()) {
            state->wakeup.wait_until(lock, state->timers.begin()->first.first);
            continue;
        } else {
            state->wakeup.wait(lock);
            continue;
        }

        lock.unlock();
        try {
            next();
        } catch (const std::exception& e) {
            LOG_ERROR("EventLoop", "Task threw: {}", e.what());
        }
        // Release captures before touching shared state; they may own the loop
        next = nullptr;
        lock.lock();
    }

    LOG_DEBUG("EventLoop", "Worker thread stopped");
}

}  // namespace core
}  // namespace nsqsub
