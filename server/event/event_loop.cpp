/*
 * Event Loop Implementation
 */

#include "event_loop.h"
#include <cstdio>
#include <exception>

namespace event {

static void run_task(const Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        fprintf(stderr, "[Loop] Task threw: %s\n", e.what());
    }
}

// ============================================================================
// ThreadLoop
// ============================================================================

ThreadLoop::ThreadLoop() {}

ThreadLoop::~ThreadLoop() {
    stop();
}

bool ThreadLoop::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return true;
    }
    running_ = true;
    thread_ = std::thread(&ThreadLoop::run, this);
    return true;
}

void ThreadLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool ThreadLoop::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool ThreadLoop::in_loop_thread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

void ThreadLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

TimerId ThreadLoop::schedule_every(std::chrono::milliseconds interval, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = next_timer_id_++;
        timers_[id] = Timer{interval, Clock::now() + interval, std::move(task)};
    }
    cv_.notify_one();
    return id;
}

void ThreadLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void ThreadLoop::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (running_) {
        if (!tasks_.empty()) {
            Task task = std::move(tasks_.front());
            tasks_.pop_front();
            lock.unlock();
            run_task(task);
            lock.lock();
            continue;
        }

        auto earliest = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (earliest == timers_.end() || it->second.next < earliest->second.next) {
                earliest = it;
            }
        }

        if (earliest == timers_.end()) {
            cv_.wait(lock);
            continue;
        }

        auto now = Clock::now();
        if (earliest->second.next <= now) {
            // Reschedule from now so a stalled loop does not fire a burst of ticks
            earliest->second.next = now + earliest->second.interval;
            Task task = earliest->second.task;
            lock.unlock();
            run_task(task);
            lock.lock();
            continue;
        }

        cv_.wait_until(lock, earliest->second.next);
    }
}

// ============================================================================
// ManualLoop
// ============================================================================

ManualLoop::ManualLoop()
    : now_(Clock::now())
{
}

void ManualLoop::post(Task task) {
    tasks_.push_back(std::move(task));
}

TimerId ManualLoop::schedule_every(std::chrono::milliseconds interval, Task task) {
    TimerId id = next_timer_id_++;
    timers_[id] = Timer{interval, now_ + interval, std::move(task)};
    return id;
}

void ManualLoop::cancel(TimerId id) {
    timers_.erase(id);
}

size_t ManualLoop::run_pending() {
    size_t count = 0;
    while (!tasks_.empty()) {
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        run_task(task);
        count++;
    }
    return count;
}

void ManualLoop::advance(std::chrono::milliseconds delta) {
    Clock::time_point target = now_ + delta;
    run_pending();

    for (;;) {
        auto earliest = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.next > target) continue;
            if (earliest == timers_.end() || it->second.next < earliest->second.next) {
                earliest = it;
            }
        }
        if (earliest == timers_.end()) {
            break;
        }

        now_ = earliest->second.next;
        earliest->second.next += earliest->second.interval;
        Task task = earliest->second.task;
        run_task(task);
        run_pending();
    }

    now_ = target;
    run_pending();
}

} // namespace event
