/*
 * Event Loop
 *
 * Single control flow for everything that touches per-link state.
 * libdatachannel raises its callbacks on its own threads; they are posted
 * here so the link table, quality monitors and transfer state are only
 * ever mutated from one thread.
 *
 * - ThreadLoop: one worker thread, task queue and repeating timers
 * - ManualLoop: same interface driven by hand (tests), with a virtual clock
 */

#ifndef EVENT_LOOP_H
#define EVENT_LOOP_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

namespace event {

using Task = std::function<void()>;
using Clock = std::chrono::steady_clock;
using TimerId = uint64_t;

class Loop {
public:
    virtual ~Loop() = default;

    // Queue a task to run on the loop thread
    virtual void post(Task task) = 0;

    // Run task every interval until cancelled. First run is one interval from now.
    virtual TimerId schedule_every(std::chrono::milliseconds interval, Task task) = 0;

    // Cancel a repeating timer. Unknown or already-cancelled ids are ignored.
    virtual void cancel(TimerId id) = 0;

    virtual Clock::time_point now() const = 0;
};

class ThreadLoop : public Loop {
public:
    ThreadLoop();
    ~ThreadLoop() override;

    bool start();
    void stop();
    bool is_running() const;

    // True when called from the loop's own thread
    bool in_loop_thread() const;

    void post(Task task) override;
    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return Clock::now(); }

private:
    struct Timer {
        std::chrono::milliseconds interval;
        Clock::time_point next;
        Task task;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
    bool running_ = false;
    std::thread thread_;
};

class ManualLoop : public Loop {
public:
    ManualLoop();

    void post(Task task) override;
    TimerId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return now_; }

    // Run queued tasks (including tasks they post) until the queue is empty
    size_t run_pending();

    // Move the virtual clock forward, firing due timers in order
    void advance(std::chrono::milliseconds delta);

    size_t timer_count() const { return timers_.size(); }

private:
    struct Timer {
        std::chrono::milliseconds interval;
        Clock::time_point next;
        Task task;
    };

    Clock::time_point now_;
    std::deque<Task> tasks_;
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_id_ = 1;
};

} // namespace event

#endif // EVENT_LOOP_H
