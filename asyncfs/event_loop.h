#ifndef ASYNCFS_EVENT_LOOP_H
#define ASYNCFS_EVENT_LOOP_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>

namespace asyncfs {

// Single-threaded loop. Everything except post() and stop() must be called
// from the thread running the loop.
//
// run() returns once nothing referenced is left: no pending operations,
// no referenced timers and no referenced descriptors.
class EventLoop {
public:
    using Task = std::function<void()>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    EventLoop();
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Thread-safe. Queues a task for the loop thread and wakes it up.
    void post(Task task);

    void run();
    // One iteration. Returns false if the loop had nothing left to do.
    bool run_once(bool block = true);
    // Thread-safe and async-signal-safe.
    void stop();
    bool alive() const;

    TimerId add_timer(std::chrono::milliseconds delay, Task callback, bool repeat = false);
    bool cancel_timer(TimerId id);
    void set_timer_ref(TimerId id, bool ref);

    void add_fd(int fd, Task on_readable, bool ref);
    void remove_fd(int fd);

    // Operations dispatched but not yet completed keep the loop alive.
    void add_pending() { pending_.fetch_add(1); }
    void remove_pending() { pending_.fetch_sub(1); }
    long pending() const { return pending_.load(); }

private:
    struct Timer {
        Clock::time_point deadline;
        std::chrono::milliseconds interval;
        Task callback;
        bool repeat;
        bool ref;
    };
    struct FdWatch {
        Task on_readable;
        bool ref;
    };

    int wait_timeout_ms(bool block) const;
    void drain_wakeup();
    void run_timers();
    void run_tasks();

    int wake_fds_[2] = {-1, -1};
    mutable std::mutex task_mutex_;
    std::deque<Task> tasks_;
    std::atomic<long> pending_{0};
    std::map<TimerId, Timer> timers_;
    TimerId next_timer_ = 1;
    std::map<int, FdWatch> fds_;
    std::atomic<bool> stopped_{false};
};

} // namespace asyncfs

#endif
