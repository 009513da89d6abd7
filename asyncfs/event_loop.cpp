#include "asyncfs/event_loop.h"
#include "asyncfs/log.h"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <fcntl.h>
#include <iterator>
#include <stdexcept>
#include <sys/select.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace asyncfs {

EventLoop::EventLoop() {
    if (pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) < 0) {
        throw std::system_error(errno, std::generic_category(), "event loop wakeup pipe");
    }
}

EventLoop::~EventLoop() {
    // Callbacks may hold objects whose destructors call back into the loop
    auto timers = std::move(timers_);
    timers_.clear();
    auto fds = std::move(fds_);
    fds_.clear();
    timers.clear();
    fds.clear();
    close(wake_fds_[0]);
    close(wake_fds_[1]);
}

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        tasks_.push_back(std::move(task));
    }
    char byte = 1;
    // A full pipe already guarantees a wakeup
    while (write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
    }
}

bool EventLoop::alive() const {
    if (pending_.load() > 0) return true;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!tasks_.empty()) return true;
    }
    for (const auto& [id, t] : timers_) {
        if (t.ref) return true;
    }
    for (const auto& [fd, w] : fds_) {
        if (w.ref) return true;
    }
    return false;
}

void EventLoop::run() {
    stopped_ = false;
    while (!stopped_ && run_once(true)) {
    }
    stopped_ = false;
}

void EventLoop::stop() {
    stopped_ = true;
    char byte = 1;
    while (write(wake_fds_[1], &byte, 1) < 0 && errno == EINTR) {
    }
}

int EventLoop::wait_timeout_ms(bool block) const {
    if (!block) return 0;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        if (!tasks_.empty()) return 0;
    }
    if (timers_.empty()) return -1;
    auto next = timers_.begin()->second.deadline;
    for (const auto& [id, t] : timers_) {
        next = std::min(next, t.deadline);
    }
    auto now = Clock::now();
    if (next <= now) return 0;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(next - now).count();
    // Far deadlines just wake up early and wait again
    if (ms >= INT_MAX) return INT_MAX;
    return static_cast<int>(ms) + 1;
}

bool EventLoop::run_once(bool block) {
    if (!alive()) return false;

    fd_set read_set;
    FD_ZERO(&read_set);
    FD_SET(wake_fds_[0], &read_set);
    int max_fd = wake_fds_[0];
    for (const auto& [fd, w] : fds_) {
        FD_SET(fd, &read_set);
        max_fd = std::max(max_fd, fd);
    }

    int timeout_ms = wait_timeout_ms(block);
    struct timeval timeout;
    struct timeval *timeout_ptr = nullptr;
    if (timeout_ms >= 0) {
        timeout.tv_sec = timeout_ms / 1000;
        timeout.tv_usec = (timeout_ms % 1000) * 1000;
        timeout_ptr = &timeout;
    }

    int ready = select(max_fd + 1, &read_set, NULL, NULL, timeout_ptr);
    if (ready < 0) {
        if (errno == EINTR) return true; // Interrupted, try again
        log_error("loop", std::string("select() failed: ") + strerror(errno));
        throw std::system_error(errno, std::generic_category(), "select");
    }

    if (ready > 0 && FD_ISSET(wake_fds_[0], &read_set)) drain_wakeup();

    run_timers();

    if (ready > 0) {
        std::vector<int> readable;
        for (const auto& [fd, w] : fds_) {
            if (FD_ISSET(fd, &read_set)) readable.push_back(fd);
        }
        for (int fd : readable) {
            // An earlier callback may have removed this one
            auto it = fds_.find(fd);
            if (it == fds_.end()) continue;
            Task cb = it->second.on_readable;
            cb();
        }
    }

    run_tasks();
    return true;
}

void EventLoop::drain_wakeup() {
    char buf[256];
    while (read(wake_fds_[0], buf, sizeof(buf)) > 0) {
    }
}

void EventLoop::run_timers() {
    auto now = Clock::now();
    std::vector<TimerId> due;
    for (const auto& [id, t] : timers_) {
        if (t.deadline <= now) due.push_back(id);
    }
    for (TimerId id : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        Task cb = it->second.callback;
        if (it->second.repeat) {
            it->second.deadline = now + it->second.interval;
        } else {
            timers_.erase(it);
        }
        cb();
    }
}

void EventLoop::run_tasks() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(task_mutex_);
        batch.swap(tasks_);
    }
    while (!batch.empty()) {
        Task task = std::move(batch.front());
        batch.pop_front();
        try {
            task();
        } catch (...) {
            // Keep the rest of the batch for the next iteration
            std::lock_guard<std::mutex> lock(task_mutex_);
            tasks_.insert(tasks_.begin(), std::make_move_iterator(batch.begin()),
                          std::make_move_iterator(batch.end()));
            throw;
        }
    }
}

EventLoop::TimerId EventLoop::add_timer(std::chrono::milliseconds delay, Task callback, bool repeat) {
    TimerId id = next_timer_++;
    timers_[id] = Timer{Clock::now() + delay, delay, std::move(callback), repeat, true};
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    return timers_.erase(id) > 0;
}

void EventLoop::set_timer_ref(TimerId id, bool ref) {
    auto it = timers_.find(id);
    if (it != timers_.end()) it->second.ref = ref;
}

void EventLoop::add_fd(int fd, Task on_readable, bool ref) {
    if (fd < 0 || fd >= FD_SETSIZE) throw std::invalid_argument("descriptor out of select() range");
    fds_[fd] = FdWatch{std::move(on_readable), ref};
}

void EventLoop::remove_fd(int fd) {
    fds_.erase(fd);
}

} // namespace asyncfs
