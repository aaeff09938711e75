#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>

namespace shellserver::runtime {

// Single-threaded poll(2) reactor. Every callback runs on the thread that
// calls run()/run_once(), one at a time; callbacks may freely add or remove
// watches and timers, including their own.
class EventLoop {
public:
    using Clock = std::chrono::steady_clock;
    using FdCallback = std::function<void(short revents)>;
    using Task = std::function<void()>;
    using TimerId = std::uint64_t;

    void watch_fd(int fd, short events, FdCallback callback);
    void unwatch_fd(int fd);
    bool is_watching(int fd) const;

    TimerId add_timer(std::chrono::milliseconds delay, Task callback);
    bool cancel_timer(TimerId id);

    // Runs `task` on the next iteration, before any poll wait.
    void post(Task task);

    // One iteration: posted tasks, then poll, then ready fds, then due timers.
    // Returns false once there is nothing left to wait on or stop() was called.
    bool run_once();

    // Runs until stop() is called or no work remains.
    void run();

    // Runs until `done()` holds, stop() is called, or no work remains.
    void run_until(const std::function<bool()>& done);

    void stop() { stopped_ = true; }
    bool stopped() const { return stopped_; }
    bool has_pending_work() const;

private:
    struct Watch {
        short events = 0;
        FdCallback callback;
        std::uint64_t serial = 0;
    };

    int next_poll_timeout_ms() const;
    void run_posted_tasks();
    void run_due_timers();

    std::unordered_map<int, Watch> watches_;
    std::map<std::pair<Clock::time_point, TimerId>, Task> timers_;
    std::unordered_map<TimerId, Clock::time_point> timer_deadlines_;
    std::deque<Task> posted_;
    std::uint64_t next_serial_ = 1;
    TimerId next_timer_id_ = 1;
    bool stopped_ = false;
};

}  // namespace shellserver::runtime
