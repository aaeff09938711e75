#include "runtime/event_loop.hpp"

#include <cerrno>
#include <climits>
#include <cstring>
#include <poll.h>
#include <string>
#include <vector>
#include "core/logging/logger.hpp"

namespace shellserver::runtime {

void EventLoop::watch_fd(const int fd, const short events, FdCallback callback) {
    Watch watch;
    watch.events = events;
    watch.callback = std::move(callback);
    watch.serial = next_serial_++;
    watches_[fd] = std::move(watch);
}

void EventLoop::unwatch_fd(const int fd) {
    watches_.erase(fd);
}

bool EventLoop::is_watching(const int fd) const {
    return watches_.find(fd) != watches_.end();
}

EventLoop::TimerId EventLoop::add_timer(const std::chrono::milliseconds delay,
                                        Task callback) {
    const TimerId id = next_timer_id_++;
    const auto deadline = Clock::now() + delay;
    timers_.emplace(std::make_pair(deadline, id), std::move(callback));
    timer_deadlines_.emplace(id, deadline);
    return id;
}

bool EventLoop::cancel_timer(const TimerId id) {
    auto it = timer_deadlines_.find(id);
    if (it == timer_deadlines_.end()) {
        return false;
    }
    timers_.erase(std::make_pair(it->second, id));
    timer_deadlines_.erase(it);
    return true;
}

void EventLoop::post(Task task) {
    posted_.push_back(std::move(task));
}

bool EventLoop::has_pending_work() const {
    return !watches_.empty() || !timers_.empty() || !posted_.empty();
}

int EventLoop::next_poll_timeout_ms() const {
    if (!posted_.empty()) {
        return 0;
    }
    if (timers_.empty()) {
        return -1;
    }
    const auto remaining = timers_.begin()->first.first - Clock::now();
    if (remaining <= Clock::duration::zero()) {
        return 0;
    }
    const auto ms = std::chrono::ceil<std::chrono::milliseconds>(remaining).count();
    return ms > INT_MAX ? INT_MAX : static_cast<int>(ms);
}

void EventLoop::run_posted_tasks() {
    // Tasks posted while draining wait for the next iteration.
    std::deque<Task> ready;
    ready.swap(posted_);
    while (!ready.empty()) {
        Task task = std::move(ready.front());
        ready.pop_front();
        task();
    }
}

void EventLoop::run_due_timers() {
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first.first <= now) {
        auto it = timers_.begin();
        const TimerId id = it->first.second;
        Task task = std::move(it->second);
        timers_.erase(it);
        timer_deadlines_.erase(id);
        task();
    }
}

bool EventLoop::run_once() {
    if (stopped_) {
        return false;
    }

    run_posted_tasks();
    if (stopped_ || !has_pending_work()) {
        return false;
    }

    std::vector<pollfd> fds;
    std::vector<std::uint64_t> serials;
    fds.reserve(watches_.size());
    serials.reserve(watches_.size());
    for (const auto& entry : watches_) {
        pollfd pfd{};
        pfd.fd = entry.first;
        pfd.events = entry.second.events;
        fds.push_back(pfd);
        serials.push_back(entry.second.serial);
    }

    const int rc = poll(fds.data(), static_cast<nfds_t>(fds.size()),
                        next_poll_timeout_ms());
    if (rc < 0) {
        if (errno == EINTR) {
            return true;
        }
        LOG_ERROR(std::string("EventLoop: poll failed: ") + std::strerror(errno));
        stopped_ = true;
        return false;
    }

    for (std::size_t i = 0; i < fds.size() && rc > 0; ++i) {
        if (fds[i].revents == 0) {
            continue;
        }
        // An earlier callback may have removed or replaced this watch.
        auto it = watches_.find(fds[i].fd);
        if (it == watches_.end() || it->second.serial != serials[i]) {
            continue;
        }
        FdCallback callback = it->second.callback;
        callback(fds[i].revents);
        if (stopped_) {
            return false;
        }
    }

    run_due_timers();
    return !stopped_ && has_pending_work();
}

void EventLoop::run() {
    while (run_once()) {
    }
}

void EventLoop::run_until(const std::function<bool()>& done) {
    while (!done() && run_once()) {
    }
}

}  // namespace shellserver::runtime
