//! # Deadline Timer
//!
//! Entries are kept in a map ordered by (deadline, id) so the earliest one is
//! always `begin()`. The thread sleeps on the condition variable until that
//! deadline or until a new, earlier entry is scheduled.

#include "sorting/deadline_timer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace ordo::sort {

auto DeadlineTimer::create() -> Result<Box<DeadlineTimer>, std::string> {
    auto timer = make_box<DeadlineTimer>(Passkey<DeadlineTimer>());
    try {
        timer->thread_ = std::thread(&DeadlineTimer::run, timer.get());
    } catch (const std::system_error& e) {
        ORDO_LOG_ERROR("timer", "failed to start timer thread: " << e.what());
        return std::string("failed to start timer thread: ") + e.what();
    }
    return std::move(timer);
}

DeadlineTimer::~DeadlineTimer() {
    shutdown();
}

auto DeadlineTimer::schedule_after(std::chrono::milliseconds delay, Callback callback)
    -> TimerId {
    std::lock_guard<std::mutex> lock(mutex_);
    TimerId id = next_id_++;
    if (stop_) {
        return id;
    }
    // Keeps now() + delay inside the clock's range
    delay = std::clamp(delay, std::chrono::milliseconds(0), MAX_DELAY);
    auto deadline = Clock::now() + delay;
    bool earliest = entries_.empty() || deadline < entries_.begin()->first.first;
    entries_.emplace(Key{deadline, id}, std::move(callback));
    deadlines_.emplace(id, deadline);
    ORDO_LOG_TRACE("timer", "scheduled #" << id << " in " << delay.count() << "ms");
    if (earliest) {
        cv_.notify_one();
    }
    return id;
}

auto DeadlineTimer::cancel(TimerId id) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return false;
    }
    entries_.erase(Key{it->second, id});
    deadlines_.erase(it);
    return true;
}

void DeadlineTimer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        entries_.clear();
        deadlines_.clear();
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

auto DeadlineTimer::pending() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DeadlineTimer::run() {
    log::set_thread_name("ordo-timer");
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (entries_.empty()) {
            cv_.wait(lock, [this] { return stop_ || !entries_.empty(); });
            continue;
        }
        auto deadline = entries_.begin()->first.first;
        if (Clock::now() < deadline) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        auto node = entries_.extract(entries_.begin());
        deadlines_.erase(node.key().second);
        Callback callback = std::move(node.mapped());
        TimerId id = node.key().second;

        lock.unlock();
        ORDO_LOG_TRACE("timer", "firing #" << id);
        try {
            callback();
        } catch (const std::exception& e) {
            ORDO_LOG_ERROR("timer", "callback #" << id << " threw: " << e.what());
        }
        lock.lock();
    }
}

} // namespace ordo::sort
