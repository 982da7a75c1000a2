//! # Deadline Timer
//!
//! One background thread that fires callbacks at their deadlines. The sorting
//! gates share a single timer per run to force slots that stay blocked past
//! the sorting timeout.
//!
//! ## Thread Safety
//!
//! `schedule_after` and `cancel` may be called from any thread, including
//! from inside a callback. Callbacks run on the timer thread with no timer
//! lock held, so they may take gate locks freely.

#ifndef ORDO_SORTING_DEADLINE_TIMER_HPP
#define ORDO_SORTING_DEADLINE_TIMER_HPP

#include "common.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>

namespace ordo::sort {

class DeadlineTimer {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using TimerId = uint64_t;

    /// Delays are clamped to [0, MAX_DELAY].
    static constexpr std::chrono::milliseconds MAX_DELAY{7LL * 24 * 60 * 60 * 1000};

    /// Starts the timer thread. Fails when the thread cannot be created.
    static auto create() -> Result<Box<DeadlineTimer>, std::string>;

    explicit DeadlineTimer(Passkey<DeadlineTimer>) {}
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    /// Runs `callback` once `delay` has elapsed, unless cancelled first.
    auto schedule_after(std::chrono::milliseconds delay, Callback callback) -> TimerId;

    /// Returns false if the entry already fired or was never scheduled.
    auto cancel(TimerId id) -> bool;

    /// Stops the thread and drops every pending entry. Idempotent.
    void shutdown();

    [[nodiscard]] auto pending() const -> size_t;

private:
    void run();

    using Key = std::pair<Clock::time_point, TimerId>;

    std::map<Key, Callback> entries_;
    std::unordered_map<TimerId, Clock::time_point> deadlines_;
    TimerId next_id_ = 1;
    bool stop_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::thread thread_;
};

} // namespace ordo::sort

#endif // ORDO_SORTING_DEADLINE_TIMER_HPP
