//! # Tracker
//!
//! Holds the current ordinal of one unit of work and hands out ordinals in
//! sequence. Each unit owns its own tracker; concurrent children receive a
//! forked tracker from `next_tracker()` so no counter is shared across
//! threads.

#ifndef ORDO_EVENTS_TRACKER_HPP
#define ORDO_EVENTS_TRACKER_HPP

#include "events/ordinal.hpp"

#include <mutex>

namespace ordo::events {

class Tracker {
public:
    explicit Tracker(Ordinal first = Ordinal(0));

    Tracker(const Tracker& other);
    Tracker& operator=(const Tracker& other);

    /// Returns the current ordinal and advances to its `next()`.
    auto next_ordinal() -> Ordinal;

    /// Forks a child tracker seeded at a new branch; this tracker continues
    /// past the fork.
    auto next_tracker() -> Tracker;

    /// The ordinal the next call to `next_ordinal()` will return.
    auto peek() const -> Ordinal;

private:
    Ordinal current_;
    mutable std::mutex mutex_;
};

} // namespace ordo::events

#endif // ORDO_EVENTS_TRACKER_HPP
