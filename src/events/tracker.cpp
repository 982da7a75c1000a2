#include "events/tracker.hpp"

namespace ordo::events {

Tracker::Tracker(Ordinal first) : current_(std::move(first)) {}

Tracker::Tracker(const Tracker& other) : current_(other.peek()) {}

Tracker& Tracker::operator=(const Tracker& other) {
    if (this != &other) {
        Ordinal copy = other.peek();
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(copy);
    }
    return *this;
}

auto Tracker::next_ordinal() -> Ordinal {
    std::lock_guard<std::mutex> lock(mutex_);
    Ordinal result = current_;
    current_ = current_.next();
    return result;
}

auto Tracker::next_tracker() -> Tracker {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [branch, continuation] = current_.next_new_branch();
    current_ = std::move(continuation);
    return Tracker(std::move(branch));
}

auto Tracker::peek() const -> Ordinal {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace ordo::events
