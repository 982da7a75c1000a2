#include "events/ordinal.hpp"

#include <algorithm>
#include <sstream>

namespace ordo::events {

Ordinal::Ordinal(int32_t run_stamp) : run_stamp_(run_stamp), stamps_{0} {}

Ordinal::Ordinal(int32_t run_stamp, std::vector<int32_t> stamps)
    : run_stamp_(run_stamp), stamps_(std::move(stamps)) {}

auto Ordinal::next() const -> Ordinal {
    std::vector<int32_t> bumped = stamps_;
    bumped.back() += 1;
    return Ordinal(run_stamp_, std::move(bumped));
}

auto Ordinal::next_new_branch() const -> std::pair<Ordinal, Ordinal> {
    std::vector<int32_t> branch = stamps_;
    branch.push_back(0);
    return {Ordinal(run_stamp_, std::move(branch)), next()};
}

auto Ordinal::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "[" << run_stamp_;
    for (int32_t stamp : stamps_) {
        oss << ", " << stamp;
    }
    oss << "]";
    return oss.str();
}

auto Ordinal::operator<=>(const Ordinal& other) const -> std::strong_ordering {
    if (auto cmp = run_stamp_ <=> other.run_stamp_; cmp != 0) {
        return cmp;
    }
    size_t shorter = std::min(stamps_.size(), other.stamps_.size());
    for (size_t i = 0; i < shorter; ++i) {
        if (auto cmp = stamps_[i] <=> other.stamps_[i]; cmp != 0) {
            return cmp;
        }
    }
    // Equal up to the shorter length: the branch (longer path) comes after.
    return stamps_.size() <=> other.stamps_.size();
}

} // namespace ordo::events
