//! # Ordinal
//!
//! Logical timestamps that give every event of a run a total order.
//!
//! An ordinal is a run stamp followed by a path of stamps. `next()` bumps the
//! last stamp; `next_new_branch()` forks a child lineage by appending a stamp:
//!
//! ```text
//! [7, 0, 1]            current
//! [7, 0, 1, 0]         branch seed (child work)
//! [7, 0, 2]            continuation (parent's next event)
//! ```
//!
//! Comparison is lexicographic over the path; when one path is a prefix of
//! the other the longer one is greater, so everything derived from a branch
//! sorts after the fork point and before the parent's continuation.

#ifndef ORDO_EVENTS_ORDINAL_HPP
#define ORDO_EVENTS_ORDINAL_HPP

#include <compare>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace ordo::events {

class Ordinal {
public:
    /// Seed ordinal for a run: `[run_stamp, 0]`.
    explicit Ordinal(int32_t run_stamp);

    /// Returns a strictly greater ordinal on the same lineage.
    [[nodiscard]] auto next() const -> Ordinal;

    /// Forks this ordinal.
    ///
    /// Returns `(branch_seed, continuation)` where
    /// `*this < branch_seed < continuation` and every ordinal derived from
    /// `branch_seed` by `next()`/`next_new_branch()` stays below
    /// `continuation`.
    [[nodiscard]] auto next_new_branch() const -> std::pair<Ordinal, Ordinal>;

    [[nodiscard]] auto run_stamp() const -> int32_t {
        return run_stamp_;
    }

    [[nodiscard]] auto stamps() const -> const std::vector<int32_t>& {
        return stamps_;
    }

    /// Branch depth (1 for a seed ordinal).
    [[nodiscard]] auto depth() const -> size_t {
        return stamps_.size();
    }

    /// Run stamp first, then the path (e.g. "[7, 0, 2]").
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator<=>(const Ordinal& other) const -> std::strong_ordering;
    [[nodiscard]] auto operator==(const Ordinal& other) const -> bool = default;

private:
    Ordinal(int32_t run_stamp, std::vector<int32_t> stamps);

    int32_t run_stamp_;
    std::vector<int32_t> stamps_;
};

} // namespace ordo::events

#endif // ORDO_EVENTS_ORDINAL_HPP
