//! # Suite Sorting Gate
//!
//! Serializes the interleaved event streams of concurrently running suites
//! into one stream, a whole suite at a time, in submission order.
//!
//! ## Slots
//!
//! Each suite owns a slot in a FIFO list. A slot is created by
//! `expect_suite()` when the suite is submitted, or by its SuiteStarting if
//! nobody reserved it. The head slot streams its events downstream as they
//! arrive; slots behind it buffer.
//!
//! ```text
//! Open ──terminal──▶ PendingSubOrdering ──test gates finished──▶ Ready ──▶ Flushed
//!   └──────────────terminal, no unfinished test gate────────────┘
//! ```
//!
//! ## Nested Suites
//!
//! A SuiteStarting whose `parent_suite_id` names an open slot of this gate is
//! folded into that slot: its events stream as part of the parent. Nested
//! suites that run concurrently go through a child gate whose downstream is
//! this gate, so they reach it already serialized.
//!
//! ## Locking
//!
//! One mutex guards the slot list. The gate never calls into a
//! `TestSortingGate` while holding it: readiness reads the test gate's
//! atomic `finished()` flag, and test gates report completion through a
//! listener.

#ifndef ORDO_SORTING_SUITE_SORTING_GATE_HPP
#define ORDO_SORTING_SUITE_SORTING_GATE_HPP

#include "common.hpp"
#include "events/event.hpp"
#include "sorting/deadline_timer.hpp"
#include "sorting/recorder.hpp"
#include "sorting/test_sorting_gate.hpp"

#include <deque>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ordo::sort {

enum class SlotState {
    Open,               ///< Awaiting the suite's terminal event
    PendingSubOrdering, ///< Terminal seen, an attached test gate is unfinished
    Ready,
    Flushed,
};

[[nodiscard]] auto slot_state_name(SlotState state) -> const char*;

class SuiteSortingGate : public EventRecorder,
                         public std::enable_shared_from_this<SuiteSortingGate> {
public:
    /// `downstream` must outlive the gate. `label` tags log lines.
    static auto create(EventRecorder& downstream, SortingOptions options = {},
                       std::string label = "root") -> Rc<SuiteSortingGate>;

    SuiteSortingGate(Passkey<SuiteSortingGate>, EventRecorder& downstream,
                     SortingOptions options, std::string label);
    ~SuiteSortingGate() override;

    SuiteSortingGate(const SuiteSortingGate&) = delete;
    SuiteSortingGate& operator=(const SuiteSortingGate&) = delete;

    auto record_event(const events::EventRecord& event) -> Released override;

    /// Reserves the next slot for a suite about to be submitted.
    auto expect_suite(const std::string& suite_id, const std::string& suite_name) -> Released;

    /// Drops a reserved slot whose suite will never start.
    auto withdraw_suite(const std::string& suite_id) -> Released;

    /// Gates the suite's terminal on `gate` finishing. `suite_id` may be the
    /// slot's own suite or a nested suite folded into it.
    auto attach_test_sorting_gate(const std::string& suite_id, Rc<TestSortingGate> gate)
        -> Released;

    auto flush_ready() -> Released;

    /// Closes every slot: forces attached test gates, synthesizes a
    /// SuiteAborted for suites that never finished and drops reservations
    /// that never started.
    auto force_finish() -> Released;

    [[nodiscard]] auto slot_state(const std::string& suite_id) const -> std::optional<SlotState>;

    [[nodiscard]] auto open_slots() const -> size_t;

    /// First error hit on the timer thread or in a completion listener.
    [[nodiscard]] auto async_error() const -> std::optional<GateError>;

    [[nodiscard]] auto label() const -> const std::string& {
        return label_;
    }

private:
    struct Attached {
        std::string suite_id;
        Rc<TestSortingGate> gate;
    };

    struct NestedSuite {
        std::string suite_id;
        std::string suite_name;
        std::optional<std::string> parent_suite_id;
        bool terminated = false; ///< Terminal buffered; the id closes once it streams
    };

    struct Slot {
        std::string suite_id;
        std::string suite_name;
        std::optional<std::string> parent_suite_id;
        uint64_t serial = 0;
        bool started = false;
        bool forced = false;
        std::deque<events::EventRecord> buffered;
        std::optional<events::EventRecord> terminal;
        std::vector<Attached> gates;
        std::vector<NestedSuite> nested; ///< Folded nested suites, in start order
        std::optional<events::Ordinal> last_ordinal;
    };

    using SlotList = std::list<Slot>;

    auto record_locked(const events::EventRecord& event) -> Released;
    void push(Slot& slot, const events::EventRecord& event);

    auto state_of(const Slot& slot) const -> SlotState;
    auto blocks_stream(const Slot& slot, const events::EventRecord& event) const -> bool;
    auto awaiting_sub_ordering(const Slot& slot) const -> bool;
    static auto unfinished_gates(const Slot& slot) -> std::vector<Rc<TestSortingGate>>;

    auto settle_locked() -> Released;
    auto flush_locked() -> Released;
    void close_slot(const Slot& slot);
    void erase_slot(SlotList::iterator it);
    auto forward(const events::EventRecord& event) -> Released;
    auto late_event(const events::EventRecord& event) -> Released;
    auto synthesize_abort(Slot& slot, const NestedSuite& suite, const std::string& message)
        -> events::EventRecord;
    void note_async_error(const Released& result);

    void on_sub_ordering_finished();
    void arm_timer_locked();
    void disarm_locked();
    void on_timeout(uint64_t serial);

    EventRecorder& downstream_;
    SortingOptions options_;
    std::string label_;

    SlotList slots_;
    std::unordered_map<std::string, SlotList::iterator> open_;
    std::unordered_set<std::string> closed_;
    uint64_t next_serial_ = 1;

    std::optional<DeadlineTimer::TimerId> armed_timer_;
    uint64_t armed_serial_ = 0;
    std::optional<GateError> async_error_;

    mutable std::mutex mutex_;
};

} // namespace ordo::sort

#endif // ORDO_SORTING_SUITE_SORTING_GATE_HPP
