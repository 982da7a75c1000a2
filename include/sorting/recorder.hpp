//! # Event Recorders
//!
//! The inbound face of every stage in the ordering pipeline:
//!
//! ```text
//! SuiteRunner → TestSortingGate → SuiteSortingGate (child) → SuiteSortingGate → SinkRecorder → reporter
//! ```
//!
//! Each stage implements `EventRecorder` and forwards to the next one by
//! reference. Downstream stages must outlive the stages feeding them.

#ifndef ORDO_SORTING_RECORDER_HPP
#define ORDO_SORTING_RECORDER_HPP

#include "common.hpp"
#include "events/event.hpp"
#include "sorting/gate_error.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string_view>

namespace ordo::sort {

/// Count of events a call released downstream, or the protocol violation.
using Released = Result<size_t, GateError>;

/// A stage that accepts lifecycle events. Must be safe to call from any thread.
class EventRecorder {
public:
    virtual ~EventRecorder() = default;

    virtual auto record_event(const events::EventRecord& event) -> Released = 0;
};

/// Adapts the reporter callback. Calls into the sink are serialized.
/// An exception from the sink reaches the caller; gates keep the event that
/// was not delivered and hand it off again on their next flush.
class SinkRecorder : public EventRecorder {
public:
    explicit SinkRecorder(events::EventSink sink) : sink_(std::move(sink)) {}

    auto record_event(const events::EventRecord& event) -> Released override;

    [[nodiscard]] auto dispatched() const -> size_t;

private:
    events::EventSink sink_;
    size_t dispatched_ = 0;
    mutable std::mutex mutex_;
};

// ============================================================================
// Gate Options
// ============================================================================

/// What a gate does with an event for a slot it already flushed.
enum class LateEventPolicy {
    Discard, ///< Drop it and log a warning
    Forward, ///< Pass it straight downstream, out of order
};

[[nodiscard]] auto late_event_policy_name(LateEventPolicy policy) -> const char*;

[[nodiscard]] auto parse_late_event_policy(std::string_view name)
    -> std::optional<LateEventPolicy>;

class DeadlineTimer;

struct SortingOptions {
    /// How long a blocking head slot may wait before it is forced. Zero disables.
    std::chrono::milliseconds timeout{10000};
    LateEventPolicy late_events = LateEventPolicy::Discard;
    /// Shared timer thread; forcing is disabled when null. Not owned.
    DeadlineTimer* timer = nullptr;
};

} // namespace ordo::sort

#endif // ORDO_SORTING_RECORDER_HPP
