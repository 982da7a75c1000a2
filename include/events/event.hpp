//! # Lifecycle Events
//!
//! The closed set of events that flow from executing suites through the
//! sorting gates to the reporter.
//!
//! ## Kinds
//!
//! | Kind             | Scope | Notes                                      |
//! |------------------|-------|--------------------------------------------|
//! | `SuiteStarting`  | suite | opens a suite slot                         |
//! | `SuiteCompleted` | suite | terminal                                   |
//! | `SuiteAborted`   | suite | terminal, carries the cause                |
//! | `TestStarting`   | test  | opens a test slot                          |
//! | `TestSucceeded`  | test  | terminal, carries `info_count`             |
//! | `TestFailed`     | test  | terminal, carries message and `info_count` |
//! | `TestIgnored`    | test  | standalone (no TestStarting)               |
//! | `TestPending`    | test  | terminal                                   |
//! | `TestCanceled`   | test  | terminal                                   |
//! | `ScopeOpened`    | suite | declared scope boundary                    |
//! | `ScopeClosed`    | suite | declared scope boundary                    |
//! | `InfoProvided`   | either| tied to a test when `test_name` is set     |
//! | `MarkupProvided` | either| tied to a test when `test_name` is set     |
//!
//! Ordering authority is the ordinal; `timestamp_ms` is informational.

#ifndef ORDO_EVENTS_EVENT_HPP
#define ORDO_EVENTS_EVENT_HPP

#include "events/ordinal.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace ordo::events {

// ============================================================================
// Header
// ============================================================================

/// Attributes shared by every event kind.
struct EventHeader {
    Ordinal ordinal{0};
    std::string suite_name;
    std::string suite_id;                       ///< Unique per suite instance in a run
    std::optional<std::string> test_name;       ///< Set on test-scoped events
    std::optional<std::string> parent_suite_id; ///< Nested-suite linkage
    std::string thread_name;
    int64_t timestamp_ms = 0;
    bool synthetic = false; ///< Fabricated by a forced (timed-out) flush
};

// ============================================================================
// Bodies
// ============================================================================

struct SuiteStarting {};

struct SuiteCompleted {
    int64_t duration_ms = 0;
};

struct SuiteAborted {
    std::string message;
    int64_t duration_ms = 0;
};

struct TestStarting {};

struct TestSucceeded {
    size_t info_count = 0;
    int64_t duration_ms = 0;
};

struct TestFailed {
    std::string message;
    size_t info_count = 0;
    int64_t duration_ms = 0;
};

struct TestIgnored {};

struct TestPending {
    size_t info_count = 0;
    int64_t duration_ms = 0;
};

struct TestCanceled {
    std::string message;
    size_t info_count = 0;
    int64_t duration_ms = 0;
};

struct ScopeOpened {
    std::string text;
};

struct ScopeClosed {
    std::string text;
};

struct InfoProvided {
    std::string message;
};

struct MarkupProvided {
    std::string text;
};

using EventBody =
    std::variant<SuiteStarting, SuiteCompleted, SuiteAborted, TestStarting, TestSucceeded,
                 TestFailed, TestIgnored, TestPending, TestCanceled, ScopeOpened, ScopeClosed,
                 InfoProvided, MarkupProvided>;

/// One lifecycle event. Immutable once produced.
struct EventRecord {
    EventHeader header;
    EventBody body;
};

/// The reporter callback: receives the final, fully ordered stream.
using EventSink = std::function<void(const EventRecord&)>;

// ============================================================================
// Classification
// ============================================================================

enum class EventKind {
    SuiteStarting,
    SuiteCompleted,
    SuiteAborted,
    TestStarting,
    TestSucceeded,
    TestFailed,
    TestIgnored,
    TestPending,
    TestCanceled,
    ScopeOpened,
    ScopeClosed,
    InfoProvided,
    MarkupProvided
};

[[nodiscard]] auto kind_of(const EventRecord& event) -> EventKind;

/// Kind name as used in logs and `to_string` (e.g. "TestSucceeded").
[[nodiscard]] auto kind_name(EventKind kind) -> const char*;

[[nodiscard]] inline auto kind_name(const EventRecord& event) -> const char* {
    return kind_name(kind_of(event));
}

/// SuiteCompleted or SuiteAborted.
[[nodiscard]] auto is_suite_terminal(const EventRecord& event) -> bool;

/// TestSucceeded, TestFailed, TestPending or TestCanceled.
[[nodiscard]] auto is_test_terminal(const EventRecord& event) -> bool;

/// InfoProvided or MarkupProvided.
[[nodiscard]] auto is_note(const EventRecord& event) -> bool;

/// Number of notes announced by a test terminal event (0 for other kinds).
[[nodiscard]] auto info_count_of(const EventRecord& event) -> size_t;

/// Free text carried by the event (message, scope text, markup), or "".
[[nodiscard]] auto event_text(const EventRecord& event) -> std::string;

/// One-line rendering: `TestSucceeded Calc/add [7, 0, 2, 1] (worker-1)`.
[[nodiscard]] auto to_string(const EventRecord& event) -> std::string;

} // namespace ordo::events

#endif // ORDO_EVENTS_EVENT_HPP
