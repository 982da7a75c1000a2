//! # Suite Runner
//!
//! Turns a `Suite` into lifecycle events. Every event carries an ordinal
//! from the tracker handed to the suite; concurrent units get branch
//! trackers so their events still order after the unit that spawned them.
//!
//! ## Routing
//!
//! | Events                    | Recorder                                   |
//! |---------------------------|--------------------------------------------|
//! | Suite start and terminal  | the suite's `SuiteSortingGate`             |
//! | Tests run sequentially    | the suite's `SuiteSortingGate`             |
//! | Tests run concurrently    | a per-suite `TestSortingGate`, attached    |
//! | Concurrent nested suites  | a child `SuiteSortingGate` feeding the parent |
//!
//! Nested suites run inline when there is only one or when the dispatcher
//! is not concurrent; their events are folded into the parent's slot.

#ifndef ORDO_EXEC_SUITE_RUNNER_HPP
#define ORDO_EXEC_SUITE_RUNNER_HPP

#include "events/tracker.hpp"
#include "exec/dispatcher.hpp"
#include "exec/suite.hpp"
#include "sorting/suite_sorting_gate.hpp"
#include "sorting/test_sorting_gate.hpp"

#include <atomic>
#include <optional>
#include <string>

namespace ordo::exec {

struct RunnerOptions {
    bool parallel_tests = true;
    bool declared_order = true;
};

class SuiteRunner {
public:
    SuiteRunner(ConcurrentDispatcher& dispatcher, RunnerOptions options,
                sort::SortingOptions sorting)
        : dispatcher_(dispatcher), options_(options), sorting_(sorting) {}

    /// Reserves the suite's slot in `gate` and queues the suite on `group`.
    /// `gate` must outlive the group's wait.
    void submit_suite(TaskGroup& group, Rc<Suite> suite, sort::SuiteSortingGate& gate,
                      events::Tracker tracker, std::optional<std::string> parent = std::nullopt);

    /// Runs the suite on the calling thread. `started` is set once
    /// SuiteStarting was recorded.
    void run_suite(const Rc<Suite>& suite, sort::SuiteSortingGate& gate,
                   events::Tracker& tracker, const std::optional<std::string>& parent,
                   std::atomic<bool>* started = nullptr);

private:
    struct Unit {
        const Suite& suite;
        const std::optional<std::string>& parent;
    };

    void run_nested(const Rc<Suite>& suite, sort::SuiteSortingGate& gate,
                    events::Tracker& tracker);
    /// Returns false when the run was stopped before every test ran.
    auto run_tests_sequentially(const Rc<Suite>& suite, const sort::TestPlan& plan,
                                sort::SuiteSortingGate& gate, events::Tracker& tracker,
                                const std::optional<std::string>& parent) -> bool;
    auto run_tests_concurrently(const Rc<Suite>& suite, const sort::TestPlan& plan,
                                sort::SuiteSortingGate& gate, events::Tracker& tracker,
                                const std::optional<std::string>& parent) -> bool;
    void run_one_test(Suite& suite, const std::string& test_name, sort::EventRecorder& recorder,
                      events::Tracker& tracker, const std::optional<std::string>& parent);
    void emit_structural(const Unit& unit, const sort::PlanEntry& entry,
                         sort::EventRecorder& recorder, events::Tracker& tracker);

    auto emit(const Unit& unit, sort::EventRecorder& recorder, events::Tracker& tracker,
              std::optional<std::string> test_name, events::EventBody body) -> bool;
    /// Reports a gate error to the dispatcher. Returns true on success.
    auto check(const sort::Released& released) -> bool;

    ConcurrentDispatcher& dispatcher_;
    RunnerOptions options_;
    sort::SortingOptions sorting_;
};

} // namespace ordo::exec

#endif // ORDO_EXEC_SUITE_RUNNER_HPP
