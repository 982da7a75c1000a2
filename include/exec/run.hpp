//! # Run
//!
//! One ordered run: owns the deadline timer, the root `SuiteSortingGate`,
//! the dispatcher and the runner, and tallies what reached the sink.
//!
//! ```cpp
//! auto created = Run::create(config, [](const events::EventRecord& e) {
//!     std::cout << events::to_string(e) << "\n";
//! });
//! if (is_err(created)) { ... }
//! auto summary = unwrap(created)->execute({calc, parser});
//! ```
//!
//! The sink is called from whichever thread completes a slot, one call at a
//! time, in final order.

#ifndef ORDO_EXEC_RUN_HPP
#define ORDO_EXEC_RUN_HPP

#include "common.hpp"
#include "events/event.hpp"
#include "exec/dispatcher.hpp"
#include "exec/run_config.hpp"
#include "exec/suite.hpp"
#include "exec/suite_runner.hpp"
#include "sorting/deadline_timer.hpp"
#include "sorting/recorder.hpp"
#include "sorting/suite_sorting_gate.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace ordo::exec {

/// Outcome counts, taken from the events the sink received.
struct RunSummary {
    size_t suites_started = 0;
    size_t suites_completed = 0;
    size_t suites_aborted = 0;
    size_t tests_succeeded = 0;
    size_t tests_failed = 0;
    size_t tests_ignored = 0;
    size_t tests_pending = 0;
    size_t tests_canceled = 0;
    size_t synthetic_events = 0;
    size_t events_dispatched = 0;
    int64_t duration_ms = 0;

    [[nodiscard]] auto tests_total() const -> size_t {
        return tests_succeeded + tests_failed + tests_ignored + tests_pending + tests_canceled;
    }

    [[nodiscard]] auto all_passed() const -> bool {
        return tests_failed == 0 && tests_canceled == 0 && suites_aborted == 0;
    }

    void record(const events::EventRecord& event);
};

class Run {
public:
    static auto create(const RunConfig& config, events::EventSink sink)
        -> Result<Box<Run>, DispatchError>;

    Run(Passkey<Run>, const RunConfig& config, events::EventSink sink);
    ~Run();

    Run(const Run&) = delete;
    Run& operator=(const Run&) = delete;

    /// Runs `suites` in submission order. Callable once.
    auto execute(const std::vector<Rc<Suite>>& suites) -> Result<RunSummary, DispatchError>;

    /// Cooperative stop; safe from any thread, including a sink callback.
    void request_stop();

    [[nodiscard]] auto run_stamp() const -> int32_t {
        return run_stamp_;
    }

private:
    RunConfig config_;
    int32_t run_stamp_;
    bool executed_ = false;

    RunSummary summary_;
    std::mutex summary_mutex_;

    Box<sort::DeadlineTimer> timer_;
    Box<sort::SinkRecorder> sink_;
    Rc<sort::SuiteSortingGate> gate_;
    Box<ConcurrentDispatcher> dispatcher_;
    Box<SuiteRunner> runner_;
};

} // namespace ordo::exec

#endif // ORDO_EXEC_RUN_HPP
