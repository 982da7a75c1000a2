#include "exec/run.hpp"

#include "events/tracker.hpp"
#include "log/log.hpp"

#include <atomic>
#include <chrono>

namespace ordo::exec {

namespace {

auto next_run_stamp() -> int32_t {
    static std::atomic<int32_t> counter{0};
    return counter.fetch_add(1);
}

} // namespace

void RunSummary::record(const events::EventRecord& event) {
    ++events_dispatched;
    if (event.header.synthetic) {
        ++synthetic_events;
    }
    switch (events::kind_of(event)) {
    case events::EventKind::SuiteStarting:
        ++suites_started;
        break;
    case events::EventKind::SuiteCompleted:
        ++suites_completed;
        break;
    case events::EventKind::SuiteAborted:
        ++suites_aborted;
        break;
    case events::EventKind::TestSucceeded:
        ++tests_succeeded;
        break;
    case events::EventKind::TestFailed:
        ++tests_failed;
        break;
    case events::EventKind::TestIgnored:
        ++tests_ignored;
        break;
    case events::EventKind::TestPending:
        ++tests_pending;
        break;
    case events::EventKind::TestCanceled:
        ++tests_canceled;
        break;
    default:
        break;
    }
}

// ============================================================================
// Construction
// ============================================================================

Run::Run(Passkey<Run>, const RunConfig& config, events::EventSink sink)
    : config_(config), run_stamp_(next_run_stamp()) {
    sink_ = make_box<sort::SinkRecorder>(
        [this, user_sink = std::move(sink)](const events::EventRecord& event) {
            {
                std::lock_guard<std::mutex> lock(summary_mutex_);
                summary_.record(event);
            }
            if (user_sink) {
                user_sink(event);
            }
        });
}

auto Run::create(const RunConfig& config, events::EventSink sink)
    -> Result<Box<Run>, DispatchError> {
    auto run = make_box<Run>(Passkey<Run>(), config, std::move(sink));

    sort::SortingOptions sorting;
    sorting.timeout = config.sorting_timeout;
    sorting.late_events = config.late_events;
    if (config.sorting_timeout.count() > 0) {
        auto timer = sort::DeadlineTimer::create();
        if (is_err(timer)) {
            return DispatchError::make(DispatchErrorKind::ThreadStart, unwrap_err(timer));
        }
        run->timer_ = std::move(unwrap(timer));
        sorting.timer = run->timer_.get();
    }

    run->gate_ = sort::SuiteSortingGate::create(*run->sink_, sorting);

    DispatcherOptions dispatch;
    dispatch.pool_size = config.pool_size;
    dispatch.concurrent = config.concurrent;
    dispatch.queue_capacity = config.queue_capacity;
    auto dispatcher = ConcurrentDispatcher::create(dispatch);
    if (is_err(dispatcher)) {
        return unwrap_err(dispatcher);
    }
    run->dispatcher_ = std::move(unwrap(dispatcher));

    RunnerOptions runner;
    runner.parallel_tests = config.parallel_tests;
    runner.declared_order = config.declared_order;
    run->runner_ = make_box<SuiteRunner>(*run->dispatcher_, runner, sorting);

    ORDO_LOG_DEBUG("run", "run " << run->run_stamp_ << ": pool=" << config.pool_size
                                 << " timeout=" << config.sorting_timeout.count() << "ms"
                                 << " late_events="
                                 << sort::late_event_policy_name(config.late_events));
    return std::move(run);
}

Run::~Run() {
    if (dispatcher_) {
        dispatcher_->shutdown();
    }
    if (timer_) {
        timer_->shutdown();
    }
}

// ============================================================================
// Execution
// ============================================================================

auto Run::execute(const std::vector<Rc<Suite>>& suites) -> Result<RunSummary, DispatchError> {
    if (executed_) {
        return DispatchError::make(DispatchErrorKind::Usage, "a run executes only once");
    }
    executed_ = true;

    auto begin = std::chrono::steady_clock::now();
    ORDO_LOG_INFO("run", "running " << suites.size() << " suites");

    events::Tracker tracker{events::Ordinal(run_stamp_)};
    for (const auto& suite : suites) {
        runner_->submit_suite(dispatcher_->root_group(), suite, *gate_, tracker.next_tracker());
    }
    auto awaited = dispatcher_->await_all();

    // Every producer is done; whatever is still open can only be released
    // by force.
    if (gate_->open_slots() > 0) {
        ORDO_LOG_WARN("run", gate_->open_slots() << " suites still open after all units ran");
        auto forced = gate_->force_finish();
        if (is_err(forced) && is_ok(awaited)) {
            return DispatchError::from_gate(unwrap_err(forced));
        }
    }
    if (is_err(awaited)) {
        return unwrap_err(awaited);
    }
    if (auto error = gate_->async_error()) {
        return DispatchError::from_gate(*error);
    }

    std::lock_guard<std::mutex> lock(summary_mutex_);
    summary_.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - begin)
                               .count();
    ORDO_LOG_INFO("run", summary_.tests_total()
                             << " tests: " << summary_.tests_succeeded << " succeeded, "
                             << summary_.tests_failed << " failed, " << summary_.tests_ignored
                             << " ignored in " << summary_.duration_ms << "ms");
    return summary_;
}

void Run::request_stop() {
    dispatcher_->request_stop();
}

} // namespace ordo::exec
