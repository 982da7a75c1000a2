#include "exec/suite_runner.hpp"

#include "log/log.hpp"

#include <chrono>
#include <exception>
#include <vector>

namespace ordo::exec {

namespace {

using Clock = std::chrono::steady_clock;

auto elapsed_ms(Clock::time_point since) -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - since).count();
}

} // namespace

// ============================================================================
// Emission
// ============================================================================

auto SuiteRunner::check(const sort::Released& released) -> bool {
    if (is_err(released)) {
        dispatcher_.report_error(DispatchError::from_gate(unwrap_err(released)));
        return false;
    }
    return true;
}

auto SuiteRunner::emit(const Unit& unit, sort::EventRecorder& recorder, events::Tracker& tracker,
                       std::optional<std::string> test_name, events::EventBody body) -> bool {
    events::EventRecord event;
    event.header.ordinal = tracker.next_ordinal();
    event.header.suite_name = unit.suite.name();
    event.header.suite_id = unit.suite.id();
    event.header.test_name = std::move(test_name);
    event.header.parent_suite_id = unit.parent;
    event.header.thread_name = log::thread_name();
    event.header.timestamp_ms = log::epoch_ms();
    event.body = std::move(body);
    return check(recorder.record_event(event));
}

void SuiteRunner::emit_structural(const Unit& unit, const sort::PlanEntry& entry,
                                  sort::EventRecorder& recorder, events::Tracker& tracker) {
    switch (entry.kind) {
    case sort::PlanEntryKind::Test:
        if (entry.ignored) {
            emit(unit, recorder, tracker, entry.text, events::TestIgnored{});
        }
        break;
    case sort::PlanEntryKind::ScopeOpened:
        emit(unit, recorder, tracker, std::nullopt, events::ScopeOpened{entry.text});
        break;
    case sort::PlanEntryKind::ScopeClosed:
        emit(unit, recorder, tracker, std::nullopt, events::ScopeClosed{entry.text});
        break;
    case sort::PlanEntryKind::Note:
        emit(unit, recorder, tracker, std::nullopt, events::InfoProvided{entry.text});
        break;
    }
}

// ============================================================================
// Suites
// ============================================================================

void SuiteRunner::submit_suite(TaskGroup& group, Rc<Suite> suite, sort::SuiteSortingGate& gate,
                               events::Tracker tracker, std::optional<std::string> parent) {
    if (!check(gate.expect_suite(suite->id(), suite->name()))) {
        return;
    }

    auto shared_tracker = make_rc<events::Tracker>(tracker);
    auto started = make_rc<std::atomic<bool>>(false);
    auto parent_id = make_rc<std::optional<std::string>>(std::move(parent));
    sort::SuiteSortingGate* target = &gate;

    Task task;
    task.name = suite->name();
    task.run = [this, suite, target, shared_tracker, started, parent_id]() {
        run_suite(suite, *target, *shared_tracker, *parent_id, started.get());
    };
    task.on_failure = [this, suite, target, shared_tracker, started,
                       parent_id](const std::string& message) {
        if (!started->load()) {
            check(target->withdraw_suite(suite->id()));
            return;
        }
        emit(Unit{*suite, *parent_id}, *target, *shared_tracker, std::nullopt,
             events::SuiteAborted{message, 0});
    };
    task.on_skip = [this, suite, target]() {
        ORDO_LOG_DEBUG("run", "suite '" << suite->name() << "' skipped");
        check(target->withdraw_suite(suite->id()));
    };

    auto submitted = group.submit(std::move(task));
    if (is_err(submitted)) {
        check(gate.withdraw_suite(suite->id()));
    }
}

void SuiteRunner::run_suite(const Rc<Suite>& suite, sort::SuiteSortingGate& gate,
                            events::Tracker& tracker, const std::optional<std::string>& parent,
                            std::atomic<bool>* started) {
    Unit unit{*suite, parent};

    if (dispatcher_.stop_requested()) {
        // Only submitted suites hold a reservation
        if (started != nullptr) {
            check(gate.withdraw_suite(suite->id()));
        }
        return;
    }

    auto begin = Clock::now();
    ORDO_LOG_DEBUG("run", "suite '" << suite->name() << "' starting");
    if (!emit(unit, gate, tracker, std::nullopt, events::SuiteStarting{})) {
        return;
    }
    if (started != nullptr) {
        started->store(true);
    }

    std::optional<std::string> abort_message;
    try {
        suite->before_all();
    } catch (const std::exception& e) {
        abort_message = std::string("before_all failed: ") + e.what();
    }

    if (!abort_message) {
        run_nested(suite, gate, tracker);

        auto plan = suite->plan();
        bool parallel = options_.parallel_tests && suite->parallel_tests() &&
                        dispatcher_.concurrent() && plan.test_count() > 1;
        bool complete = parallel
                            ? run_tests_concurrently(suite, plan, gate, tracker, parent)
                            : run_tests_sequentially(suite, plan, gate, tracker, parent);
        if (!complete) {
            abort_message = "run stopped";
        }

        try {
            suite->after_all();
        } catch (const std::exception& e) {
            if (!abort_message) {
                abort_message = std::string("after_all failed: ") + e.what();
            }
        }
    }

    int64_t duration = elapsed_ms(begin);
    if (abort_message) {
        ORDO_LOG_WARN("run", "suite '" << suite->name() << "' aborted: " << *abort_message);
        emit(unit, gate, tracker, std::nullopt, events::SuiteAborted{*abort_message, duration});
    } else {
        ORDO_LOG_DEBUG("run", "suite '" << suite->name() << "' completed in " << duration << "ms");
        emit(unit, gate, tracker, std::nullopt, events::SuiteCompleted{duration});
    }
}

void SuiteRunner::run_nested(const Rc<Suite>& suite, sort::SuiteSortingGate& gate,
                             events::Tracker& tracker) {
    auto nested = suite->nested_suites();
    if (nested.empty()) {
        return;
    }
    std::optional<std::string> parent = suite->id();

    if (!dispatcher_.concurrent() || nested.size() == 1) {
        for (const auto& child : nested) {
            run_suite(child, gate, tracker, parent);
        }
        return;
    }

    // The child gate releases nested suites in declaration order into the
    // parent's slot.
    auto child_gate = sort::SuiteSortingGate::create(gate, sorting_, suite->id());
    TaskGroup group(dispatcher_);
    for (const auto& child : nested) {
        submit_suite(group, child, *child_gate, tracker.next_tracker(), parent);
    }
    group.wait();

    if (child_gate->open_slots() > 0) {
        check(child_gate->force_finish());
    }
    if (auto error = child_gate->async_error()) {
        dispatcher_.report_error(DispatchError::from_gate(*error));
    }
}

// ============================================================================
// Tests
// ============================================================================

auto SuiteRunner::run_tests_sequentially(const Rc<Suite>& suite, const sort::TestPlan& plan,
                                         sort::SuiteSortingGate& gate, events::Tracker& tracker,
                                         const std::optional<std::string>& parent) -> bool {
    Unit unit{*suite, parent};
    for (const auto& entry : plan.entries()) {
        if (entry.kind != sort::PlanEntryKind::Test || entry.ignored) {
            emit_structural(unit, entry, gate, tracker);
            continue;
        }
        if (dispatcher_.stop_requested()) {
            return false;
        }
        run_one_test(*suite, entry.text, gate, tracker, parent);
    }
    return true;
}

auto SuiteRunner::run_tests_concurrently(const Rc<Suite>& suite, const sort::TestPlan& plan,
                                         sort::SuiteSortingGate& gate, events::Tracker& tracker,
                                         const std::optional<std::string>& parent) -> bool {
    Unit unit{*suite, parent};

    Rc<sort::TestSortingGate> test_gate;
    if (options_.declared_order) {
        auto created =
            sort::TestSortingGate::create(suite->name(), suite->id(), plan, gate, sorting_);
        if (is_err(created)) {
            dispatcher_.report_error(DispatchError::from_gate(unwrap_err(created)));
            return false;
        }
        test_gate = unwrap(created);
    } else {
        test_gate = sort::TestSortingGate::create_unplanned(suite->name(), suite->id(),
                                                            plan.size(), gate, sorting_);
    }
    if (!check(gate.attach_test_sorting_gate(suite->id(), test_gate))) {
        return false;
    }

    std::atomic<bool> skipped{false};
    TaskGroup group(dispatcher_);
    for (const auto& entry : plan.entries()) {
        if (entry.kind != sort::PlanEntryKind::Test || entry.ignored) {
            emit_structural(unit, entry, *test_gate, tracker);
            continue;
        }

        std::string test_name = entry.text;
        auto test_tracker = make_rc<events::Tracker>(tracker.next_tracker());
        auto abandon = [this, test_gate, test_name, &skipped]() {
            skipped.store(true);
            check(test_gate->abandon(test_name));
        };

        Task task;
        task.name = suite->name() + "/" + test_name;
        task.run = [this, suite, test_gate, test_name, test_tracker, parent]() {
            run_one_test(*suite, test_name, *test_gate, *test_tracker, parent);
        };
        task.on_failure = [abandon](const std::string&) { abandon(); };
        task.on_skip = abandon;

        if (is_err(group.submit(std::move(task)))) {
            abandon();
        }
    }
    group.wait();

    check(test_gate->seal());
    if (!test_gate->finished()) {
        check(test_gate->force_finish());
    }
    if (auto error = test_gate->async_error()) {
        dispatcher_.report_error(DispatchError::from_gate(*error));
    }
    return !skipped.load();
}

void SuiteRunner::run_one_test(Suite& suite, const std::string& test_name,
                               sort::EventRecorder& recorder, events::Tracker& tracker,
                               const std::optional<std::string>& parent) {
    Unit unit{suite, parent};
    if (!emit(unit, recorder, tracker, test_name, events::TestStarting{})) {
        return;
    }

    TestContext ctx(
        test_name,
        [&](events::EventBody body) { emit(unit, recorder, tracker, test_name, std::move(body)); },
        dispatcher_.stop_flag());

    auto begin = Clock::now();
    events::EventBody outcome;
    try {
        suite.run_test(test_name, ctx);
        outcome = events::TestSucceeded{ctx.notes(), elapsed_ms(begin)};
    } catch (const PendingTest&) {
        outcome = events::TestPending{ctx.notes(), elapsed_ms(begin)};
    } catch (const CanceledTest& e) {
        outcome = events::TestCanceled{e.what(), ctx.notes(), elapsed_ms(begin)};
    } catch (const std::exception& e) {
        outcome = events::TestFailed{e.what(), ctx.notes(), elapsed_ms(begin)};
    } catch (...) {
        outcome = events::TestFailed{"unknown exception", ctx.notes(), elapsed_ms(begin)};
    }
    emit(unit, recorder, tracker, test_name, std::move(outcome));
}

} // namespace ordo::exec
