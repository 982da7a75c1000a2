//! # End-to-End Ordering Tests
//!
//! Runs real suites on a real pool and checks that the sink sees the
//! sequential order no matter which unit finishes first.

#include "exec/run.hpp"
#include "test_support.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace ordo;
using namespace ordo::exec;
using namespace std::chrono_literals;
using ordo::testing::CaptureRecorder;

namespace {

auto config_with_pool(size_t pool_size) -> RunConfig {
    RunConfig config;
    config.pool_size = pool_size;
    config.sorting_timeout = 5000ms;
    return config;
}

auto sleeping(std::chrono::milliseconds delay) -> FunctionSuite::TestBody {
    return [delay](TestContext&) { std::this_thread::sleep_for(delay); };
}

auto no_op() -> FunctionSuite::TestBody {
    return [](TestContext&) {};
}

} // namespace

class RunOrderingTest : public ::testing::Test {
protected:
    auto run(const RunConfig& config, const std::vector<Rc<Suite>>& suites) -> RunSummary {
        auto created = Run::create(config, [this](const events::EventRecord& event) {
            capture.record_event(event);
        });
        EXPECT_TRUE(is_ok(created));
        if (is_err(created)) {
            return {};
        }
        auto result = unwrap(created)->execute(suites);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).to_string() : "");
        if (is_err(result)) {
            return {};
        }
        return unwrap(result);
    }

    /// Labels of the events whose suite name is `suite`.
    auto labels_of(const std::string& suite) const -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& event : capture.events()) {
            if (event.header.suite_name == suite) {
                result.push_back(CaptureRecorder::label(event));
            }
        }
        return result;
    }

    CaptureRecorder capture;
};

// ============================================================================
// Suite Order
// ============================================================================

TEST_F(RunOrderingTest, SuitesReportInSubmissionOrder) {
    auto a = make_rc<FunctionSuite>("A");
    a->test("t1", no_op()).test("t2", sleeping(80ms)).test("t3", no_op());
    auto b = make_rc<FunctionSuite>("B");
    b->test("u1", no_op());

    auto summary = run(config_with_pool(2), {a, b});

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting A",
                                    "TestStarting A/t1",
                                    "TestSucceeded A/t1",
                                    "TestStarting A/t2",
                                    "TestSucceeded A/t2",
                                    "TestStarting A/t3",
                                    "TestSucceeded A/t3",
                                    "SuiteCompleted A",
                                    "SuiteStarting B",
                                    "TestStarting B/u1",
                                    "TestSucceeded B/u1",
                                    "SuiteCompleted B",
                                }));
    EXPECT_EQ(summary.suites_completed, 2u);
    EXPECT_EQ(summary.tests_succeeded, 4u);
    EXPECT_EQ(summary.events_dispatched, 12u);
}

TEST_F(RunOrderingTest, SlowFirstSuiteStillLeads) {
    auto slow = make_rc<FunctionSuite>("Slow");
    slow->test("wait", sleeping(100ms));
    auto fast = make_rc<FunctionSuite>("Fast");
    fast->test("quick", no_op());

    run(config_with_pool(4), {slow, fast});

    auto labels = capture.labels();
    ASSERT_EQ(labels.size(), 8u);
    EXPECT_EQ(labels.front(), "SuiteStarting Slow");
    EXPECT_EQ(labels[3], "SuiteCompleted Slow");
    EXPECT_EQ(labels[4], "SuiteStarting Fast");
}

// ============================================================================
// Test Order Within a Suite
// ============================================================================

TEST_F(RunOrderingTest, TestsReportInDeclaredOrderWithNotes) {
    auto calc = make_rc<FunctionSuite>("Calc");
    calc->test("add",
               [](TestContext& ctx) {
                   std::this_thread::sleep_for(60ms);
                   ctx.info("2 + 2 = 4");
               })
        .test("sub", no_op())
        .test("mul", sleeping(20ms));

    auto summary = run(config_with_pool(4), {calc});

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting Calc",
                                    "TestStarting Calc/add",
                                    "InfoProvided Calc/add",
                                    "TestSucceeded Calc/add",
                                    "TestStarting Calc/sub",
                                    "TestSucceeded Calc/sub",
                                    "TestStarting Calc/mul",
                                    "TestSucceeded Calc/mul",
                                    "SuiteCompleted Calc",
                                }));
    auto events = capture.events();
    EXPECT_EQ(events::info_count_of(events[3]), 1u);
    EXPECT_EQ(summary.synthetic_events, 0u);
}

TEST_F(RunOrderingTest, OrdinalsIncreaseAlongTheStream) {
    auto first = make_rc<FunctionSuite>("First");
    first->test("a", sleeping(30ms)).test("b", no_op());
    auto second = make_rc<FunctionSuite>("Second");
    second->test("c", no_op());

    run(config_with_pool(3), {first, second});

    auto events = capture.events();
    ASSERT_FALSE(events.empty());
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_TRUE(events[i - 1].header.ordinal < events[i].header.ordinal)
            << events::to_string(events[i - 1]) << " vs " << events::to_string(events[i]);
    }
}

TEST_F(RunOrderingTest, ScopesAndIgnoredTestsKeepTheirPlace) {
    auto parser = make_rc<FunctionSuite>("Parser");
    parser->note("grammar v2")
        .scope("numbers",
               [](FunctionSuite& s) {
                   s.test("integers", sleeping(30ms)).ignore("floats");
               })
        .test("strings", no_op());

    auto summary = run(config_with_pool(2), {parser});

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting Parser",
                                    "InfoProvided Parser",
                                    "ScopeOpened Parser",
                                    "TestStarting Parser/integers",
                                    "TestSucceeded Parser/integers",
                                    "TestIgnored Parser/floats",
                                    "ScopeClosed Parser",
                                    "TestStarting Parser/strings",
                                    "TestSucceeded Parser/strings",
                                    "SuiteCompleted Parser",
                                }));
    EXPECT_EQ(summary.tests_ignored, 1u);
}

TEST_F(RunOrderingTest, FirstStartOrderWhenDeclaredOrderIsOff) {
    auto config = config_with_pool(2);
    config.declared_order = false;

    auto suite = make_rc<FunctionSuite>("Loose");
    suite->test("x", sleeping(10ms)).test("y", sleeping(10ms)).test("z", sleeping(10ms));

    auto summary = run(config, {suite});

    auto labels = labels_of("Loose");
    ASSERT_EQ(labels.size(), 8u);
    EXPECT_EQ(labels.front(), "SuiteStarting Loose");
    EXPECT_EQ(labels.back(), "SuiteCompleted Loose");
    // Every test still reports as one contiguous start/terminal pair
    for (size_t i = 1; i + 1 < labels.size(); i += 2) {
        EXPECT_EQ(labels[i].rfind("TestStarting ", 0), 0u) << labels[i];
        EXPECT_EQ(labels[i + 1].substr(labels[i + 1].find(' ')),
                  labels[i].substr(labels[i].find(' ')));
    }
    EXPECT_EQ(summary.tests_succeeded, 3u);
}

// ============================================================================
// Outcomes and Error Isolation
// ============================================================================

TEST_F(RunOrderingTest, FailingTestDoesNotDisturbOthers) {
    auto suite = make_rc<FunctionSuite>("Mixed");
    suite->test("ok", no_op())
        .test("broken", [](TestContext&) { throw std::runtime_error("expected 4, got 5"); })
        .test("later", sleeping(10ms))
        .test("todo", [](TestContext&) { throw PendingTest(); })
        .test("skipped", [](TestContext&) { throw CanceledTest("no network"); });

    auto summary = run(config_with_pool(3), {suite});

    EXPECT_EQ(summary.tests_succeeded, 2u);
    EXPECT_EQ(summary.tests_failed, 1u);
    EXPECT_EQ(summary.tests_pending, 1u);
    EXPECT_EQ(summary.tests_canceled, 1u);
    EXPECT_EQ(summary.suites_completed, 1u);
    EXPECT_FALSE(summary.all_passed());

    bool saw_failure = false;
    for (const auto& event : capture.events()) {
        if (events::kind_of(event) == events::EventKind::TestFailed) {
            saw_failure = true;
            EXPECT_EQ(*event.header.test_name, "broken");
            EXPECT_EQ(events::event_text(event), "expected 4, got 5");
        }
    }
    EXPECT_TRUE(saw_failure);
}

TEST_F(RunOrderingTest, BeforeAllFailureAbortsOnlyThatSuite) {
    auto broken = make_rc<FunctionSuite>("Broken");
    broken->on_before_all([] { throw std::runtime_error("fixture missing"); })
        .test("never", no_op());
    auto healthy = make_rc<FunctionSuite>("Healthy");
    healthy->test("fine", no_op());

    auto summary = run(config_with_pool(2), {broken, healthy});

    auto labels = capture.labels();
    ASSERT_GE(labels.size(), 2u);
    EXPECT_EQ(labels[0], "SuiteStarting Broken");
    EXPECT_EQ(labels[1], "SuiteAborted Broken");
    EXPECT_EQ(summary.suites_aborted, 1u);
    EXPECT_EQ(summary.suites_completed, 1u);
    EXPECT_EQ(summary.tests_succeeded, 1u);
}

// ============================================================================
// Nesting, Modes and Liveness
// ============================================================================

TEST_F(RunOrderingTest, NestedSuitesFoldIntoTheirParent) {
    auto memory = make_rc<FunctionSuite>("Memory");
    memory->test("put", sleeping(40ms));
    auto disk = make_rc<FunctionSuite>("Disk");
    disk->test("write", no_op());
    auto storage = make_rc<FunctionSuite>("Storage");
    storage->nest(memory).nest(disk).test("open", no_op());
    auto after = make_rc<FunctionSuite>("After");
    after->test("done", no_op());

    auto summary = run(config_with_pool(4), {storage, after});

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting Storage",
                                    "SuiteStarting Memory",
                                    "TestStarting Memory/put",
                                    "TestSucceeded Memory/put",
                                    "SuiteCompleted Memory",
                                    "SuiteStarting Disk",
                                    "TestStarting Disk/write",
                                    "TestSucceeded Disk/write",
                                    "SuiteCompleted Disk",
                                    "TestStarting Storage/open",
                                    "TestSucceeded Storage/open",
                                    "SuiteCompleted Storage",
                                    "SuiteStarting After",
                                    "TestStarting After/done",
                                    "TestSucceeded After/done",
                                    "SuiteCompleted After",
                                }));
    EXPECT_EQ(summary.suites_completed, 4u);
}

TEST_F(RunOrderingTest, SequentialModeProducesTheSameStream) {
    auto config = config_with_pool(1);
    config.concurrent = false;

    auto calc = make_rc<FunctionSuite>("Calc");
    calc->test("add", no_op()).test("sub", no_op());
    auto parser = make_rc<FunctionSuite>("Parser");
    parser->test("parse", no_op());

    auto summary = run(config, {calc, parser});

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting Calc",
                                    "TestStarting Calc/add",
                                    "TestSucceeded Calc/add",
                                    "TestStarting Calc/sub",
                                    "TestSucceeded Calc/sub",
                                    "SuiteCompleted Calc",
                                    "SuiteStarting Parser",
                                    "TestStarting Parser/parse",
                                    "TestSucceeded Parser/parse",
                                    "SuiteCompleted Parser",
                                }));
    EXPECT_TRUE(summary.all_passed());
}

TEST_F(RunOrderingTest, SequentialSuiteOnConcurrentPool) {
    auto config = config_with_pool(2);
    config.parallel_tests = false;

    auto suite = make_rc<FunctionSuite>("Serial");
    suite->test("one", sleeping(20ms)).test("two", no_op());

    run(config, {suite});

    EXPECT_EQ(labels_of("Serial"), (std::vector<std::string>{
                                       "SuiteStarting Serial",
                                       "TestStarting Serial/one",
                                       "TestSucceeded Serial/one",
                                       "TestStarting Serial/two",
                                       "TestSucceeded Serial/two",
                                       "SuiteCompleted Serial",
                                   }));
}

TEST_F(RunOrderingTest, TimeoutKeepsTheRunMoving) {
    auto config = config_with_pool(2);
    config.sorting_timeout = 50ms;

    auto slow = make_rc<FunctionSuite>("Slow");
    slow->test("stuck", sleeping(400ms)).test("after", no_op());
    auto quick = make_rc<FunctionSuite>("Quick");
    quick->test("fast", no_op());

    auto start = std::chrono::steady_clock::now();
    std::atomic<int64_t> forced_after_ms{-1};
    auto created = Run::create(config, [&](const events::EventRecord& event) {
        capture.record_event(event);
        if (event.header.synthetic) {
            forced_after_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();
        }
    });
    ASSERT_TRUE(is_ok(created));
    auto result = unwrap(created)->execute({slow, quick});
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    // The stuck test was closed out long before its body returned
    EXPECT_GE(forced_after_ms.load(), 0);
    EXPECT_LT(forced_after_ms.load(), 350);

    EXPECT_EQ(capture.labels(), (std::vector<std::string>{
                                    "SuiteStarting Slow",
                                    "TestStarting Slow/stuck",
                                    "TestFailed Slow/stuck",
                                    "TestStarting Slow/after",
                                    "TestSucceeded Slow/after",
                                    "SuiteCompleted Slow",
                                    "SuiteStarting Quick",
                                    "TestStarting Quick/fast",
                                    "TestSucceeded Quick/fast",
                                    "SuiteCompleted Quick",
                                }));
    const auto& summary = unwrap(result);
    EXPECT_EQ(summary.synthetic_events, 1u);
    EXPECT_EQ(summary.tests_failed, 1u);
    EXPECT_EQ(summary.tests_succeeded, 2u);
}

TEST_F(RunOrderingTest, ExecuteIsSingleUse) {
    auto created = Run::create(config_with_pool(2), nullptr);
    ASSERT_TRUE(is_ok(created));
    auto& run = unwrap(created);

    auto suite = make_rc<FunctionSuite>("Once");
    suite->test("t", no_op());
    ASSERT_TRUE(is_ok(run->execute({suite})));

    auto again = run->execute({suite});
    ASSERT_TRUE(is_err(again));
    EXPECT_EQ(unwrap_err(again).kind, DispatchErrorKind::Usage);
}

TEST_F(RunOrderingTest, EmptyRunSucceeds) {
    auto summary = run(config_with_pool(2), {});
    EXPECT_EQ(summary.events_dispatched, 0u);
    EXPECT_TRUE(summary.all_passed());
}

TEST_F(RunOrderingTest, StopFromSinkEndsTheRunCleanly) {
    auto config = config_with_pool(2);
    config.parallel_tests = false;

    std::vector<Rc<Suite>> suites;
    for (const char* name : {"A", "B", "C", "D"}) {
        auto suite = make_rc<FunctionSuite>(name);
        for (int t = 1; t <= 4; ++t) {
            suite->test("t" + std::to_string(t), sleeping(20ms));
        }
        suites.push_back(suite);
    }

    exec::Run* handle = nullptr;
    std::atomic<int> terminals{0};
    auto created = Run::create(config, [&](const events::EventRecord& event) {
        capture.record_event(event);
        if (events::is_test_terminal(event) && ++terminals == 2) {
            handle->request_stop();
        }
    });
    ASSERT_TRUE(is_ok(created));
    handle = unwrap(created).get();
    auto result = handle->execute(suites);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    // Every suite that started is closed before the next one starts
    std::optional<std::string> open;
    size_t started = 0;
    for (const auto& event : capture.events()) {
        const auto& suite = event.header.suite_name;
        if (events::kind_of(event) == events::EventKind::SuiteStarting) {
            EXPECT_FALSE(open.has_value()) << suite << " started inside " << *open;
            open = suite;
            ++started;
        } else {
            ASSERT_TRUE(open.has_value()) << CaptureRecorder::label(event);
            EXPECT_EQ(suite, *open);
            if (events::is_suite_terminal(event)) {
                open.reset();
            }
        }
    }
    EXPECT_FALSE(open.has_value());
    EXPECT_LE(started, 2u);

    auto a = labels_of("A");
    ASSERT_FALSE(a.empty());
    EXPECT_EQ(a.front(), "SuiteStarting A");
    EXPECT_EQ(a.back(), "SuiteAborted A");
    for (const auto& event : capture.events()) {
        if (event.header.suite_name == "A" && events::is_suite_terminal(event)) {
            EXPECT_EQ(events::event_text(event), "run stopped");
        }
    }
    EXPECT_TRUE(labels_of("C").empty());
    EXPECT_TRUE(labels_of("D").empty());

    const auto& summary = unwrap(result);
    EXPECT_GE(summary.suites_aborted, 1u);
    EXPECT_FALSE(summary.all_passed());
}

TEST_F(RunOrderingTest, RunIsBuiltOnlyThroughCreate) {
    static_assert(!std::is_default_constructible_v<Passkey<exec::Run>>);
    static_assert(!std::is_constructible_v<exec::Run, const RunConfig&, events::EventSink>);
    auto created = Run::create(config_with_pool(1), nullptr);
    ASSERT_TRUE(is_ok(created));
    EXPECT_GE(unwrap(created)->run_stamp(), 0);
}
