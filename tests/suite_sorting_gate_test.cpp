//! # SuiteSortingGate Unit Tests
//!
//! Submission-order release, reservations, nested suites, attached test
//! gates and forced release.

#include "sorting/deadline_timer.hpp"
#include "sorting/suite_sorting_gate.hpp"
#include "sorting/test_sorting_gate.hpp"
#include "test_support.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace ordo;
using namespace ordo::sort;
using ordo::testing::CaptureRecorder;
using ordo::testing::EventFactory;

class SuiteSortingGateTest : public ::testing::Test {
protected:
    void SetUp() override {
        gate = SuiteSortingGate::create(sink);
    }

    void record(EventRecorder& recorder, const events::EventRecord& event) {
        auto result = recorder.record_event(event);
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    }

    auto single_test_gate(EventFactory& suite, const std::string& test)
        -> Rc<TestSortingGate> {
        TestPlan plan;
        plan.add_test(test);
        auto created = TestSortingGate::create(suite.suite_id(), suite.suite_id(), plan, *gate);
        EXPECT_TRUE(is_ok(created));
        return unwrap(created);
    }

    CaptureRecorder sink;
    Rc<SuiteSortingGate> gate;
    events::Tracker run{events::Ordinal(0)};
};

// ============================================================================
// Submission Order
// ============================================================================

TEST_F(SuiteSortingGateTest, LaterSuiteWaitsForEarlierOne) {
    EventFactory a("A", "A", run.next_tracker());
    EventFactory b("B", "B", run.next_tracker());

    record(*gate, a.suite_starting());
    record(*gate, b.suite_starting());
    record(*gate, b.test_starting("fast"));
    record(*gate, b.test_succeeded("fast"));
    record(*gate, b.suite_completed());

    // The head streams as it goes, B is buffered
    EXPECT_EQ(sink.labels(), std::vector<std::string>{"SuiteStarting A"});

    record(*gate, a.test_starting("slow"));
    record(*gate, a.test_succeeded("slow"));
    record(*gate, a.suite_completed());

    std::vector<std::string> expected = {
        "SuiteStarting A",      "TestStarting A/slow", "TestSucceeded A/slow",
        "SuiteCompleted A",     "SuiteStarting B",     "TestStarting B/fast",
        "TestSucceeded B/fast", "SuiteCompleted B"};
    EXPECT_EQ(sink.labels(), expected);
    EXPECT_EQ(gate->open_slots(), 0u);
    EXPECT_EQ(gate->slot_state("A"), SlotState::Flushed);
}

TEST_F(SuiteSortingGateTest, ReservationFixesOrderBeforeStart) {
    ASSERT_TRUE(is_ok(gate->expect_suite("A", "A")));
    ASSERT_TRUE(is_ok(gate->expect_suite("B", "B")));
    EventFactory a("A", "A", run.next_tracker());
    EventFactory b("B", "B", run.next_tracker());

    record(*gate, b.suite_starting());
    record(*gate, b.suite_completed());
    EXPECT_EQ(sink.size(), 0u);
    EXPECT_EQ(gate->slot_state("A"), SlotState::Open);
    EXPECT_EQ(gate->slot_state("B"), SlotState::Ready);

    record(*gate, a.suite_starting());
    record(*gate, a.suite_completed());
    std::vector<std::string> expected = {"SuiteStarting A", "SuiteCompleted A",
                                         "SuiteStarting B", "SuiteCompleted B"};
    EXPECT_EQ(sink.labels(), expected);
}

TEST_F(SuiteSortingGateTest, WithdrawnReservationUnblocksFollowers) {
    ASSERT_TRUE(is_ok(gate->expect_suite("A", "A")));
    ASSERT_TRUE(is_ok(gate->expect_suite("B", "B")));
    EventFactory b("B", "B", run.next_tracker());
    record(*gate, b.suite_starting());
    record(*gate, b.suite_completed());
    EXPECT_EQ(sink.size(), 0u);

    auto released = gate->withdraw_suite("A");
    ASSERT_TRUE(is_ok(released));
    EXPECT_EQ(unwrap(released), 2u);
    EXPECT_FALSE(gate->slot_state("A").has_value());
}

TEST_F(SuiteSortingGateTest, FlushReadyIsIdempotent) {
    EventFactory a("A", "A", run.next_tracker());
    record(*gate, a.suite_starting());
    record(*gate, a.suite_completed());

    auto before = sink.labels();
    auto again = gate->flush_ready();
    ASSERT_TRUE(is_ok(again));
    EXPECT_EQ(unwrap(again), 0u);
    EXPECT_EQ(sink.labels(), before);
}

// ============================================================================
// Protocol Errors
// ============================================================================

TEST_F(SuiteSortingGateTest, DuplicateStartRejected) {
    EventFactory a("A");
    record(*gate, a.suite_starting());
    auto result = gate->record_event(a.suite_starting());
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, GateErrorKind::DuplicateSuite);
}

TEST_F(SuiteSortingGateTest, EventForUnknownSuiteRejected) {
    EventFactory ghost("Ghost");
    auto result = gate->record_event(ghost.test_starting("x"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, GateErrorKind::UnknownSuite);
    EXPECT_EQ(unwrap_err(result).suite_id, "Ghost");
}

TEST_F(SuiteSortingGateTest, EventBeforeReservedStartRejected) {
    ASSERT_TRUE(is_ok(gate->expect_suite("A", "A")));
    EventFactory a("A");
    auto result = gate->record_event(a.test_starting("x"));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, GateErrorKind::UnknownSuite);
}

TEST_F(SuiteSortingGateTest, SecondTerminalRejected) {
    ASSERT_TRUE(is_ok(gate->expect_suite("A", "A")));
    ASSERT_TRUE(is_ok(gate->expect_suite("B", "B")));
    EventFactory b("B");
    record(*gate, b.suite_starting());
    record(*gate, b.suite_completed());
    auto result = gate->record_event(b.make(events::SuiteAborted{"again", 0}));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, GateErrorKind::DuplicateTerminal);
}

TEST_F(SuiteSortingGateTest, ReservingTwiceRejected) {
    ASSERT_TRUE(is_ok(gate->expect_suite("A", "A")));
    auto result = gate->expect_suite("A", "A");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, GateErrorKind::DuplicateSuite);
}

TEST_F(SuiteSortingGateTest, LateEventsFollowPolicy) {
    EventFactory a("A");
    record(*gate, a.suite_starting());
    record(*gate, a.suite_completed());

    auto discarded = gate->record_event(a.info("t", "late"));
    ASSERT_TRUE(is_ok(discarded));
    EXPECT_EQ(sink.size(), 2u);

    SortingOptions forward;
    forward.late_events = LateEventPolicy::Forward;
    CaptureRecorder other;
    auto forwarding = SuiteSortingGate::create(other, forward);
    EventFactory b("B");
    record(*forwarding, b.suite_starting());
    record(*forwarding, b.suite_completed());
    record(*forwarding, b.info("t", "late"));
    EXPECT_EQ(other.size(), 3u);
}

// ============================================================================
// Test Gates and Nested Suites
// ============================================================================

TEST_F(SuiteSortingGateTest, TerminalWaitsForAttachedTestGate) {
    EventFactory a("A", "A", run.next_tracker());
    record(*gate, a.suite_starting());
    auto tests = single_test_gate(a, "t1");
    ASSERT_TRUE(is_ok(gate->attach_test_sorting_gate("A", tests)));

    auto t1 = a.branch();
    record(*gate, a.suite_completed());
    EXPECT_EQ(gate->slot_state("A"), SlotState::PendingSubOrdering);
    EXPECT_EQ(sink.size(), 1u);

    record(*tests, t1.test_starting("t1"));
    record(*tests, t1.test_succeeded("t1"));

    std::vector<std::string> expected = {"SuiteStarting A", "TestStarting A/t1",
                                         "TestSucceeded A/t1", "SuiteCompleted A"};
    EXPECT_EQ(sink.labels(), expected);
    EXPECT_EQ(gate->slot_state("A"), SlotState::Flushed);
}

TEST_F(SuiteSortingGateTest, NestedSuiteIsFoldedIntoParent) {
    EventFactory parent("Outer", "Outer", run.next_tracker());
    EventFactory b("B", "B", run.next_tracker());
    EventFactory child("Inner", "Inner");
    child.set_parent("Outer");

    record(*gate, parent.suite_starting());
    record(*gate, b.suite_starting());
    record(*gate, b.suite_completed());
    record(*gate, child.suite_starting());
    record(*gate, child.test_starting("x"));
    record(*gate, child.test_succeeded("x"));
    record(*gate, child.suite_completed());
    EXPECT_EQ(gate->slot_state("Inner"), SlotState::Flushed);
    record(*gate, parent.suite_completed());

    std::vector<std::string> expected = {
        "SuiteStarting Outer",   "SuiteStarting Inner",  "TestStarting Inner/x",
        "TestSucceeded Inner/x", "SuiteCompleted Inner", "SuiteCompleted Outer",
        "SuiteStarting B",       "SuiteCompleted B"};
    EXPECT_EQ(sink.labels(), expected);

    // Inner already closed; this is late and dropped
    ASSERT_TRUE(is_ok(gate->record_event(child.info("x", "late"))));
    EXPECT_EQ(sink.size(), expected.size());
}

TEST_F(SuiteSortingGateTest, NestedTerminalWaitsForItsTestGate) {
    EventFactory parent("Outer");
    EventFactory child("Inner");
    child.set_parent("Outer");

    record(*gate, parent.suite_starting());
    record(*gate, child.suite_starting());
    auto tests = single_test_gate(child, "x");
    ASSERT_TRUE(is_ok(gate->attach_test_sorting_gate("Inner", tests)));
    auto x = child.branch();
    record(*gate, child.suite_completed());
    record(*gate, parent.suite_completed());
    EXPECT_EQ(sink.labels(),
              (std::vector<std::string>{"SuiteStarting Outer", "SuiteStarting Inner"}));

    record(*tests, x.test_starting("x"));
    record(*tests, x.test_succeeded("x"));
    std::vector<std::string> expected = {"SuiteStarting Outer",   "SuiteStarting Inner",
                                         "TestStarting Inner/x",  "TestSucceeded Inner/x",
                                         "SuiteCompleted Inner",  "SuiteCompleted Outer"};
    EXPECT_EQ(sink.labels(), expected);
}

// ============================================================================
// Forced Release
// ============================================================================

TEST_F(SuiteSortingGateTest, ForceFinishAbortsOpenSuites) {
    ASSERT_TRUE(is_ok(gate->expect_suite("Never", "Never")));
    EventFactory parent("Outer", "Outer", run.next_tracker());
    EventFactory child("Inner", "Inner");
    child.set_parent("Outer");
    record(*gate, parent.suite_starting());
    record(*gate, child.suite_starting());

    ASSERT_TRUE(is_ok(gate->force_finish()));
    EXPECT_EQ(gate->open_slots(), 0u);

    auto events = sink.events();
    std::vector<std::string> expected = {"SuiteStarting Outer", "SuiteStarting Inner",
                                         "SuiteAborted Inner", "SuiteAborted Outer"};
    EXPECT_EQ(sink.labels(), expected);
    EXPECT_TRUE(events[2].header.synthetic);
    EXPECT_EQ(events[2].header.parent_suite_id, std::optional<std::string>("Outer"));
    EXPECT_EQ(events::event_text(events[3]), "suite closed before completing");
    EXPECT_LT(events[1].header.ordinal, events[2].header.ordinal);
    EXPECT_LT(events[2].header.ordinal, events[3].header.ordinal);
}

TEST_F(SuiteSortingGateTest, TimeoutForcesStuckTestGate) {
    auto timer = DeadlineTimer::create();
    ASSERT_TRUE(is_ok(timer));
    SortingOptions options;
    options.timeout = std::chrono::milliseconds(100);
    options.timer = unwrap(timer).get();
    gate = SuiteSortingGate::create(sink, options);

    EventFactory a("A", "A", run.next_tracker());
    record(*gate, a.suite_starting());
    auto tests = single_test_gate(a, "hangs");
    ASSERT_TRUE(is_ok(gate->attach_test_sorting_gate("A", tests)));
    record(*gate, a.suite_completed());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (sink.size() < 4 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    auto events = sink.events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(CaptureRecorder::label(events[1]), "TestStarting A/hangs");
    EXPECT_EQ(CaptureRecorder::label(events[2]), "TestFailed A/hangs");
    EXPECT_TRUE(events[2].header.synthetic);
    EXPECT_EQ(CaptureRecorder::label(events[3]), "SuiteCompleted A");
    EXPECT_TRUE(tests->finished());
    EXPECT_FALSE(gate->async_error().has_value());

    // Both gates go before the timer they were armed on
    tests.reset();
    gate.reset();
}
