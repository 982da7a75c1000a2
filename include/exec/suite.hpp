//! # Suites
//!
//! The units of work the dispatcher runs. A `Suite` declares its tests as a
//! `TestPlan`, runs one test at a time on request and may own nested suites.
//! `FunctionSuite` builds one from callables.
//!
//! ```cpp
//! auto calc = make_rc<FunctionSuite>("Calc");
//! calc->test("add", [](TestContext& ctx) {
//!         ctx.info("2 + 2");
//!         if (2 + 2 != 4) throw std::runtime_error("bad add");
//!     })
//!     .test("sub", [](TestContext&) {})
//!     .ignore("div");
//! ```
//!
//! ## Outcomes
//!
//! A test body that returns normally succeeded. Throwing `PendingTest` or
//! `CanceledTest` reports those outcomes; any other exception is a failure.

#ifndef ORDO_EXEC_SUITE_HPP
#define ORDO_EXEC_SUITE_HPP

#include "common.hpp"
#include "events/event.hpp"
#include "sorting/test_plan.hpp"

#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace ordo::exec {

/// Thrown by a test body that is not implemented yet.
class PendingTest : public std::runtime_error {
public:
    PendingTest() : std::runtime_error("pending") {}
};

/// Thrown by a test body whose precondition does not hold.
class CanceledTest : public std::runtime_error {
public:
    explicit CanceledTest(const std::string& reason) : std::runtime_error(reason) {}
};

// ============================================================================
// Test Context
// ============================================================================

/// Handed to a running test. Notes are recorded immediately, tagged with the
/// test's name; the terminal event reports how many were recorded.
class TestContext {
public:
    using Emit = std::function<void(events::EventBody)>;

    TestContext(std::string test_name, Emit emit, const std::atomic<bool>& stop_flag)
        : test_name_(std::move(test_name)), emit_(std::move(emit)), stop_flag_(stop_flag) {}

    void info(std::string message);
    void markup(std::string text);

    /// Cooperative cancellation point for long-running bodies.
    [[nodiscard]] auto stop_requested() const -> bool {
        return stop_flag_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto notes() const -> size_t {
        return notes_;
    }

    [[nodiscard]] auto test_name() const -> const std::string& {
        return test_name_;
    }

private:
    std::string test_name_;
    Emit emit_;
    const std::atomic<bool>& stop_flag_;
    size_t notes_ = 0;
};

// ============================================================================
// Suite Interface
// ============================================================================

class Suite {
public:
    virtual ~Suite() = default;

    [[nodiscard]] virtual auto name() const -> const std::string& = 0;

    /// Unique per suite instance within a run.
    [[nodiscard]] virtual auto id() const -> const std::string& = 0;

    [[nodiscard]] virtual auto plan() const -> sort::TestPlan = 0;

    /// Runs one declared test. Throws to report a non-success outcome.
    virtual void run_test(const std::string& test_name, TestContext& ctx) = 0;

    [[nodiscard]] virtual auto nested_suites() const -> std::vector<Rc<Suite>> {
        return {};
    }

    /// Whether this suite's tests may run concurrently.
    [[nodiscard]] virtual auto parallel_tests() const -> bool {
        return true;
    }

    /// Throwing aborts the suite.
    virtual void before_all() {}
    virtual void after_all() {}
};

// ============================================================================
// Function Suite
// ============================================================================

class FunctionSuite : public Suite {
public:
    using TestBody = std::function<void(TestContext&)>;
    using Hook = std::function<void()>;

    /// An empty `id` derives a unique one from the name.
    explicit FunctionSuite(std::string name, std::string id = "");

    auto test(std::string name, TestBody body) -> FunctionSuite&;
    auto ignore(std::string name) -> FunctionSuite&;

    /// Wraps whatever `body` declares in a ScopeOpened/ScopeClosed pair.
    auto scope(const std::string& text, const std::function<void(FunctionSuite&)>& body)
        -> FunctionSuite&;

    /// A free note emitted between tests.
    auto note(std::string text) -> FunctionSuite&;

    auto nest(Rc<Suite> suite) -> FunctionSuite&;
    auto on_before_all(Hook hook) -> FunctionSuite&;
    auto on_after_all(Hook hook) -> FunctionSuite&;

    /// Opts this suite out of concurrent test execution.
    auto sequential() -> FunctionSuite&;

    [[nodiscard]] auto name() const -> const std::string& override {
        return name_;
    }
    [[nodiscard]] auto id() const -> const std::string& override {
        return id_;
    }
    [[nodiscard]] auto plan() const -> sort::TestPlan override {
        return plan_;
    }
    void run_test(const std::string& test_name, TestContext& ctx) override;
    [[nodiscard]] auto nested_suites() const -> std::vector<Rc<Suite>> override {
        return nested_;
    }
    [[nodiscard]] auto parallel_tests() const -> bool override {
        return parallel_;
    }
    void before_all() override;
    void after_all() override;

private:
    std::string name_;
    std::string id_;
    sort::TestPlan plan_;
    std::unordered_map<std::string, TestBody> bodies_;
    std::vector<Rc<Suite>> nested_;
    Hook before_;
    Hook after_;
    bool parallel_ = true;
};

} // namespace ordo::exec

#endif // ORDO_EXEC_SUITE_HPP
