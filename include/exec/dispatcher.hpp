//! # Concurrent Dispatcher
//!
//! A bounded worker pool that runs suite and test units.
//!
//! ## Components
//!
//! | Class                  | Description                                   |
//! |------------------------|-----------------------------------------------|
//! | `Task`                 | One unit of work plus its failure/skip hooks  |
//! | `WorkQueue`            | Thread-safe FIFO, optionally bounded          |
//! | `TaskGroup`            | Outstanding-count barrier for nested awaits   |
//! | `WorkHandle`           | Completion flag of one submitted task         |
//! | `ConcurrentDispatcher` | Owns the workers and the root group           |
//!
//! ## Nested Waits
//!
//! A suite running on a worker may submit its tests and wait for them. A
//! worker blocked in `TaskGroup::wait()` keeps taking tasks off the queue, so
//! a pool of N workers never deadlocks on N waiting suites.
//!
//! ## Failure Containment
//!
//! Exceptions escaping `Task::run` are caught at the worker boundary and
//! handed to `Task::on_failure`; the worker keeps running. Once a stop is
//! requested, tasks not yet started get `Task::on_skip` instead of `run`.

#ifndef ORDO_EXEC_DISPATCHER_HPP
#define ORDO_EXEC_DISPATCHER_HPP

#include "common.hpp"
#include "sorting/gate_error.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace ordo::exec {

// ============================================================================
// Errors
// ============================================================================

enum class DispatchErrorKind {
    ThreadStart, ///< A worker or timer thread could not be created
    QueueFull,   ///< Submission beyond `queue_capacity`
    Protocol,    ///< A sorting gate rejected an event
    Usage,       ///< API misuse, e.g. executing a run twice
};

struct DispatchError {
    DispatchErrorKind kind;
    std::string message;
    std::optional<sort::GateError> gate_error;

    static auto make(DispatchErrorKind kind, std::string message) -> DispatchError {
        return DispatchError{kind, std::move(message), std::nullopt};
    }

    static auto from_gate(const sort::GateError& error) -> DispatchError {
        return DispatchError{DispatchErrorKind::Protocol, error.to_string(), error};
    }

    [[nodiscard]] auto to_string() const -> std::string;
};

// ============================================================================
// Tasks
// ============================================================================

struct Task {
    std::string name;
    std::function<void()> run;
    /// Receives the message of an exception that escaped `run`.
    std::function<void(const std::string&)> on_failure;
    /// Called instead of `run` when a stop was requested before it started.
    std::function<void()> on_skip;
};

class WorkHandle {
public:
    WorkHandle() = default;

    [[nodiscard]] auto done() const -> bool;

    /// Blocks until the task ran or was skipped. Not for use on a worker;
    /// workers wait through a `TaskGroup`.
    void wait() const;

    [[nodiscard]] auto valid() const -> bool {
        return state_ != nullptr;
    }

private:
    friend class ConcurrentDispatcher;

    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
    };

    explicit WorkHandle(Rc<State> state) : state_(std::move(state)) {}

    Rc<State> state_;
};

class ConcurrentDispatcher;

class TaskGroup {
public:
    explicit TaskGroup(ConcurrentDispatcher& dispatcher) : dispatcher_(dispatcher) {}

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    auto submit(Task task) -> Result<WorkHandle, DispatchError>;

    /// Returns once every task submitted through this group has completed.
    void wait();

    [[nodiscard]] auto outstanding() const -> size_t;

private:
    friend class ConcurrentDispatcher;

    void add_one();
    void complete_one();

    ConcurrentDispatcher& dispatcher_;
    size_t outstanding_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// ============================================================================
// Dispatcher
// ============================================================================

struct DispatcherOptions {
    size_t pool_size = 2;
    bool concurrent = true;  ///< false runs every task inline in `submit`
    size_t queue_capacity = 0; ///< 0 = unbounded
};

class ConcurrentDispatcher {
public:
    static auto create(DispatcherOptions options) -> Result<Box<ConcurrentDispatcher>, DispatchError>;

    ConcurrentDispatcher(Passkey<ConcurrentDispatcher>, DispatcherOptions options);
    ~ConcurrentDispatcher();

    ConcurrentDispatcher(const ConcurrentDispatcher&) = delete;
    ConcurrentDispatcher& operator=(const ConcurrentDispatcher&) = delete;

    /// Submits into the root group awaited by `await_all()`.
    auto submit(Task task) -> Result<WorkHandle, DispatchError>;

    auto submit(TaskGroup& group, Task task) -> Result<WorkHandle, DispatchError>;

    /// The group `await_all()` waits on.
    [[nodiscard]] auto root_group() -> TaskGroup& {
        return root_;
    }

    /// Blocks until every root task completed. Returns the number of tasks
    /// completed so far, or the first error reported during the run.
    auto await_all() -> Result<size_t, DispatchError>;

    /// Cooperative: queued tasks are skipped, running ones see the flag.
    void request_stop();

    [[nodiscard]] auto stop_requested() const -> bool {
        return stop_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto stop_flag() const -> const std::atomic<bool>& {
        return stop_;
    }

    /// Records a fatal error (first one wins) and requests a stop.
    void report_error(DispatchError error);

    [[nodiscard]] auto first_error() const -> std::optional<DispatchError>;

    [[nodiscard]] auto concurrent() const -> bool {
        return options_.concurrent;
    }

    [[nodiscard]] auto pool_size() const -> size_t {
        return options_.pool_size;
    }

    /// Joins the workers. Tasks still queued are skipped.
    void shutdown();

    /// True on threads owned by a dispatcher.
    [[nodiscard]] static auto on_worker_thread() -> bool;

private:
    friend class TaskGroup;

    struct QueuedTask {
        Task task;
        TaskGroup* group = nullptr;
        Rc<WorkHandle::State> state;
    };

    /// Thread-safe work queue, BuildQueue style: pop waits with a timeout.
    class WorkQueue {
    public:
        explicit WorkQueue(size_t capacity) : capacity_(capacity) {}

        auto push(QueuedTask item) -> bool;
        auto pop(int timeout_ms) -> std::optional<QueuedTask>;
        auto try_pop() -> std::optional<QueuedTask>;
        void stop();
        auto stopped() -> bool;
        auto size() -> size_t;

    private:
        std::deque<QueuedTask> queue_;
        size_t capacity_;
        bool stop_flag_ = false;
        std::mutex mutex_;
        std::condition_variable cv_;
    };


    void worker_thread(size_t index);
    void execute(QueuedTask& item);
    auto run_one_queued() -> bool;

    DispatcherOptions options_;
    WorkQueue queue_;
    TaskGroup root_;
    std::vector<std::thread> workers_;
    std::atomic<bool> stop_{false};
    std::atomic<size_t> completed_{0};
    bool shut_down_ = false;

    std::optional<DispatchError> first_error_;
    mutable std::mutex error_mutex_;
};

} // namespace ordo::exec

#endif // ORDO_EXEC_DISPATCHER_HPP
