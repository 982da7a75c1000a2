//! # Concurrent Dispatcher Implementation
//!
//! ## Worker Loop
//!
//! Each worker pops with a 100 ms timeout so it notices `shutdown()` even
//! when no task arrives. A task completes its group and its handle after
//! `run`, `on_failure` or `on_skip` returned, whichever applied.
//!
//! ## Helping Waits
//!
//! `TaskGroup::wait()` on a worker runs queued tasks until its own count
//! drops to zero, polling every 10 ms when the queue is empty and the
//! group's remaining tasks are running elsewhere.

#include "exec/dispatcher.hpp"

#include "log/log.hpp"

#include <chrono>
#include <exception>
#include <system_error>

namespace ordo::exec {

namespace {

thread_local bool t_is_worker = false;

auto dispatch_error_kind_name(DispatchErrorKind kind) -> const char* {
    switch (kind) {
    case DispatchErrorKind::ThreadStart:
        return "thread start";
    case DispatchErrorKind::QueueFull:
        return "queue full";
    case DispatchErrorKind::Protocol:
        return "protocol";
    case DispatchErrorKind::Usage:
        return "usage";
    }
    return "unknown";
}

/// Runs a failure or skip hook. A hook that throws is logged; the worker and
/// the group accounting carry on regardless.
template <typename Fn> void run_hook(const std::string& task, const char* hook, Fn&& fn) {
    try {
        fn();
    } catch (const std::exception& e) {
        ORDO_LOG_ERROR("dispatch", hook << " hook of '" << task << "' threw: " << e.what());
    } catch (...) {
        ORDO_LOG_ERROR("dispatch", hook << " hook of '" << task << "' threw a non-exception");
    }
}

} // namespace

auto DispatchError::to_string() const -> std::string {
    return std::string(dispatch_error_kind_name(kind)) + ": " + message;
}

// ============================================================================
// WorkHandle
// ============================================================================

auto WorkHandle::done() const -> bool {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
}

void WorkHandle::wait() const {
    if (!state_) {
        return;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->done; });
}

// ============================================================================
// TaskGroup
// ============================================================================

auto TaskGroup::submit(Task task) -> Result<WorkHandle, DispatchError> {
    return dispatcher_.submit(*this, std::move(task));
}

void TaskGroup::add_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++outstanding_;
}

void TaskGroup::complete_one() {
    std::lock_guard<std::mutex> lock(mutex_);
    --outstanding_;
    if (outstanding_ == 0) {
        cv_.notify_all();
    }
}

auto TaskGroup::outstanding() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return outstanding_;
}

void TaskGroup::wait() {
    if (!ConcurrentDispatcher::on_worker_thread()) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return outstanding_ == 0; });
        return;
    }

    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outstanding_ == 0) {
                return;
            }
        }
        if (!dispatcher_.run_one_queued()) {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(10),
                         [this] { return outstanding_ == 0; });
        }
    }
}

// ============================================================================
// WorkQueue
// ============================================================================

auto ConcurrentDispatcher::WorkQueue::push(QueuedTask item) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ > 0 && queue_.size() >= capacity_) {
        return false;
    }
    queue_.push_back(std::move(item));
    cv_.notify_one();
    return true;
}

auto ConcurrentDispatcher::WorkQueue::pop(int timeout_ms) -> std::optional<QueuedTask> {
    std::unique_lock<std::mutex> lock(mutex_);

    if (queue_.empty()) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                     [this] { return !queue_.empty() || stop_flag_; });
    }

    if (queue_.empty()) {
        return std::nullopt;
    }

    QueuedTask item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

auto ConcurrentDispatcher::WorkQueue::try_pop() -> std::optional<QueuedTask> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    QueuedTask item = std::move(queue_.front());
    queue_.pop_front();
    return item;
}

void ConcurrentDispatcher::WorkQueue::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_flag_ = true;
    cv_.notify_all();
}

auto ConcurrentDispatcher::WorkQueue::stopped() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_flag_;
}

auto ConcurrentDispatcher::WorkQueue::size() -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ============================================================================
// ConcurrentDispatcher
// ============================================================================

ConcurrentDispatcher::ConcurrentDispatcher(Passkey<ConcurrentDispatcher>,
                                           DispatcherOptions options)
    : options_(options), queue_(options.queue_capacity), root_(*this) {}

auto ConcurrentDispatcher::create(DispatcherOptions options)
    -> Result<Box<ConcurrentDispatcher>, DispatchError> {
    if (options.concurrent && options.pool_size == 0) {
        return DispatchError::make(DispatchErrorKind::Usage, "pool_size must be greater than zero");
    }

    auto dispatcher =
        make_box<ConcurrentDispatcher>(Passkey<ConcurrentDispatcher>(), options);
    if (!options.concurrent) {
        ORDO_LOG_DEBUG("dispatch", "running units inline");
        return std::move(dispatcher);
    }

    try {
        for (size_t i = 0; i < options.pool_size; ++i) {
            dispatcher->workers_.emplace_back(&ConcurrentDispatcher::worker_thread,
                                              dispatcher.get(), i);
        }
    } catch (const std::system_error& e) {
        ORDO_LOG_ERROR("dispatch", "failed to start worker: " << e.what());
        dispatcher->shutdown();
        return DispatchError::make(DispatchErrorKind::ThreadStart,
                                   std::string("failed to start worker: ") + e.what());
    }
    ORDO_LOG_DEBUG("dispatch", "started " << options.pool_size << " workers");
    return std::move(dispatcher);
}

ConcurrentDispatcher::~ConcurrentDispatcher() {
    shutdown();
}

auto ConcurrentDispatcher::on_worker_thread() -> bool {
    return t_is_worker;
}

auto ConcurrentDispatcher::submit(Task task) -> Result<WorkHandle, DispatchError> {
    return submit(root_, std::move(task));
}

auto ConcurrentDispatcher::submit(TaskGroup& group, Task task)
    -> Result<WorkHandle, DispatchError> {
    auto state = make_rc<WorkHandle::State>();
    QueuedTask item{std::move(task), &group, state};
    group.add_one();

    if (!options_.concurrent) {
        execute(item);
        return WorkHandle(state);
    }

    std::string name = item.task.name;
    if (!queue_.push(std::move(item))) {
        group.complete_one();
        auto error = DispatchError::make(DispatchErrorKind::QueueFull,
                                         "queue capacity " + std::to_string(options_.queue_capacity) +
                                             " reached while submitting '" + name + "'");
        report_error(error);
        return error;
    }
    return WorkHandle(state);
}

auto ConcurrentDispatcher::await_all() -> Result<size_t, DispatchError> {
    root_.wait();
    if (auto error = first_error()) {
        return *error;
    }
    return completed_.load();
}

void ConcurrentDispatcher::request_stop() {
    if (!stop_.exchange(true, std::memory_order_acq_rel)) {
        ORDO_LOG_INFO("dispatch", "stop requested");
    }
}

void ConcurrentDispatcher::report_error(DispatchError error) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        if (first_error_) {
            ORDO_LOG_DEBUG("dispatch", "suppressed further error: " << error.to_string());
            return;
        }
        ORDO_LOG_ERROR("dispatch", error.to_string());
        first_error_ = std::move(error);
    }
    request_stop();
}

auto ConcurrentDispatcher::first_error() const -> std::optional<DispatchError> {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return first_error_;
}

void ConcurrentDispatcher::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;
    queue_.stop();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    // Anything still queued never ran
    stop_.store(true, std::memory_order_release);
    while (auto item = queue_.try_pop()) {
        execute(*item);
    }
}

void ConcurrentDispatcher::worker_thread(size_t index) {
    t_is_worker = true;
    log::set_thread_name("worker-" + std::to_string(index));

    while (true) {
        auto item = queue_.pop(100);
        if (!item) {
            if (queue_.stopped()) {
                break;
            }
            continue;
        }
        execute(*item);
    }
}

auto ConcurrentDispatcher::run_one_queued() -> bool {
    auto item = queue_.try_pop();
    if (!item) {
        return false;
    }
    execute(*item);
    return true;
}

void ConcurrentDispatcher::execute(QueuedTask& item) {
    Task& task = item.task;

    if (stop_requested()) {
        ORDO_LOG_DEBUG("dispatch", "skipping '" << task.name << "'");
        if (task.on_skip) {
            run_hook(task.name, "skip", task.on_skip);
        }
    } else {
        std::optional<std::string> failure;
        try {
            if (task.run) {
                task.run();
            }
        } catch (const std::exception& e) {
            failure = e.what();
        } catch (...) {
            failure = "unknown exception";
        }
        if (failure) {
            ORDO_LOG_WARN("dispatch", "'" << task.name << "' failed: " << *failure);
            if (task.on_failure) {
                run_hook(task.name, "failure", [&] { task.on_failure(*failure); });
            }
        }
    }

    completed_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(item.state->mutex);
        item.state->done = true;
    }
    item.state->cv.notify_all();
    item.group->complete_one();
}

} // namespace ordo::exec
