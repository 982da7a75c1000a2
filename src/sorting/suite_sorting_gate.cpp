#include "sorting/suite_sorting_gate.hpp"

#include "log/log.hpp"

#include <iterator>

namespace ordo::sort {

using events::EventKind;
using events::EventRecord;
using events::Ordinal;

auto slot_state_name(SlotState state) -> const char* {
    switch (state) {
    case SlotState::Open:
        return "Open";
    case SlotState::PendingSubOrdering:
        return "PendingSubOrdering";
    case SlotState::Ready:
        return "Ready";
    case SlotState::Flushed:
        return "Flushed";
    }
    return "Unknown";
}

// ============================================================================
// Construction
// ============================================================================

SuiteSortingGate::SuiteSortingGate(Passkey<SuiteSortingGate>, EventRecorder& downstream,
                                   SortingOptions options, std::string label)
    : downstream_(downstream), options_(options), label_(std::move(label)) {}

SuiteSortingGate::~SuiteSortingGate() {
    if (armed_timer_ && options_.timer) {
        options_.timer->cancel(*armed_timer_);
    }
}

auto SuiteSortingGate::create(EventRecorder& downstream, SortingOptions options,
                              std::string label) -> Rc<SuiteSortingGate> {
    return make_rc<SuiteSortingGate>(Passkey<SuiteSortingGate>(), downstream, options,
                                     std::move(label));
}

// ============================================================================
// Recording
// ============================================================================

auto SuiteSortingGate::record_event(const EventRecord& event) -> Released {
    std::lock_guard<std::mutex> lock(mutex_);
    auto recorded = record_locked(event);
    if (is_err(recorded)) {
        ORDO_LOG_ERROR("sort", label_ << ": " << unwrap_err(recorded).to_string());
        return recorded;
    }
    auto flushed = settle_locked();
    if (is_err(flushed)) {
        return flushed;
    }
    return unwrap(recorded) + unwrap(flushed);
}

auto SuiteSortingGate::record_locked(const EventRecord& event) -> Released {
    ORDO_LOG_TRACE("sort", label_ << " <- " << events::to_string(event));
    const auto& header = event.header;
    const std::string& id = header.suite_id;
    auto found = open_.find(id);

    if (events::kind_of(event) == EventKind::SuiteStarting) {
        if (found != open_.end()) {
            Slot& slot = *found->second;
            if (slot.suite_id == id && !slot.started) {
                slot.started = true;
                slot.parent_suite_id = header.parent_suite_id;
                push(slot, event);
                return size_t{0};
            }
            return GateError::make(GateErrorKind::DuplicateSuite,
                                   "SuiteStarting for a suite that is still open", id);
        }
        if (closed_.count(id) > 0) {
            return late_event(event);
        }
        if (header.parent_suite_id) {
            auto parent = open_.find(*header.parent_suite_id);
            if (parent != open_.end()) {
                Slot& slot = *parent->second;
                slot.nested.push_back(NestedSuite{id, header.suite_name, header.parent_suite_id});
                open_.emplace(id, parent->second);
                push(slot, event);
                return size_t{0};
            }
        }
        Slot slot;
        slot.suite_id = id;
        slot.suite_name = header.suite_name;
        slot.parent_suite_id = header.parent_suite_id;
        slot.serial = next_serial_++;
        slot.started = true;
        push(slot, event);
        open_.emplace(id, slots_.insert(slots_.end(), std::move(slot)));
        return size_t{0};
    }

    if (found == open_.end()) {
        if (closed_.count(id) > 0) {
            return late_event(event);
        }
        return GateError::make(GateErrorKind::UnknownSuite,
                               std::string(events::kind_name(event)) +
                                   " for a suite that never started",
                               id, header.test_name);
    }

    Slot& slot = *found->second;
    if (slot.suite_id == id && !slot.started) {
        return GateError::make(GateErrorKind::UnknownSuite,
                               std::string(events::kind_name(event)) + " before SuiteStarting",
                               id, header.test_name);
    }
    if (events::is_suite_terminal(event)) {
        if (slot.suite_id == id) {
            if (slot.terminal) {
                return GateError::make(GateErrorKind::DuplicateTerminal,
                                       std::string("second terminal ") + events::kind_name(event),
                                       id);
            }
            slot.terminal = event;
            if (!slot.last_ordinal || *slot.last_ordinal < header.ordinal) {
                slot.last_ordinal = header.ordinal;
            }
            return size_t{0};
        }
        for (auto& nested : slot.nested) {
            if (nested.suite_id != id) {
                continue;
            }
            if (nested.terminated) {
                return GateError::make(GateErrorKind::DuplicateTerminal,
                                       std::string("second terminal ") + events::kind_name(event),
                                       id);
            }
            nested.terminated = true;
        }
    } else if (id != slot.suite_id) {
        // Events a nested suite's test gate releases after that suite's
        // terminal was buffered still belong before the terminal.
        for (auto it = slot.buffered.begin(); it != slot.buffered.end(); ++it) {
            if (it->header.suite_id == id && events::is_suite_terminal(*it)) {
                slot.buffered.insert(it, event);
                return size_t{0};
            }
        }
    }
    push(slot, event);
    return size_t{0};
}

void SuiteSortingGate::push(Slot& slot, const EventRecord& event) {
    slot.buffered.push_back(event);
    if (!slot.last_ordinal || *slot.last_ordinal < event.header.ordinal) {
        slot.last_ordinal = event.header.ordinal;
    }
}

// ============================================================================
// Slot Management
// ============================================================================

auto SuiteSortingGate::expect_suite(const std::string& suite_id, const std::string& suite_name)
    -> Released {
    std::lock_guard<std::mutex> lock(mutex_);
    if (open_.count(suite_id) > 0 || closed_.count(suite_id) > 0) {
        return GateError::make(GateErrorKind::DuplicateSuite, "suite id reserved twice",
                               suite_id);
    }
    Slot slot;
    slot.suite_id = suite_id;
    slot.suite_name = suite_name;
    slot.serial = next_serial_++;
    open_.emplace(suite_id, slots_.insert(slots_.end(), std::move(slot)));
    ORDO_LOG_TRACE("sort", label_ << ": reserved slot for " << suite_id);
    return size_t{0};
}

auto SuiteSortingGate::withdraw_suite(const std::string& suite_id) -> Released {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = open_.find(suite_id);
    if (found == open_.end() || found->second->suite_id != suite_id) {
        return size_t{0};
    }
    if (found->second->started) {
        ORDO_LOG_WARN("sort", label_ << ": not withdrawing " << suite_id << ", it already started");
        return size_t{0};
    }
    ORDO_LOG_DEBUG("sort", label_ << ": withdrew " << suite_id);
    erase_slot(found->second);
    return settle_locked();
}

auto SuiteSortingGate::attach_test_sorting_gate(const std::string& suite_id,
                                                Rc<TestSortingGate> gate) -> Released {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto found = open_.find(suite_id);
        if (found == open_.end()) {
            return GateError::make(GateErrorKind::UnknownSuite,
                                   "test gate attached to a suite that is not open", suite_id);
        }
        found->second->gates.push_back(Attached{suite_id, gate});
    }
    std::weak_ptr<SuiteSortingGate> weak = weak_from_this();
    gate->set_finished_listener([weak] {
        if (auto self = weak.lock()) {
            self->on_sub_ordering_finished();
        }
    });
    return size_t{0};
}

void SuiteSortingGate::close_slot(const Slot& slot) {
    open_.erase(slot.suite_id);
    closed_.insert(slot.suite_id);
    for (const auto& nested : slot.nested) {
        open_.erase(nested.suite_id);
        closed_.insert(nested.suite_id);
    }
}

void SuiteSortingGate::erase_slot(SlotList::iterator it) {
    open_.erase(it->suite_id);
    for (const auto& nested : it->nested) {
        open_.erase(nested.suite_id);
    }
    slots_.erase(it);
}

auto SuiteSortingGate::slot_state(const std::string& suite_id) const
    -> std::optional<SlotState> {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = open_.find(suite_id);
    if (found != open_.end()) {
        return state_of(*found->second);
    }
    if (closed_.count(suite_id) > 0) {
        return SlotState::Flushed;
    }
    return std::nullopt;
}

auto SuiteSortingGate::open_slots() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

auto SuiteSortingGate::async_error() const -> std::optional<GateError> {
    std::lock_guard<std::mutex> lock(mutex_);
    return async_error_;
}

// ============================================================================
// Readiness
// ============================================================================

auto SuiteSortingGate::state_of(const Slot& slot) const -> SlotState {
    if (!slot.terminal) {
        return SlotState::Open;
    }
    if (!slot.forced) {
        for (const auto& attached : slot.gates) {
            if (!attached.gate->finished()) {
                return SlotState::PendingSubOrdering;
            }
        }
    }
    return SlotState::Ready;
}

auto SuiteSortingGate::blocks_stream(const Slot& slot, const EventRecord& event) const -> bool {
    // A nested suite's terminal waits for that suite's own test gate.
    if (slot.forced || !events::is_suite_terminal(event)) {
        return false;
    }
    for (const auto& attached : slot.gates) {
        if (attached.suite_id == event.header.suite_id && !attached.gate->finished()) {
            return true;
        }
    }
    return false;
}

auto SuiteSortingGate::awaiting_sub_ordering(const Slot& slot) const -> bool {
    if (!slot.buffered.empty()) {
        return blocks_stream(slot, slot.buffered.front());
    }
    return state_of(slot) == SlotState::PendingSubOrdering;
}

auto SuiteSortingGate::unfinished_gates(const Slot& slot) -> std::vector<Rc<TestSortingGate>> {
    std::vector<Rc<TestSortingGate>> result;
    for (const auto& attached : slot.gates) {
        if (!attached.gate->finished()) {
            result.push_back(attached.gate);
        }
    }
    return result;
}

// ============================================================================
// Release
// ============================================================================

auto SuiteSortingGate::flush_ready() -> Released {
    std::lock_guard<std::mutex> lock(mutex_);
    return settle_locked();
}

auto SuiteSortingGate::settle_locked() -> Released {
    auto flushed = flush_locked();
    if (is_err(flushed)) {
        return flushed;
    }
    arm_timer_locked();
    return flushed;
}

auto SuiteSortingGate::flush_locked() -> Released {
    size_t released = 0;
    while (!slots_.empty()) {
        Slot& head = slots_.front();
        while (!head.buffered.empty() && !blocks_stream(head, head.buffered.front())) {
            const EventRecord& event = head.buffered.front();
            auto sent = forward(event);
            if (is_err(sent)) {
                return sent;
            }
            // A folded nested suite closes once its terminal is out; later
            // events for it are late.
            if (events::is_suite_terminal(event) && event.header.suite_id != head.suite_id) {
                open_.erase(event.header.suite_id);
                closed_.insert(event.header.suite_id);
            }
            head.buffered.pop_front();
            released += unwrap(sent);
        }
        if (!head.buffered.empty() || state_of(head) != SlotState::Ready) {
            break;
        }
        auto sent = forward(*head.terminal);
        if (is_err(sent)) {
            return sent;
        }
        released += unwrap(sent);
        ORDO_LOG_DEBUG("sort", label_ << ": flushed suite " << head.suite_id);
        close_slot(head);
        slots_.pop_front();
    }
    return released;
}

auto SuiteSortingGate::forward(const EventRecord& event) -> Released {
    auto result = downstream_.record_event(event);
    if (is_err(result)) {
        return result;
    }
    return size_t{1};
}

auto SuiteSortingGate::late_event(const EventRecord& event) -> Released {
    if (options_.late_events == LateEventPolicy::Forward) {
        ORDO_LOG_DEBUG("sort", label_ << ": forwarding late " << events::to_string(event));
        return forward(event);
    }
    ORDO_LOG_WARN("sort", label_ << ": discarding late " << events::to_string(event)
                                 << " (suite already flushed)");
    return size_t{0};
}

auto SuiteSortingGate::synthesize_abort(Slot& slot, const NestedSuite& suite,
                                        const std::string& message) -> EventRecord {
    Ordinal ordinal = slot.last_ordinal ? slot.last_ordinal->next() : Ordinal(0);
    slot.last_ordinal = ordinal;

    EventRecord record;
    record.header.ordinal = ordinal;
    record.header.suite_name = suite.suite_name;
    record.header.suite_id = suite.suite_id;
    record.header.parent_suite_id = suite.parent_suite_id;
    record.header.thread_name = log::thread_name();
    record.header.timestamp_ms = log::epoch_ms();
    record.header.synthetic = true;
    record.body = events::SuiteAborted{message, 0};
    return record;
}

auto SuiteSortingGate::force_finish() -> Released {
    std::vector<Rc<TestSortingGate>> stuck;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& slot : slots_) {
            auto pending = unfinished_gates(slot);
            stuck.insert(stuck.end(), pending.begin(), pending.end());
        }
    }
    std::optional<GateError> failure;
    for (auto& gate : stuck) {
        auto forced = gate->force_finish();
        if (is_err(forced) && !failure) {
            failure = unwrap_err(forced);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = slots_.begin(); it != slots_.end();) {
        if (!it->started) {
            ORDO_LOG_WARN("sort", label_ << ": dropping reservation for " << it->suite_id
                                         << ", it never started");
            auto next = std::next(it);
            erase_slot(it);
            it = next;
            continue;
        }
        Slot& slot = *it;
        slot.forced = true;
        if (!slot.terminal) {
            for (auto nested = slot.nested.rbegin(); nested != slot.nested.rend(); ++nested) {
                if (!nested->terminated) {
                    push(slot, synthesize_abort(slot, *nested, "suite closed before completing"));
                    nested->terminated = true;
                }
            }
            ORDO_LOG_WARN("sort", label_ << ": closing " << slot.suite_id
                                         << " without a terminal event");
            slot.terminal = synthesize_abort(
                slot, NestedSuite{slot.suite_id, slot.suite_name, slot.parent_suite_id},
                "suite closed before completing");
        }
        ++it;
    }
    auto flushed = settle_locked();
    if (is_ok(flushed) && failure) {
        return *failure;
    }
    return flushed;
}

// ============================================================================
// Completion and Timeouts
// ============================================================================

void SuiteSortingGate::note_async_error(const Released& result) {
    if (is_err(result)) {
        ORDO_LOG_ERROR("sort", label_ << ": " << unwrap_err(result).to_string());
        if (!async_error_) {
            async_error_ = unwrap_err(result);
        }
    }
}

void SuiteSortingGate::on_sub_ordering_finished() {
    std::lock_guard<std::mutex> lock(mutex_);
    note_async_error(settle_locked());
}

void SuiteSortingGate::disarm_locked() {
    if (armed_timer_ && options_.timer) {
        options_.timer->cancel(*armed_timer_);
    }
    armed_timer_.reset();
}

void SuiteSortingGate::arm_timer_locked() {
    if (!options_.timer || options_.timeout.count() <= 0) {
        return;
    }
    if (slots_.empty() || !awaiting_sub_ordering(slots_.front())) {
        disarm_locked();
        return;
    }
    const Slot& head = slots_.front();
    if (armed_timer_ && armed_serial_ == head.serial) {
        return;
    }
    disarm_locked();
    armed_serial_ = head.serial;
    std::weak_ptr<SuiteSortingGate> weak = weak_from_this();
    uint64_t serial = head.serial;
    armed_timer_ = options_.timer->schedule_after(options_.timeout, [weak, serial] {
        if (auto self = weak.lock()) {
            self->on_timeout(serial);
        }
    });
}

void SuiteSortingGate::on_timeout(uint64_t serial) {
    std::vector<Rc<TestSortingGate>> stuck;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (slots_.empty() || slots_.front().serial != serial) {
            return;
        }
        armed_timer_.reset();
        if (!awaiting_sub_ordering(slots_.front())) {
            return;
        }
        stuck = unfinished_gates(slots_.front());
        ORDO_LOG_WARN("sort", label_ << ": " << slots_.front().suite_id << " waited "
                                     << options_.timeout.count() << " ms for test ordering, forcing "
                                     << stuck.size() << " test gate(s)");
    }

    // Test gates flush into this gate, so they are forced without our lock.
    std::optional<GateError> failure;
    for (auto& gate : stuck) {
        auto forced = gate->force_finish();
        if (is_err(forced) && !failure) {
            failure = unwrap_err(forced);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (failure) {
        note_async_error(*failure);
    }
    if (!slots_.empty() && slots_.front().serial == serial) {
        slots_.front().forced = true;
    }
    note_async_error(settle_locked());
}

} // namespace ordo::sort
