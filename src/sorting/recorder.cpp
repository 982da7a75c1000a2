#include "sorting/recorder.hpp"

#include "log/log.hpp"

namespace ordo::sort {

auto SinkRecorder::record_event(const events::EventRecord& event) -> Released {
    std::lock_guard<std::mutex> lock(mutex_);
    ORDO_LOG_TRACE("sort", "dispatch " << events::to_string(event));
    sink_(event);
    ++dispatched_;
    return size_t{1};
}

auto SinkRecorder::dispatched() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return dispatched_;
}

auto late_event_policy_name(LateEventPolicy policy) -> const char* {
    switch (policy) {
    case LateEventPolicy::Discard:
        return "discard";
    case LateEventPolicy::Forward:
        return "forward";
    }
    return "discard";
}

auto parse_late_event_policy(std::string_view name) -> std::optional<LateEventPolicy> {
    if (name == "discard") {
        return LateEventPolicy::Discard;
    }
    if (name == "forward") {
        return LateEventPolicy::Forward;
    }
    return std::nullopt;
}

} // namespace ordo::sort
