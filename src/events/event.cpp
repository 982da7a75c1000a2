#include "events/event.hpp"

#include "common.hpp"

#include <sstream>

namespace ordo::events {

auto kind_of(const EventRecord& event) -> EventKind {
    return std::visit(
        overloaded{
            [](const SuiteStarting&) { return EventKind::SuiteStarting; },
            [](const SuiteCompleted&) { return EventKind::SuiteCompleted; },
            [](const SuiteAborted&) { return EventKind::SuiteAborted; },
            [](const TestStarting&) { return EventKind::TestStarting; },
            [](const TestSucceeded&) { return EventKind::TestSucceeded; },
            [](const TestFailed&) { return EventKind::TestFailed; },
            [](const TestIgnored&) { return EventKind::TestIgnored; },
            [](const TestPending&) { return EventKind::TestPending; },
            [](const TestCanceled&) { return EventKind::TestCanceled; },
            [](const ScopeOpened&) { return EventKind::ScopeOpened; },
            [](const ScopeClosed&) { return EventKind::ScopeClosed; },
            [](const InfoProvided&) { return EventKind::InfoProvided; },
            [](const MarkupProvided&) { return EventKind::MarkupProvided; },
        },
        event.body);
}

auto kind_name(EventKind kind) -> const char* {
    switch (kind) {
    case EventKind::SuiteStarting:
        return "SuiteStarting";
    case EventKind::SuiteCompleted:
        return "SuiteCompleted";
    case EventKind::SuiteAborted:
        return "SuiteAborted";
    case EventKind::TestStarting:
        return "TestStarting";
    case EventKind::TestSucceeded:
        return "TestSucceeded";
    case EventKind::TestFailed:
        return "TestFailed";
    case EventKind::TestIgnored:
        return "TestIgnored";
    case EventKind::TestPending:
        return "TestPending";
    case EventKind::TestCanceled:
        return "TestCanceled";
    case EventKind::ScopeOpened:
        return "ScopeOpened";
    case EventKind::ScopeClosed:
        return "ScopeClosed";
    case EventKind::InfoProvided:
        return "InfoProvided";
    case EventKind::MarkupProvided:
        return "MarkupProvided";
    }
    return "Unknown";
}

auto is_suite_terminal(const EventRecord& event) -> bool {
    auto kind = kind_of(event);
    return kind == EventKind::SuiteCompleted || kind == EventKind::SuiteAborted;
}

auto is_test_terminal(const EventRecord& event) -> bool {
    switch (kind_of(event)) {
    case EventKind::TestSucceeded:
    case EventKind::TestFailed:
    case EventKind::TestPending:
    case EventKind::TestCanceled:
        return true;
    default:
        return false;
    }
}

auto is_note(const EventRecord& event) -> bool {
    auto kind = kind_of(event);
    return kind == EventKind::InfoProvided || kind == EventKind::MarkupProvided;
}

auto info_count_of(const EventRecord& event) -> size_t {
    return std::visit(overloaded{
                          [](const TestSucceeded& e) { return e.info_count; },
                          [](const TestFailed& e) { return e.info_count; },
                          [](const TestPending& e) { return e.info_count; },
                          [](const TestCanceled& e) { return e.info_count; },
                          [](const auto&) { return size_t{0}; },
                      },
                      event.body);
}

auto event_text(const EventRecord& event) -> std::string {
    return std::visit(overloaded{
                          [](const SuiteAborted& e) { return e.message; },
                          [](const TestFailed& e) { return e.message; },
                          [](const TestCanceled& e) { return e.message; },
                          [](const ScopeOpened& e) { return e.text; },
                          [](const ScopeClosed& e) { return e.text; },
                          [](const InfoProvided& e) { return e.message; },
                          [](const MarkupProvided& e) { return e.text; },
                          [](const auto&) { return std::string(); },
                      },
                      event.body);
}

auto to_string(const EventRecord& event) -> std::string {
    const auto& h = event.header;
    std::ostringstream oss;
    oss << kind_name(event) << " " << h.suite_name;
    if (h.test_name) {
        oss << "/" << *h.test_name;
    }
    auto text = event_text(event);
    if (!text.empty()) {
        oss << " \"" << text << "\"";
    }
    oss << " " << h.ordinal.to_string();
    if (!h.thread_name.empty()) {
        oss << " (" << h.thread_name << ")";
    }
    if (h.synthetic) {
        oss << " [synthetic]";
    }
    return oss.str();
}

} // namespace ordo::events
