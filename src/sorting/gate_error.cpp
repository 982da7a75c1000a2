#include "sorting/gate_error.hpp"

namespace ordo::sort {

auto kind_name(GateErrorKind kind) -> const char* {
    switch (kind) {
    case GateErrorKind::DuplicateSuite:
        return "duplicate suite";
    case GateErrorKind::UnknownSuite:
        return "unknown suite";
    case GateErrorKind::DuplicateTerminal:
        return "duplicate terminal";
    case GateErrorKind::DuplicateTest:
        return "duplicate test";
    case GateErrorKind::UnknownTest:
        return "unknown test";
    case GateErrorKind::TerminalWithoutStart:
        return "terminal without start";
    case GateErrorKind::DuplicatePlanEntry:
        return "duplicate plan entry";
    }
    return "gate error";
}

auto GateError::to_string() const -> std::string {
    std::string result = kind_name(kind);
    result += " [" + suite_id;
    if (test_name) {
        result += "/" + *test_name;
    }
    result += "]";
    if (!message.empty()) {
        result += ": " + message;
    }
    return result;
}

} // namespace ordo::sort
