//! # Gate Errors
//!
//! Protocol violations detected by the sorting gates. A gate error means an
//! event producer is miswired and ordering can no longer be trusted, so it is
//! returned to the run driver instead of being logged and dropped.
//!
//! ```cpp
//! auto error = GateError::make(GateErrorKind::DuplicateSuite, "suite already open",
//!                              "Calc#1");
//! std::cerr << error.to_string() << std::endl;
//! // Output: "duplicate suite [Calc#1]: suite already open"
//! ```

#ifndef ORDO_SORTING_GATE_ERROR_HPP
#define ORDO_SORTING_GATE_ERROR_HPP

#include <optional>
#include <string>

namespace ordo::sort {

enum class GateErrorKind {
    DuplicateSuite,       ///< SuiteStarting for a suite id whose slot is still open
    UnknownSuite,         ///< Event for a suite id that never started
    DuplicateTerminal,    ///< Second terminal event for one suite or test
    DuplicateTest,        ///< Second TestStarting for one test
    UnknownTest,          ///< Test name absent from the declared plan
    TerminalWithoutStart, ///< Test terminal or note with no matching TestStarting
    DuplicatePlanEntry,   ///< Declared plan names the same test twice
};

[[nodiscard]] auto kind_name(GateErrorKind kind) -> const char*;

struct GateError {
    GateErrorKind kind;
    std::string message;
    std::string suite_id;
    std::optional<std::string> test_name;

    static auto make(GateErrorKind kind, std::string message, std::string suite_id,
                     std::optional<std::string> test_name = std::nullopt) -> GateError {
        return GateError{kind, std::move(message), std::move(suite_id), std::move(test_name)};
    }

    /// Formats as `"<kind> [<suite_id>/<test>]: <message>"`.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace ordo::sort

#endif // ORDO_SORTING_GATE_ERROR_HPP
