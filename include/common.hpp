//! # Common Definitions
//!
//! Types and helpers shared by every ordo module.
//!
//! ## Overview
//!
//! - **Version Information**: Library version constants
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Conventions
//!
//! - **No Exceptions** in the library API: fallible operations return
//!   `Result<T, E>`. Exceptions thrown by user test bodies are caught at the
//!   unit boundary and become events.
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared.

#ifndef ORDO_COMMON_HPP
#define ORDO_COMMON_HPP

#include <memory>
#include <string>
#include <variant>

namespace ordo {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* ORDO_VERSION = "0.3.0";

constexpr int ORDO_VERSION_MAJOR = 0;
constexpr int ORDO_VERSION_MINOR = 3;
constexpr int ORDO_VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<size_t, GateError> released = gate->record_event(event);
/// if (is_err(released)) {
///     ORDO_LOG_ERROR("sort", unwrap_err(released).to_string());
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

/// Constructor key that only `Owner` can create. Lets a factory build its
/// type through make_box/make_rc while other callers stay on the factory.
template <typename Owner> class Passkey {
    friend Owner;
    Passkey() = default;
};

// ============================================================================
// Visitor Helper
// ============================================================================

/// Builds an overload set from lambdas for exhaustive `std::visit`.
template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace ordo

#endif // ORDO_COMMON_HPP
