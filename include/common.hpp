//! # Common Definitions
//!
//! Types and utilities shared by every docsguard component.
//!
//! ## Overview
//!
//! - **Version Information**: tool version constants
//! - **Result Type**: error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Values over references**: entities and sections are plain values that
//!   can be copied, cached and re-diffed independently

#ifndef DOCSGUARD_COMMON_HPP
#define DOCSGUARD_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace docsguard {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = load_baseline(path);
/// if (is_err(result)) {
///     report(unwrap_err(result));
///     return 2;
/// }
/// auto& snapshot = unwrap(result);
/// ```
///
/// `T` and `E` must be distinct types.
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

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace docsguard

#endif // DOCSGUARD_COMMON_HPP
