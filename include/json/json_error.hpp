//! # JSON Error Types
//!
//! Parse errors with source location.

#ifndef DOCSGUARD_JSON_JSON_ERROR_HPP
#define DOCSGUARD_JSON_JSON_ERROR_HPP

#include <cstddef>
#include <string>

namespace docsguard::json {

/// An error encountered during JSON parsing.
///
/// `line` and `column` are 1-based; 0 means unknown.
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;

    static auto make(std::string msg, size_t line = 0, size_t column = 0) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// Formats as "line X, column Y: message" when the location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace docsguard::json

#endif // DOCSGUARD_JSON_JSON_ERROR_HPP
