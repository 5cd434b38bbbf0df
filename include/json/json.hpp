//! # docsguard JSON
//!
//! Public header of the JSON module: values, parsing and serialization.
//!
//! ```cpp
//! auto result = parse_json(text);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << "\n";
//! }
//! ```

#ifndef DOCSGUARD_JSON_JSON_HPP
#define DOCSGUARD_JSON_JSON_HPP

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace docsguard::json {

/// Parses a complete JSON document.
///
/// Trailing non-whitespace content is an error. Nesting deeper than 256
/// levels is rejected.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

/// Escapes a string for inclusion between JSON double quotes.
[[nodiscard]] auto escape_json_string(std::string_view s) -> std::string;

} // namespace docsguard::json

#endif // DOCSGUARD_JSON_JSON_HPP
