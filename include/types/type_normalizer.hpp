//! # Type Normalizer
//!
//! Maps raw type tokens from either side (code signatures or documentation)
//! onto a small canonical set so that `&str`, `String` and `text` compare
//! equal.
//!
//! ## Lookup Order
//!
//! 1. Canonical names (`string`, `number`, `boolean`, `object`, `unknown`)
//!    always map to themselves.
//! 2. The caller's alias table (from `[types]` in `docsguard.toml`).
//! 3. The built-in table.
//! 4. Anything else is `Unknown`.
//!
//! `Unknown` never produces a type mismatch.

#ifndef DOCSGUARD_TYPES_TYPE_NORMALIZER_HPP
#define DOCSGUARD_TYPES_TYPE_NORMALIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace docsguard::types {

enum class CanonicalType { String, Number, Boolean, Object, Unknown };

/// Alias table keyed by cleaned token (see `clean_type_token`).
using AliasTable = std::unordered_map<std::string, CanonicalType>;

/// Returns the canonical name: "string", "number", "boolean", "object" or
/// "unknown".
[[nodiscard]] auto canonical_name(CanonicalType type) -> const char*;

/// Parses a canonical name, case-insensitively.
[[nodiscard]] auto parse_canonical_type(std::string_view name) -> std::optional<CanonicalType>;

/// Lowercases a raw token and strips decoration that does not change its
/// canonical type: surrounding whitespace and backticks, `&`, `&mut`, `mut`,
/// `const`, `*`, lifetimes such as `'a`, a trailing `?`, and an `Option<..>`
/// wrapper. Inner whitespace is removed.
[[nodiscard]] auto clean_type_token(std::string_view raw) -> std::string;

/// Normalizes a raw type token. Case-insensitive and idempotent.
[[nodiscard]] auto normalize(std::string_view raw, const AliasTable& aliases = {})
    -> CanonicalType;

} // namespace docsguard::types

#endif // DOCSGUARD_TYPES_TYPE_NORMALIZER_HPP
