//! # Report Renderer
//!
//! Formats findings, fatal file errors and link suggestions for the
//! terminal, and the whole run as JSON.
//!
//! ## Finding Template
//!
//! ```text
//! [X] error[LinkMissing] fn login (src/auth.ts:12)
//!     -> documentation id 'auth-login' was not found in any documentation file
//!     -> linked id 'auth-login'; fix: add `<!-- @docs-id: auth-login -->` ...
//! ```
//!
//! | Marker | Severity |
//! |--------|----------|
//! | `[X]` | error |
//! | `[!]` | warning |
//! | `[i]` | info |
//!
//! Findings accepted by the baseline carry a ` (baseline)` suffix on the
//! first line.

#ifndef DOCSGUARD_REPORT_RENDERER_HPP
#define DOCSGUARD_REPORT_RENDERER_HPP

#include "baseline/baseline.hpp"
#include "heuristic/matcher.hpp"
#include "json/json.hpp"
#include "model/entity.hpp"

#include <string>
#include <vector>

namespace docsguard::report {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";

    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Green = "\033[32m";
    static constexpr const char* Yellow = "\033[33m";
    static constexpr const char* Cyan = "\033[36m";
};

[[nodiscard]] auto severity_marker(model::Severity severity) -> const char*;

// ============================================================================
// Text
// ============================================================================

/// Three-line rendering of one finding, newline-terminated.
[[nodiscard]] auto render_finding(const model::ValidationResult& result,
                                  baseline::FindingStatus status, bool colors = false)
    -> std::string;

/// Three-line rendering of a fatal file error, newline-terminated.
[[nodiscard]] auto render_file_error(const model::FileError& error, bool colors = false)
    -> std::string;

/// One proposed link, as shown by `scaffold`.
[[nodiscard]] auto render_suggestion(const heuristic::Suggestion& suggestion, bool colors = false)
    -> std::string;

/// Summary lines closing a `check` report.
[[nodiscard]] auto render_summary(const baseline::BaselineOutcome& outcome, size_t file_errors,
                                  bool colors = false) -> std::string;

// ============================================================================
// JSON
// ============================================================================

[[nodiscard]] auto finding_to_json(const baseline::ClassifiedFinding& finding) -> json::JsonValue;

[[nodiscard]] auto file_error_to_json(const model::FileError& error) -> json::JsonValue;

/// The whole run: findings, file errors, counts and the blocking flag.
[[nodiscard]] auto findings_to_json(const baseline::BaselineOutcome& outcome,
                                    const std::vector<model::FileError>& errors)
    -> json::JsonValue;

} // namespace docsguard::report

#endif // DOCSGUARD_REPORT_RENDERER_HPP
