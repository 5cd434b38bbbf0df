//! # Entity Model
//!
//! Canonical record types shared by every docsguard component.
//!
//! ## Overview
//!
//! | Type | Produced by | Consumed by |
//! |------|-------------|-------------|
//! | `CodeEntity` | code entity extractor | validator, matcher |
//! | `DocSection` | section extractor | validator, matcher |
//! | `ValidationResult` | validator | baseline engine, renderer |
//! | `FileError` | extractors, baseline store | pipeline, renderer |
//!
//! Entities and sections never point at each other. They are correlated
//! only through the documentation id string, so either collection can be
//! cached or re-diffed on its own.

#ifndef DOCSGUARD_MODEL_ENTITY_HPP
#define DOCSGUARD_MODEL_ENTITY_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::model {

// ============================================================================
// Code Side
// ============================================================================

/// A function parameter as written in source.
struct Parameter {
    std::string name;
    std::optional<std::string> type; ///< Raw type token; absent for untyped languages
};

/// A function declaration found in a source file.
struct CodeEntity {
    std::string name;
    std::string file;
    size_t line = 0; ///< 1-based line of the declaration
    std::vector<Parameter> params;
    std::optional<std::string> doc_id; ///< Linked documentation id, if annotated
};

// ============================================================================
// Documentation Side
// ============================================================================

/// A documented argument.
struct Arg {
    std::string name;
    std::optional<std::string> type; ///< Raw type token as written in the docs
    std::string description;
};

/// A documentation section opened by a hidden id marker.
struct DocSection {
    std::string id;
    std::optional<std::string> title;
    std::string file;
    size_t line = 0; ///< 1-based line of the marker
    std::vector<Arg> args;
};

// ============================================================================
// Findings
// ============================================================================

enum class Severity { Info, Warning, Error };

/// Finding kinds. Declaration order is the emission order within one entity.
enum class FindingKind {
    LinkVerified,
    LinkMissing,
    GhostArgument,
    MissingArgument,
    TypeMismatch,
    OrphanSection,
};

struct SourceLocation {
    std::string file;
    size_t line = 0;
};

/// One validation finding.
///
/// `subject` names the offending parameter or argument when the kind has
/// one. `code_type` and `doc_type` hold the normalized type names of a
/// `TypeMismatch`; the raw tokens are quoted in `message`.
struct ValidationResult {
    Severity severity = Severity::Info;
    FindingKind kind = FindingKind::LinkVerified;
    SourceLocation location;
    std::string message;
    std::string hint;
    std::string entity_name;
    std::optional<std::string> doc_id;
    std::optional<std::string> section_title;
    std::string subject;
    std::optional<std::string> code_type;
    std::optional<std::string> doc_type;
    std::optional<std::string> suggested_id;
};

// ============================================================================
// File Errors
// ============================================================================

enum class FileErrorKind { ParseFailure, DuplicateDocId, BaselineCorruption };

/// A fatal per-file error. Never a finding.
struct FileError {
    FileErrorKind kind = FileErrorKind::ParseFailure;
    std::string file;
    size_t line = 0; ///< 0 when unknown
    std::string message;
    std::string hint;
    /// For DuplicateDocId: every id declared in the document, in order.
    std::vector<std::string> ids;

    static auto parse_failure(std::string file, size_t line, std::string message,
                              std::string hint) -> FileError;
    static auto duplicate_doc_id(std::string file, size_t line, std::string message,
                                 std::vector<std::string> ids) -> FileError;
    static auto baseline_corruption(std::string file, std::string message) -> FileError;
};

// ============================================================================
// Names
// ============================================================================

[[nodiscard]] auto severity_name(Severity severity) -> const char*;
[[nodiscard]] auto parse_severity(std::string_view name) -> std::optional<Severity>;
[[nodiscard]] auto kind_name(FindingKind kind) -> const char*;
[[nodiscard]] auto parse_finding_kind(std::string_view name) -> std::optional<FindingKind>;
[[nodiscard]] auto file_error_kind_name(FileErrorKind kind) -> const char*;

/// Returns the file path with forward slashes, for stable output across
/// platforms.
[[nodiscard]] auto portable_path(std::string_view path) -> std::string;

} // namespace docsguard::model

#endif // DOCSGUARD_MODEL_ENTITY_HPP
