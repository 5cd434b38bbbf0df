//! # Check Pipeline
//!
//! Drives one docsguard pass over a set of paths:
//!
//! ```text
//! paths ──> collect_inputs ──> scan_inputs ──> run_validation ──> findings
//!              │                   │                 │
//!              │                   ├─ docs:  lex_markdown, extract_sections
//!              │                   └─ code:  scan_declarations, extract_entities
//!              └─ walk directories, classify by extension
//! ```
//!
//! Each file fails on its own: a `FileError` is recorded and the other
//! files are still processed. Documents whose ids collide are withheld from
//! the index, and entities linking to those ids are not validated.

#ifndef DOCSGUARD_PIPELINE_PIPELINE_HPP
#define DOCSGUARD_PIPELINE_PIPELINE_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "model/entity.hpp"
#include "validate/link_validator.hpp"

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace docsguard::pipeline {

/// Files above this size are rejected unread.
constexpr std::uintmax_t MAX_FILE_BYTES = 10u * 1024u * 1024u;

struct PipelineOptions {
    std::filesystem::path project_root = ".";
    validate::ValidatorOptions validator;
};

/// Builds pipeline options from the project configuration.
[[nodiscard]] auto options_from_config(const config::Config& config,
                                       const std::filesystem::path& project_root)
    -> PipelineOptions;

// ============================================================================
// Inputs
// ============================================================================

/// True for `.md` and `.markdown` files.
[[nodiscard]] auto is_documentation_path(const std::filesystem::path& path) -> bool;

/// True for directory names the walk never enters.
[[nodiscard]] auto is_skipped_directory(const std::string& name) -> bool;

struct InputSet {
    std::vector<std::filesystem::path> sources;
    std::vector<std::filesystem::path> documents;
    std::vector<model::FileError> errors;

    [[nodiscard]] auto all_files() const -> std::vector<std::filesystem::path>;
};

/// Classifies explicit files and walks directories in sorted order.
///
/// Explicit files with an unsupported extension and missing paths are
/// recorded as `ParseFailure`. Unsupported files found by the walk are
/// ignored.
[[nodiscard]] auto collect_inputs(const std::vector<std::string>& paths) -> InputSet;

/// Reads a whole file, enforcing `MAX_FILE_BYTES`.
[[nodiscard]] auto read_input_file(const std::filesystem::path& path, const std::string& display)
    -> Result<std::string, model::FileError>;

/// Path as shown in reports: relative to `root` when inside it, forward
/// slashes.
[[nodiscard]] auto display_path(const std::filesystem::path& path,
                                const std::filesystem::path& root) -> std::string;

// ============================================================================
// Scanning
// ============================================================================

struct ScanResult {
    std::vector<model::CodeEntity> entities;
    std::vector<model::DocSection> sections;
    std::vector<model::FileError> errors;
    std::set<std::string> blocked_ids; ///< Ids of documents withheld for duplicates
    size_t source_files = 0;
    size_t document_files = 0;
};

/// Parses every input. Never fails as a whole.
[[nodiscard]] auto scan_inputs(const InputSet& inputs, const PipelineOptions& options)
    -> ScanResult;

/// Removes sections whose id already appeared in an earlier document.
///
/// Each collision records a `DuplicateDocId` for the later document and
/// blocks the id; every section carrying a blocked id is dropped.
void drop_cross_document_duplicates(std::vector<model::DocSection>& sections,
                                    std::vector<model::FileError>& errors,
                                    std::set<std::string>& blocked_ids);

// ============================================================================
// Validation
// ============================================================================

/// Validates the scanned entities, skipping those linked to blocked ids.
[[nodiscard]] auto run_validation(const ScanResult& scan, const PipelineOptions& options)
    -> Result<std::vector<model::ValidationResult>, model::FileError>;

} // namespace docsguard::pipeline

#endif // DOCSGUARD_PIPELINE_PIPELINE_HPP
