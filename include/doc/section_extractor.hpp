//! # Documentation Section Extractor
//!
//! Turns the block stream of one markdown document into `DocSection`s.
//!
//! A section opens at a hidden marker and runs until the next marker or the
//! end of the document:
//!
//! ```markdown
//! <!-- @docs-id: auth-login -->
//! ## Login
//!
//! | Param    | Type   | Description  |
//! |----------|--------|--------------|
//! | username | string | Account name |
//! ```
//!
//! The title is the first heading inside the section. Arguments come from
//! the strategy dispatch in `arg_strategies.hpp`.

#ifndef DOCSGUARD_DOC_SECTION_EXTRACTOR_HPP
#define DOCSGUARD_DOC_SECTION_EXTRACTOR_HPP

#include "common.hpp"
#include "doc/markdown_lexer.hpp"
#include "model/entity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::doc {

struct SectionOptions {
    std::string marker = "@docs-id"; ///< Marker token inside the HTML comment
};

/// Parses a comment body such as "@docs-id: auth-login".
///
/// Returns nullopt when the comment is not a marker, and an empty string
/// when it is a marker without an id.
[[nodiscard]] auto parse_marker(std::string_view comment, std::string_view marker)
    -> std::optional<std::string>;

/// Extracts the sections of one document.
///
/// Fails with `DuplicateDocId` when two markers in the document share an id;
/// the error lists every id declared in the document.
[[nodiscard]] auto extract_sections(const std::vector<Block>& blocks, const std::string& file,
                                    const SectionOptions& options = {})
    -> Result<std::vector<model::DocSection>, model::FileError>;

/// Convenience wrapper: lexes `text`, then extracts.
[[nodiscard]] auto extract_sections_from_text(std::string_view text, const std::string& file,
                                              const SectionOptions& options = {})
    -> Result<std::vector<model::DocSection>, model::FileError>;

} // namespace docsguard::doc

#endif // DOCSGUARD_DOC_SECTION_EXTRACTOR_HPP
