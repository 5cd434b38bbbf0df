//! # Code Entity Extractor
//!
//! Turns raw declaration nodes into `CodeEntity` values and resolves the
//! `@docs` annotation in each declaration's leading comment block.
//!
//! ## Annotation Forms
//!
//! ```text
//! /// @docs: [auth-login]
//! // @docs: auth-login
//! /** @docs: [auth-login] */
//!  * @docs: auth-login
//! ```
//!
//! The first annotation of a block wins.

#ifndef DOCSGUARD_CODE_ENTITY_EXTRACTOR_HPP
#define DOCSGUARD_CODE_ENTITY_EXTRACTOR_HPP

#include "code/decl_lexer.hpp"
#include "code/decl_scanner.hpp"
#include "model/entity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::code {

struct AnnotationOptions {
    std::string token = "@docs";
};

/// Removes comment delimiters and surrounding whitespace from one line.
[[nodiscard]] auto strip_comment_prefix(std::string_view line) -> std::string_view;

/// Parses the linked id out of one comment line.
///
/// Returns nullopt when the line carries no annotation, and an empty string
/// when it carries one with no id.
[[nodiscard]] auto parse_annotation(std::string_view line, std::string_view token)
    -> std::optional<std::string>;

/// Converts the declarations of one file into entities, in source order.
[[nodiscard]] auto extract_entities(const std::vector<DeclNode>& decls, const std::string& file,
                                    Language lang, const AnnotationOptions& options = {})
    -> std::vector<model::CodeEntity>;

} // namespace docsguard::code

#endif // DOCSGUARD_CODE_ENTITY_EXTRACTOR_HPP
