//! # Annotation Writer
//!
//! Inserts link annotations accepted during `docsguard scaffold`:
//!
//! ```text
//! pub fn login(user: &str) {}      ->   /// @docs: [auth-login]
//!                                       pub fn login(user: &str) {}
//! ```
//!
//! Rust gets a `///` doc comment, TypeScript and JavaScript a `//` line
//! comment. The new line copies the indentation of the declaration and
//! the file's line ending style.

#ifndef DOCSGUARD_CLI_ANNOTATION_WRITER_HPP
#define DOCSGUARD_CLI_ANNOTATION_WRITER_HPP

#include "code/decl_lexer.hpp"
#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::cli {

/// One annotation to insert above the 1-based `line`.
struct AnnotationEdit {
    size_t line = 0;
    std::string id;
};

struct WriteError {
    std::string message;
    size_t line = 0;
};

/// The comment text without indentation, e.g. `/// @docs: [auth-login]`.
[[nodiscard]] auto annotation_comment(code::Language lang, std::string_view token,
                                      std::string_view id) -> std::string;

/// Returns `source` with every edit applied.
///
/// Fails if an edit points past the end of the file or two edits target
/// the same line.
[[nodiscard]] auto insert_annotations(std::string_view source,
                                      const std::vector<AnnotationEdit>& edits,
                                      code::Language lang, std::string_view token)
    -> Result<std::string, WriteError>;

/// Applies the edits to the file in place. Returns the number inserted.
[[nodiscard]] auto write_annotations(const std::filesystem::path& path,
                                     const std::vector<AnnotationEdit>& edits,
                                     code::Language lang, std::string_view token)
    -> Result<size_t, WriteError>;

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_ANNOTATION_WRITER_HPP
