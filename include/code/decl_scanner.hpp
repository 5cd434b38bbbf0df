//! # Declaration Scanner
//!
//! Finds function declarations in a token stream without a full grammar.
//!
//! ## Recognized Declarations
//!
//! | Language | Forms |
//! |----------|-------|
//! | Rust | `[pub] [const] [async] [unsafe] [extern "C"] fn name<..>(..)` |
//! | TypeScript / JavaScript | `function name(..)`, `const name = (..) =>`, `const name = function (..)`, class methods |
//!
//! Each declaration carries the comment block immediately above it (no
//! blank line in between). Attributes (`#[...]`) and decorators (`@x`)
//! between the comments and the declaration are skipped. `self`/`this`
//! receivers and destructured parameters are left out.

#ifndef DOCSGUARD_CODE_DECL_SCANNER_HPP
#define DOCSGUARD_CODE_DECL_SCANNER_HPP

#include "code/decl_lexer.hpp"
#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::code {

struct DeclParam {
    std::string name;
    std::optional<std::string> type;
};

/// A raw declaration node.
struct DeclNode {
    std::string name;
    size_t line = 0; ///< Line of the first token of the declaration (modifiers included)
    std::vector<DeclParam> params;
    std::vector<std::string> comment_lines; ///< Raw leading comment lines, delimiters kept
};

struct ScanError {
    std::string message;
    size_t line = 0;
};

/// Scans one source file.
///
/// Fails on lexical errors and on unbalanced brackets.
[[nodiscard]] auto scan_declarations(std::string_view source, Language lang)
    -> Result<std::vector<DeclNode>, ScanError>;

} // namespace docsguard::code

#endif // DOCSGUARD_CODE_DECL_SCANNER_HPP
