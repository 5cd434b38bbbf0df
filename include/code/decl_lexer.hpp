//! # Declaration Lexer
//!
//! A small tokenizer for the languages docsguard scans. It produces just
//! enough structure for the declaration scanner: identifiers, punctuation,
//! opaque string/number literals and comments with their line spans.
//!
//! ## Language Coverage
//!
//! | Construct | Rust | TypeScript / JavaScript |
//! |-----------|------|-------------------------|
//! | Line / block comments | `//`, nested `/* */` | `//`, `/* */` |
//! | Strings | `"..."`, `r#"..."#`, `b"..."`, `'c'` | `'...'`, `"..."`, `` `...${}...` `` |
//! | Lifetimes | `'a`, `'static` | - |
//! | Regex literals | - | `/.../flags` after an operator |

#ifndef DOCSGUARD_CODE_DECL_LEXER_HPP
#define DOCSGUARD_CODE_DECL_LEXER_HPP

#include "common.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::code {

enum class Language { Rust, TypeScript, JavaScript };

[[nodiscard]] auto language_name(Language lang) -> const char*;

/// Maps a file extension to a language. Returns nullopt for unsupported
/// files.
[[nodiscard]] auto language_for_path(std::string_view path) -> std::optional<Language>;

enum class TokenKind { Ident, Number, String, Punct, Lifetime, Comment };

struct Token {
    TokenKind kind;
    std::string text; ///< Full token text (comments include their delimiters)
    size_t line;      ///< 1-based first line
    size_t end_line;  ///< 1-based last line
};

struct LexError {
    std::string message;
    size_t line = 0;
};

/// Tokenizes a whole source file.
///
/// Multi-character punctuation (`->`, `=>`, `::`, `...`, `?.`) is kept
/// together; everything else is one character per token.
[[nodiscard]] auto tokenize(std::string_view source, Language lang)
    -> Result<std::vector<Token>, LexError>;

} // namespace docsguard::code

#endif // DOCSGUARD_CODE_DECL_LEXER_HPP
