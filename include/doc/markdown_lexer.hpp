//! # Markdown Block Lexer
//!
//! A line-based block tokenizer. It recognizes just enough markdown
//! structure for section extraction and never parses inline markup.
//!
//! | Block | Recognized form |
//! |-------|-----------------|
//! | `Heading` | ATX (`# Title`) and setext (`Title` + `===` / `---`) |
//! | `HtmlComment` | `<!-- ... -->`, single or multi-line |
//! | `Paragraph` | consecutive non-blank lines |
//! | `List` | `-`, `*`, `+` bullets with continuation lines |
//! | `Table` | pipe table with a delimiter row |
//! | `Code` | fenced with ``` or ~~~; contents are opaque |

#ifndef DOCSGUARD_DOC_MARKDOWN_LEXER_HPP
#define DOCSGUARD_DOC_MARKDOWN_LEXER_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::doc {

enum class BlockKind { Heading, HtmlComment, Paragraph, List, Table, Code };

struct ListItem {
    std::string text; ///< Item text without the bullet, continuations joined by a space
    size_t line = 0;
};

/// One markdown block. Which fields are set depends on `kind`.
struct Block {
    BlockKind kind = BlockKind::Paragraph;
    size_t line = 0; ///< 1-based start line

    int level = 0;    ///< Heading level (1-6)
    std::string text; ///< Heading text, comment body, or code info string

    std::vector<std::string> lines; ///< Paragraph lines (trimmed) or code lines (verbatim)
    std::vector<ListItem> items;    ///< List items

    std::vector<std::string> header;            ///< Table header cells
    std::vector<std::vector<std::string>> rows; ///< Table body cells
};

/// Splits markdown text into blocks in document order.
[[nodiscard]] auto lex_markdown(std::string_view text) -> std::vector<Block>;

/// Splits a pipe table row into trimmed cells. Leading and trailing pipes
/// are optional; `\|` is a literal pipe.
[[nodiscard]] auto split_table_row(std::string_view line) -> std::vector<std::string>;

[[nodiscard]] auto block_kind_name(BlockKind kind) -> const char*;

} // namespace docsguard::doc

#endif // DOCSGUARD_DOC_MARKDOWN_LEXER_HPP
