//! # Markdown Lexer Tests

#include "doc/markdown_lexer.hpp"

#include <gtest/gtest.h>

using namespace docsguard::doc;

TEST(MarkdownLexerTest, EmptyInput) {
    EXPECT_TRUE(lex_markdown("").empty());
    EXPECT_TRUE(lex_markdown("\n\n   \n").empty());
}

TEST(MarkdownLexerTest, AtxHeadings) {
    auto blocks = lex_markdown("# Title\n\n### Sub section ###\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Heading);
    EXPECT_EQ(blocks[0].level, 1);
    EXPECT_EQ(blocks[0].text, "Title");
    EXPECT_EQ(blocks[0].line, 1u);
    EXPECT_EQ(blocks[1].level, 3);
    EXPECT_EQ(blocks[1].text, "Sub section");
    EXPECT_EQ(blocks[1].line, 3u);
}

TEST(MarkdownLexerTest, HashWithoutSpaceIsNotHeading) {
    auto blocks = lex_markdown("#hashtag\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Paragraph);
}

TEST(MarkdownLexerTest, SetextHeadings) {
    auto blocks = lex_markdown("Login\n=====\n\nLogout\n------\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Heading);
    EXPECT_EQ(blocks[0].level, 1);
    EXPECT_EQ(blocks[0].text, "Login");
    EXPECT_EQ(blocks[1].level, 2);
    EXPECT_EQ(blocks[1].text, "Logout");
}

TEST(MarkdownLexerTest, SingleLineComment) {
    auto blocks = lex_markdown("<!-- @docs-id: auth-login -->\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, BlockKind::HtmlComment);
    EXPECT_EQ(blocks[0].text, "@docs-id: auth-login");
}

TEST(MarkdownLexerTest, MultiLineComment) {
    auto blocks = lex_markdown("<!--\n  note\n-->\ntext\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::HtmlComment);
    EXPECT_EQ(blocks[0].text, "note");
    EXPECT_EQ(blocks[1].kind, BlockKind::Paragraph);
    EXPECT_EQ(blocks[1].line, 4u);
}

TEST(MarkdownLexerTest, FencedCodeIsOpaque) {
    auto blocks = lex_markdown("```rust\n# not a heading\n<!-- @docs-id: x -->\n```\nafter\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Code);
    EXPECT_EQ(blocks[0].text, "rust");
    ASSERT_EQ(blocks[0].lines.size(), 2u);
    EXPECT_EQ(blocks[0].lines[0], "# not a heading");
    EXPECT_EQ(blocks[1].kind, BlockKind::Paragraph);
}

TEST(MarkdownLexerTest, BulletList) {
    auto blocks = lex_markdown("- first\n* second\n  continued\n+ third\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0].kind, BlockKind::List);
    ASSERT_EQ(blocks[0].items.size(), 3u);
    EXPECT_EQ(blocks[0].items[0].text, "first");
    EXPECT_EQ(blocks[0].items[1].text, "second continued");
    EXPECT_EQ(blocks[0].items[2].line, 4u);
}

TEST(MarkdownLexerTest, OrderedList) {
    auto blocks = lex_markdown("1. first\n2) second\n   continued\n10. third\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0].kind, BlockKind::List);
    ASSERT_EQ(blocks[0].items.size(), 3u);
    EXPECT_EQ(blocks[0].items[0].text, "first");
    EXPECT_EQ(blocks[0].items[1].text, "second continued");
    EXPECT_EQ(blocks[0].items[2].text, "third");
    EXPECT_EQ(blocks[0].items[2].line, 4u);
}

TEST(MarkdownLexerTest, NumberWithoutSpaceIsNotListItem) {
    auto blocks = lex_markdown("3.14 is pi\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Paragraph);
}

TEST(MarkdownLexerTest, OnlyFirstOrdinalInterruptsParagraph) {
    auto blocks = lex_markdown("Released in\n2024. It works.\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Paragraph);

    blocks = lex_markdown("Steps:\n1. run\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[1].kind, BlockKind::List);
}

TEST(MarkdownLexerTest, LooseListStaysOneBlock) {
    auto blocks = lex_markdown("- a: one\n\n- b: two\n\nparagraph\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].items.size(), 2u);
    EXPECT_EQ(blocks[1].kind, BlockKind::Paragraph);
}

TEST(MarkdownLexerTest, ThematicBreakIsSkipped) {
    auto blocks = lex_markdown("one\n\n---\n\ntwo\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Paragraph);
    EXPECT_EQ(blocks[1].kind, BlockKind::Paragraph);
}

TEST(MarkdownLexerTest, PipeTable) {
    auto blocks = lex_markdown("| Param | Type |\n|---|:---:|\n| `a` | string |\n| b | i32 |\n");
    ASSERT_EQ(blocks.size(), 1u);
    ASSERT_EQ(blocks[0].kind, BlockKind::Table);
    ASSERT_EQ(blocks[0].header.size(), 2u);
    EXPECT_EQ(blocks[0].header[0], "Param");
    ASSERT_EQ(blocks[0].rows.size(), 2u);
    EXPECT_EQ(blocks[0].rows[0][0], "`a`");
    EXPECT_EQ(blocks[0].rows[1][1], "i32");
}

TEST(MarkdownLexerTest, SplitTableRowHandlesEscapedPipe) {
    auto cells = split_table_row("| a \\| b | c |");
    ASSERT_EQ(cells.size(), 2u);
    EXPECT_EQ(cells[0], "a | b");
    EXPECT_EQ(cells[1], "c");
}

TEST(MarkdownLexerTest, ParagraphInterruptedByList) {
    auto blocks = lex_markdown("Arguments:\n- a: one\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].kind, BlockKind::Paragraph);
    EXPECT_EQ(blocks[1].kind, BlockKind::List);
}

TEST(MarkdownLexerTest, CrlfLineEndings) {
    auto blocks = lex_markdown("# Title\r\n\r\nbody\r\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].text, "Title");
    EXPECT_EQ(blocks[1].lines[0], "body");
}
