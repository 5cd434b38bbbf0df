//! # Markdown Block Lexer Implementation
//!
//! Single pass over the document lines. Each iteration classifies the line
//! at the cursor, then consumes every line belonging to that block.

#include "doc/markdown_lexer.hpp"

#include "log/log.hpp"

#include <optional>

namespace docsguard::doc {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

auto is_blank(std::string_view line) -> bool {
    return trim(line).empty();
}

auto indent_of(std::string_view line) -> size_t {
    size_t width = 0;
    for (char c : line) {
        if (c == ' ') {
            ++width;
        } else if (c == '\t') {
            width += 4;
        } else {
            break;
        }
    }
    return width;
}

auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            if (start < text.size()) {
                lines.push_back(text.substr(start));
            }
            break;
        }
        auto line = text.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = nl + 1;
    }
    if (!lines.empty() && !lines.back().empty() && lines.back().back() == '\r') {
        lines.back().remove_suffix(1);
    }
    return lines;
}

struct Fence {
    char ch;
    size_t length;
    std::string_view rest;
};

auto fence_of(std::string_view line) -> std::optional<Fence> {
    if (indent_of(line) > 3) {
        return std::nullopt;
    }
    auto t = trim(line);
    if (t.empty() || (t[0] != '`' && t[0] != '~')) {
        return std::nullopt;
    }
    char ch = t[0];
    size_t n = 0;
    while (n < t.size() && t[n] == ch) {
        ++n;
    }
    if (n < 3) {
        return std::nullopt;
    }
    return Fence{ch, n, trim(t.substr(n))};
}

auto atx_heading(std::string_view line, int& level, std::string& text) -> bool {
    if (indent_of(line) > 3) {
        return false;
    }
    auto t = trim(line);
    size_t n = 0;
    while (n < t.size() && t[n] == '#') {
        ++n;
    }
    if (n == 0 || n > 6) {
        return false;
    }
    if (n < t.size() && t[n] != ' ' && t[n] != '\t') {
        return false;
    }
    auto body = trim(t.substr(n));
    // Optional closing sequence of '#'
    size_t end = body.size();
    while (end > 0 && body[end - 1] == '#') {
        --end;
    }
    if (end == 0 || body[end - 1] == ' ' || body[end - 1] == '\t') {
        body = trim(body.substr(0, end));
    }
    level = static_cast<int>(n);
    text = std::string(body);
    return true;
}

/// Matches a list item marker: `-`, `*`, `+`, or up to nine digits
/// followed by `.` or `)`. `ordinal` is the item number, 0 for bullets.
auto list_marker_of(std::string_view line, size_t& content_offset, long& ordinal) -> bool {
    size_t indent = 0;
    while (indent < line.size() && line[indent] == ' ') {
        ++indent;
    }
    if (indent > 3 || indent >= line.size()) {
        return false;
    }
    size_t after = indent;
    ordinal = 0;
    char c = line[indent];
    if (c == '-' || c == '*' || c == '+') {
        after = indent + 1;
    } else {
        while (after < line.size() && after - indent < 9 && line[after] >= '0' &&
               line[after] <= '9') {
            ordinal = ordinal * 10 + (line[after] - '0');
            ++after;
        }
        if (after == indent || after >= line.size() ||
            (line[after] != '.' && line[after] != ')')) {
            return false;
        }
        ++after;
    }
    if (after < line.size() && line[after] != ' ' && line[after] != '\t') {
        return false;
    }
    content_offset = after;
    return true;
}

auto list_marker_of(std::string_view line, size_t& content_offset) -> bool {
    long ordinal = 0;
    return list_marker_of(line, content_offset, ordinal);
}

auto is_thematic_break(std::string_view line) -> bool {
    auto t = trim(line);
    if (t.empty() || (t[0] != '-' && t[0] != '*' && t[0] != '_')) {
        return false;
    }
    size_t count = 0;
    for (char c : t) {
        if (c == t[0]) {
            ++count;
        } else if (c != ' ' && c != '\t') {
            return false;
        }
    }
    return count >= 3;
}

auto setext_level(std::string_view line) -> int {
    if (indent_of(line) > 3) {
        return 0;
    }
    auto t = trim(line);
    if (t.empty() || (t[0] != '=' && t[0] != '-')) {
        return 0;
    }
    for (char c : t) {
        if (c != t[0]) {
            return 0;
        }
    }
    return t[0] == '=' ? 1 : 2;
}

auto is_delimiter_row(std::string_view line) -> bool {
    if (line.find('|') == std::string_view::npos || line.find('-') == std::string_view::npos) {
        return false;
    }
    auto cells = split_table_row(line);
    if (cells.empty()) {
        return false;
    }
    for (const auto& cell : cells) {
        std::string_view c = cell;
        if (!c.empty() && c.front() == ':') {
            c.remove_prefix(1);
        }
        if (!c.empty() && c.back() == ':') {
            c.remove_suffix(1);
        }
        if (c.empty()) {
            return false;
        }
        for (char ch : c) {
            if (ch != '-') {
                return false;
            }
        }
    }
    return true;
}

auto is_table_start(const std::vector<std::string_view>& lines, size_t i) -> bool {
    return lines[i].find('|') != std::string_view::npos && i + 1 < lines.size() &&
           is_delimiter_row(lines[i + 1]);
}

auto is_comment_start(std::string_view line) -> bool {
    return trim(line).starts_with("<!--");
}

/// Ordered lists only interrupt other text when they start at 1.
auto interrupts_with_list(std::string_view line, size_t& offset) -> bool {
    long ordinal = 0;
    return list_marker_of(line, offset, ordinal) && ordinal <= 1;
}

/// True if the line would open a block that interrupts a paragraph or list.
auto starts_block(const std::vector<std::string_view>& lines, size_t i) -> bool {
    int level = 0;
    std::string text;
    size_t offset = 0;
    return fence_of(lines[i]).has_value() || is_comment_start(lines[i]) ||
           atx_heading(lines[i], level, text) || is_table_start(lines, i) ||
           interrupts_with_list(lines[i], offset) || is_thematic_break(lines[i]);
}

} // namespace

auto split_table_row(std::string_view line) -> std::vector<std::string> {
    auto t = trim(line);
    if (!t.empty() && t.front() == '|') {
        t.remove_prefix(1);
    }
    if (!t.empty() && t.back() == '|' && !(t.size() >= 2 && t[t.size() - 2] == '\\')) {
        t.remove_suffix(1);
    }

    std::vector<std::string> cells;
    std::string current;
    for (size_t i = 0; i < t.size(); ++i) {
        if (t[i] == '\\' && i + 1 < t.size() && t[i + 1] == '|') {
            current += '|';
            ++i;
        } else if (t[i] == '|') {
            cells.emplace_back(trim(current));
            current.clear();
        } else {
            current += t[i];
        }
    }
    cells.emplace_back(trim(current));
    return cells;
}

auto block_kind_name(BlockKind kind) -> const char* {
    switch (kind) {
    case BlockKind::Heading:
        return "heading";
    case BlockKind::HtmlComment:
        return "comment";
    case BlockKind::Paragraph:
        return "paragraph";
    case BlockKind::List:
        return "list";
    case BlockKind::Table:
        return "table";
    case BlockKind::Code:
        return "code";
    }
    return "unknown";
}

auto lex_markdown(std::string_view text) -> std::vector<Block> {
    auto lines = split_lines(text);
    std::vector<Block> blocks;
    size_t i = 0;
    const size_t n = lines.size();

    while (i < n) {
        auto line = lines[i];
        if (is_blank(line)) {
            ++i;
            continue;
        }

        Block block;
        block.line = i + 1;

        // Fenced code
        if (auto fence = fence_of(line)) {
            block.kind = BlockKind::Code;
            block.text = std::string(fence->rest);
            ++i;
            while (i < n) {
                auto close = fence_of(lines[i]);
                if (close && close->ch == fence->ch && close->length >= fence->length &&
                    close->rest.empty()) {
                    ++i;
                    break;
                }
                block.lines.emplace_back(lines[i]);
                ++i;
            }
            blocks.push_back(std::move(block));
            continue;
        }

        // HTML comment
        if (is_comment_start(line)) {
            block.kind = BlockKind::HtmlComment;
            std::string body(trim(line).substr(4));
            ++i;
            size_t close = body.find("-->");
            while (close == std::string::npos && i < n) {
                body += '\n';
                body += lines[i];
                ++i;
                close = body.find("-->");
            }
            if (close == std::string::npos) {
                DOCSGUARD_LOG_DEBUG("markdown", "unterminated comment at line " << block.line);
            } else {
                body.resize(close);
            }
            block.text = std::string(trim(body));
            blocks.push_back(std::move(block));
            continue;
        }

        // ATX heading
        int level = 0;
        std::string heading;
        if (atx_heading(line, level, heading)) {
            block.kind = BlockKind::Heading;
            block.level = level;
            block.text = std::move(heading);
            blocks.push_back(std::move(block));
            ++i;
            continue;
        }

        // Pipe table
        if (is_table_start(lines, i)) {
            block.kind = BlockKind::Table;
            block.header = split_table_row(lines[i]);
            i += 2;
            while (i < n && !is_blank(lines[i]) && lines[i].find('|') != std::string_view::npos &&
                   !is_comment_start(lines[i])) {
                block.rows.push_back(split_table_row(lines[i]));
                ++i;
            }
            blocks.push_back(std::move(block));
            continue;
        }

        // Bullet or ordered list
        size_t offset = 0;
        if (list_marker_of(line, offset) && !is_thematic_break(line)) {
            block.kind = BlockKind::List;
            while (i < n) {
                if (list_marker_of(lines[i], offset) && !is_thematic_break(lines[i])) {
                    block.items.push_back({std::string(trim(lines[i].substr(offset))), i + 1});
                    ++i;
                    continue;
                }
                if (is_blank(lines[i])) {
                    size_t j = i;
                    while (j < n && is_blank(lines[j])) {
                        ++j;
                    }
                    if (j < n && list_marker_of(lines[j], offset) && !is_thematic_break(lines[j])) {
                        i = j;
                        continue;
                    }
                    break;
                }
                if (starts_block(lines, i)) {
                    break;
                }
                auto& last = block.items.back().text;
                if (!last.empty()) {
                    last += ' ';
                }
                last += trim(lines[i]);
                ++i;
            }
            blocks.push_back(std::move(block));
            continue;
        }

        if (is_thematic_break(line)) {
            ++i;
            continue;
        }

        // Paragraph, possibly turned into a setext heading
        block.kind = BlockKind::Paragraph;
        while (i < n && !is_blank(lines[i])) {
            if (!block.lines.empty()) {
                if (int setext = setext_level(lines[i]); setext > 0) {
                    std::string joined;
                    for (const auto& l : block.lines) {
                        if (!joined.empty()) {
                            joined += ' ';
                        }
                        joined += l;
                    }
                    block.kind = BlockKind::Heading;
                    block.level = setext;
                    block.text = std::move(joined);
                    block.lines.clear();
                    ++i;
                    break;
                }
                if (starts_block(lines, i)) {
                    break;
                }
            }
            block.lines.emplace_back(trim(lines[i]));
            ++i;
        }
        blocks.push_back(std::move(block));
    }

    return blocks;
}

} // namespace docsguard::doc
