//! # Argument Extraction Strategies Implementation

#include "doc/arg_strategies.hpp"

#include "log/log.hpp"

#include <cctype>
#include <initializer_list>
#include <string>

namespace docsguard::doc {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

/// Removes backticks and emphasis asterisks, then trims.
auto strip_markup(std::string_view s) -> std::string {
    std::string out;
    for (char c : s) {
        if (c != '`' && c != '*') {
            out += c;
        }
    }
    return std::string(trim(out));
}

auto lower(std::string_view s) -> std::string {
    std::string out;
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// A type written between delimiters: no whitespace outside angle brackets.
auto is_type_like(std::string_view s) -> bool {
    if (s.empty() || s.size() > 48) {
        return false;
    }
    int angle = 0;
    for (char c : s) {
        if (c == '<') {
            ++angle;
        } else if (c == '>') {
            --angle;
        } else if (std::isspace(static_cast<unsigned char>(c)) && angle <= 0) {
            return false;
        }
    }
    return true;
}

struct Entry {
    model::Arg arg;
    bool backticked = false;
};

/// Consumes one delimiter (`:`, `-`, em dash, en dash). Returns false if
/// none is present.
auto consume_delimiter(std::string_view text, size_t& pos) -> bool {
    if (pos >= text.size()) {
        return false;
    }
    if (text[pos] == ':') {
        ++pos;
        return true;
    }
    if (text[pos] == '-') {
        while (pos < text.size() && text[pos] == '-') {
            ++pos;
        }
        return true;
    }
    auto rest = text.substr(pos);
    if (rest.starts_with("\xE2\x80\x94") || rest.starts_with("\xE2\x80\x93")) {
        pos += 3;
        return true;
    }
    return false;
}

void skip_spaces(std::string_view text, size_t& pos) {
    while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
        ++pos;
    }
}

auto parse_entry(std::string_view raw, bool require_delimiter) -> std::optional<Entry> {
    auto text = trim(raw);
    size_t pos = 0;
    Entry entry;

    bool bold = text.starts_with("**");
    if (bold) {
        pos = 2;
    }

    // Term
    if (pos < text.size() && text[pos] == '`') {
        size_t close = text.find('`', pos + 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        auto term = trim(text.substr(pos + 1, close - pos - 1));
        if (term.empty() || !is_ident_start(term[0])) {
            return std::nullopt;
        }
        for (char c : term) {
            if (!is_ident_char(c) && c != '.' && c != '?') {
                return std::nullopt;
            }
        }
        if (term.back() == '?') {
            term.remove_suffix(1);
        }
        entry.arg.name = std::string(term);
        entry.backticked = true;
        pos = close + 1;
    } else {
        size_t start = pos;
        if (pos >= text.size() || !is_ident_start(text[pos])) {
            return std::nullopt;
        }
        while (pos < text.size() && is_ident_char(text[pos])) {
            ++pos;
        }
        entry.arg.name = std::string(text.substr(start, pos - start));
        if (pos < text.size() && text[pos] == '?') {
            ++pos;
        }
    }

    if (bold) {
        if (text.substr(pos, 2) != "**") {
            return std::nullopt;
        }
        pos += 2;
    }

    skip_spaces(text, pos);

    // Optional type: (type) or `type`
    if (pos < text.size() && text[pos] == '(') {
        size_t close = text.find(')', pos + 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        auto type = strip_markup(text.substr(pos + 1, close - pos - 1));
        if (!type.empty()) {
            entry.arg.type = std::move(type);
        }
        pos = close + 1;
    } else if (pos < text.size() && text[pos] == '`') {
        size_t close = text.find('`', pos + 1);
        if (close == std::string_view::npos) {
            return std::nullopt;
        }
        auto type = strip_markup(text.substr(pos + 1, close - pos - 1));
        if (!type.empty()) {
            entry.arg.type = std::move(type);
        }
        pos = close + 1;
    }

    skip_spaces(text, pos);

    if (pos >= text.size()) {
        if (require_delimiter || (!entry.backticked && !entry.arg.type)) {
            return std::nullopt;
        }
        return entry;
    }

    bool colon = text[pos] == ':';
    if (!consume_delimiter(text, pos)) {
        return std::nullopt;
    }

    // `name: type: description`
    if (colon && !entry.arg.type) {
        auto rest = text.substr(pos);
        size_t second = rest.find(':');
        if (second != std::string_view::npos &&
            (second + 1 == rest.size() || rest[second + 1] == ' ' || rest[second + 1] == '\t')) {
            auto segment = trim(rest.substr(0, second));
            if (is_type_like(segment)) {
                entry.arg.type = strip_markup(segment);
                pos += second + 1;
            }
        }
    }

    entry.arg.description = std::string(trim(text.substr(pos)));
    return entry;
}

// ============================================================================
// Strategies
// ============================================================================

auto header_matches(const std::string& cell, std::initializer_list<std::string_view> prefixes)
    -> bool {
    for (auto prefix : prefixes) {
        if (cell.starts_with(prefix)) {
            return true;
        }
    }
    return false;
}

auto extract_table(const Block& block) -> std::vector<model::Arg> {
    if (block.kind != BlockKind::Table) {
        return {};
    }

    int param_col = -1;
    int type_col = -1;
    int desc_col = -1;
    for (size_t c = 0; c < block.header.size(); ++c) {
        auto cell = lower(strip_markup(block.header[c]));
        int col = static_cast<int>(c);
        if (type_col < 0 && cell.starts_with("type")) {
            type_col = col;
        } else if (param_col < 0 &&
                   header_matches(cell, {"param", "arg", "field", "key", "name", "prop"})) {
            param_col = col;
        } else if (desc_col < 0 &&
                   header_matches(cell, {"desc", "detail", "meaning", "note", "summary",
                                         "purpose", "explanation"})) {
            desc_col = col;
        }
    }
    if (param_col < 0) {
        return {};
    }

    auto cell_at = [](const std::vector<std::string>& row, int col) -> std::string {
        if (col < 0 || static_cast<size_t>(col) >= row.size()) {
            return {};
        }
        return row[static_cast<size_t>(col)];
    };

    std::vector<model::Arg> args;
    for (const auto& row : block.rows) {
        auto name_cell = strip_markup(cell_at(row, param_col));
        size_t end = 0;
        while (end < name_cell.size() && (is_ident_char(name_cell[end]) || name_cell[end] == '.')) {
            ++end;
        }
        if (end == 0 || !is_ident_start(name_cell[0])) {
            continue;
        }

        model::Arg arg;
        arg.name = name_cell.substr(0, end);
        auto type = strip_markup(cell_at(row, type_col));
        if (!type.empty()) {
            arg.type = std::move(type);
        }
        arg.description = std::string(trim(cell_at(row, desc_col)));
        args.push_back(std::move(arg));
    }
    return args;
}

auto extract_list(const Block& block) -> std::vector<model::Arg> {
    if (block.kind != BlockKind::List || block.items.empty()) {
        return {};
    }
    std::vector<model::Arg> args;
    for (const auto& item : block.items) {
        auto entry = parse_entry(item.text, false);
        if (!entry) {
            return {};
        }
        args.push_back(std::move(entry->arg));
    }
    return args;
}

auto extract_definition(const Block& block) -> std::vector<model::Arg> {
    if (block.kind != BlockKind::Paragraph || block.lines.empty()) {
        return {};
    }
    std::vector<model::Arg> args;
    bool only_bare = true;
    for (const auto& line : block.lines) {
        auto entry = parse_entry(line, true);
        if (!entry) {
            return {};
        }
        if (entry->backticked || entry->arg.type) {
            only_bare = false;
        }
        args.push_back(std::move(entry->arg));
    }
    // "Note: this call is idempotent." reads as prose, not a definition.
    if (block.lines.size() == 1 && only_bare) {
        return {};
    }
    return args;
}

} // namespace

auto strategy_name(ArgStrategy strategy) -> const char* {
    switch (strategy) {
    case ArgStrategy::Table:
        return "table";
    case ArgStrategy::List:
        return "list";
    case ArgStrategy::Definition:
        return "definition";
    }
    return "unknown";
}

auto try_extract(ArgStrategy strategy, const Block& block) -> std::vector<model::Arg> {
    switch (strategy) {
    case ArgStrategy::Table:
        return extract_table(block);
    case ArgStrategy::List:
        return extract_list(block);
    case ArgStrategy::Definition:
        return extract_definition(block);
    }
    return {};
}

auto extract_args(std::span<const Block> body) -> ArgExtraction {
    for (auto strategy : STRATEGY_ORDER) {
        for (const auto& block : body) {
            auto args = try_extract(strategy, block);
            if (!args.empty()) {
                DOCSGUARD_LOG_TRACE("extract", strategy_name(strategy)
                                                   << " strategy matched block at line "
                                                   << block.line << " (" << args.size()
                                                   << " args)");
                return ArgExtraction{strategy, std::move(args)};
            }
        }
    }
    return ArgExtraction{};
}

auto parse_term_entry(std::string_view text, bool require_delimiter)
    -> std::optional<model::Arg> {
    auto entry = parse_entry(text, require_delimiter);
    if (!entry) {
        return std::nullopt;
    }
    return std::move(entry->arg);
}

} // namespace docsguard::doc
