//! # Declaration Scanner Implementation
//!
//! Walks the token stream once. At every token it first tries the
//! recognizers for the file's language; tokens that start no declaration
//! only update the bracket stack, which also tells whether the cursor sits
//! directly inside a class body.

#include "code/decl_scanner.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <array>

namespace docsguard::code {

namespace {

constexpr size_t NPOS = static_cast<size_t>(-1);

auto is_punct(const Token& t, std::string_view text) -> bool {
    return t.kind == TokenKind::Punct && t.text == text;
}

auto is_ident(const Token& t, std::string_view text) -> bool {
    return t.kind == TokenKind::Ident && t.text == text;
}

template <size_t N>
auto is_one_of(const Token& t, const std::array<std::string_view, N>& words) -> bool {
    return t.kind == TokenKind::Ident &&
           std::find(words.begin(), words.end(), t.text) != words.end();
}

auto is_opener(const Token& t) -> bool {
    return is_punct(t, "(") || is_punct(t, "[") || is_punct(t, "{");
}

auto is_closer(const Token& t) -> bool {
    return is_punct(t, ")") || is_punct(t, "]") || is_punct(t, "}");
}

auto wordish(const Token& t) -> bool {
    return t.kind == TokenKind::Ident || t.kind == TokenKind::Number ||
           t.kind == TokenKind::Lifetime;
}

auto needs_space(const Token& prev, const Token& next) -> bool {
    if (wordish(prev) && wordish(next)) {
        return true;
    }
    if (is_punct(prev, ",")) {
        return true;
    }
    return is_punct(prev, "|") || is_punct(next, "|") || is_punct(prev, "=>") ||
           is_punct(next, "=>");
}

/// Joins a token slice into readable source text.
auto join_tokens(const std::vector<const Token*>& toks, size_t begin, size_t end) -> std::string {
    std::string out;
    const Token* prev = nullptr;
    for (size_t k = begin; k < end && k < toks.size(); ++k) {
        if (prev && needs_space(*prev, *toks[k])) {
            out += ' ';
        }
        out += toks[k]->text;
        prev = toks[k];
    }
    return out;
}

/// Index of the first top-level `stop` punct in `toks[begin..)`, or NPOS.
auto find_top_level(const std::vector<const Token*>& toks, size_t begin, std::string_view stop)
    -> size_t {
    int depth = 0;
    for (size_t k = begin; k < toks.size(); ++k) {
        const Token& t = *toks[k];
        if (depth == 0 && is_punct(t, stop)) {
            return k;
        }
        if (is_opener(t) || is_punct(t, "<")) {
            ++depth;
        } else if ((is_closer(t) || is_punct(t, ">")) && depth > 0) {
            --depth;
        }
    }
    return NPOS;
}

auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos
                                                                      : nl - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (nl == std::string::npos) {
            break;
        }
        start = nl + 1;
    }
    return lines;
}

constexpr std::array<std::string_view, 5> RUST_MODIFIERS = {"const", "async", "unsafe",
                                                            "default", "extern"};
constexpr std::array<std::string_view, 4> TS_FUNCTION_MODIFIERS = {"export", "default", "async",
                                                                   "declare"};
constexpr std::array<std::string_view, 12> TS_MEMBER_MODIFIERS = {
    "public",   "private", "protected", "static", "async",    "readonly",
    "abstract", "override", "declare",  "get",    "set",      "accessor"};
constexpr std::array<std::string_view, 5> TS_PARAM_MODIFIERS = {"public", "private", "protected",
                                                                "readonly", "override"};

class Scanner {
public:
    Scanner(std::vector<Token> tokens, Language lang) : toks_(std::move(tokens)), lang_(lang) {}

    auto run() -> Result<std::vector<DeclNode>, ScanError> {
        size_t i = 0;
        while (i < toks_.size()) {
            const Token& t = toks_[i];

            if (t.kind == TokenKind::Comment) {
                take_comment(t);
                ++i;
                continue;
            }

            if (size_t end = skip_attribute(i); end != i) {
                if (!pending_.empty() && t.line <= pending_last_line_ + 1) {
                    pending_last_line_ = toks_[end - 1].end_line;
                } else {
                    pending_.clear();
                }
                i = end;
                continue;
            }

            if (auto found = try_declaration(i)) {
                if (!pending_.empty() && found->node.line <= pending_last_line_ + 1) {
                    found->node.comment_lines = std::move(pending_);
                }
                pending_.clear();
                DOCSGUARD_LOG_TRACE("scan", "declaration '" << found->node.name << "' at line "
                                                            << found->node.line << " with "
                                                            << found->node.params.size()
                                                            << " params");
                decls_.push_back(std::move(found->node));
                i = found->next;
                last_code_line_ = toks_[i - 1].end_line;
                member_start_ = false;
                continue;
            }
            if (error_) {
                return *error_;
            }

            if (!track_structure(i)) {
                return *error_;
            }
            last_code_line_ = t.end_line;
            pending_.clear();
            ++i;
        }

        if (!frames_.empty()) {
            return ScanError{std::string("unclosed '") + frames_.back().open + "'",
                             frames_.back().line};
        }
        return std::move(decls_);
    }

private:
    struct Frame {
        char open;
        size_t line;
        bool is_class;
    };

    struct ParsedParams {
        std::vector<DeclParam> params;
        size_t next; ///< Index after the closing token
    };

    struct Found {
        DeclNode node;
        size_t next;
    };

    std::vector<Token> toks_;
    Language lang_;
    std::vector<DeclNode> decls_;
    std::vector<Frame> frames_;
    std::optional<ScanError> error_;

    std::vector<std::string> pending_;
    size_t pending_last_line_ = 0;
    size_t last_code_line_ = 0;
    bool class_pending_ = false;
    bool member_start_ = false;

    [[nodiscard]] auto tok(size_t j) const -> const Token& {
        static const Token END{TokenKind::Punct, "", 0, 0};
        return j < toks_.size() ? toks_[j] : END;
    }

    [[nodiscard]] auto in_class_body() const -> bool {
        return !frames_.empty() && frames_.back().is_class;
    }

    // ========================================================================
    // Comments and Attributes
    // ========================================================================

    void take_comment(const Token& t) {
        if (t.line == last_code_line_) {
            return; // trailing comment after code
        }
        if (!pending_.empty() && t.line > pending_last_line_ + 1) {
            pending_.clear();
        }
        for (auto& line : split_lines(t.text)) {
            pending_.push_back(std::move(line));
        }
        pending_last_line_ = t.end_line;
    }

    /// Returns the index after a Rust attribute or TS decorator at `i`, or
    /// `i` itself if there is none.
    auto skip_attribute(size_t i) -> size_t {
        if (lang_ == Language::Rust) {
            if (!is_punct(tok(i), "#")) {
                return i;
            }
            size_t j = i + 1;
            if (is_punct(tok(j), "!")) {
                ++j;
            }
            if (!is_punct(tok(j), "[")) {
                return i;
            }
            size_t end = skip_group(j);
            return end == NPOS ? i : end;
        }

        if (!is_punct(tok(i), "@") || tok(i + 1).kind != TokenKind::Ident) {
            return i;
        }
        size_t j = i + 2;
        while (is_punct(tok(j), ".") && tok(j + 1).kind == TokenKind::Ident) {
            j += 2;
        }
        if (is_punct(tok(j), "(")) {
            size_t end = skip_group(j);
            return end == NPOS ? i : end;
        }
        return j;
    }

    // ========================================================================
    // Structure
    // ========================================================================

    auto track_structure(size_t i) -> bool {
        const Token& t = toks_[i];
        if (is_opener(t)) {
            Frame frame{t.text[0], t.line, false};
            if (t.text == "{" && class_pending_) {
                frame.is_class = true;
                class_pending_ = false;
            }
            frames_.push_back(frame);
            member_start_ = frame.is_class;
            return true;
        }
        if (is_closer(t)) {
            char want = t.text == ")" ? '(' : t.text == "]" ? '[' : '{';
            if (frames_.empty() || frames_.back().open != want) {
                error_ = ScanError{"unbalanced '" + t.text + "'", t.line};
                return false;
            }
            frames_.pop_back();
            member_start_ = t.text == "}" && in_class_body();
            return true;
        }
        if (is_punct(t, ";")) {
            class_pending_ = false;
            member_start_ = in_class_body();
            return true;
        }
        if (lang_ != Language::Rust && is_ident(t, "class")) {
            const Token& next = tok(i + 1);
            if (next.kind == TokenKind::Ident || is_punct(next, "{")) {
                class_pending_ = true;
            }
        }
        member_start_ = false;
        return true;
    }

    /// Skips a bracket group starting at `j`. Returns the index after the
    /// matching closer, or NPOS when the file ends first.
    [[nodiscard]] auto skip_group(size_t j) const -> size_t {
        int depth = 0;
        for (size_t k = j; k < toks_.size(); ++k) {
            if (is_opener(toks_[k])) {
                ++depth;
            } else if (is_closer(toks_[k])) {
                if (--depth == 0) {
                    return k + 1;
                }
            }
        }
        return NPOS;
    }

    /// Skips a generic parameter list starting at `<`.
    [[nodiscard]] auto skip_angles(size_t j) const -> size_t {
        int depth = 0;
        for (size_t k = j; k < toks_.size(); ++k) {
            const Token& t = toks_[k];
            if (is_punct(t, "<")) {
                ++depth;
            } else if (is_punct(t, ">")) {
                if (--depth == 0) {
                    return k + 1;
                }
            } else if (is_punct(t, ";") || is_punct(t, "{")) {
                return NPOS;
            }
        }
        return NPOS;
    }

    /// From `j`, finds the top-level `=` that ends a type annotation.
    [[nodiscard]] auto skip_type_annotation(size_t j) const -> size_t {
        int depth = 0;
        for (size_t k = j; k < toks_.size(); ++k) {
            const Token& t = toks_[k];
            if (t.kind == TokenKind::Comment) {
                continue;
            }
            if (depth == 0 && is_punct(t, "=")) {
                return k;
            }
            if (depth == 0 && (is_punct(t, ";") || is_closer(t) || is_punct(t, ","))) {
                return NPOS;
            }
            if (is_opener(t) || is_punct(t, "<")) {
                ++depth;
            } else if ((is_closer(t) || is_punct(t, ">")) && depth > 0) {
                --depth;
            }
        }
        return NPOS;
    }

    /// True if an arrow follows a parameter list ending before `k`,
    /// possibly after a return type annotation.
    [[nodiscard]] auto arrow_follows(size_t k) const -> bool {
        if (is_punct(tok(k), "=>")) {
            return true;
        }
        if (!is_punct(tok(k), ":")) {
            return false;
        }
        int depth = 0;
        for (size_t m = k + 1; m < toks_.size(); ++m) {
            const Token& t = toks_[m];
            if (depth == 0 && is_punct(t, "=>")) {
                return true;
            }
            if (depth == 0 && (is_punct(t, ";") || is_punct(t, "=") || is_punct(t, ",") ||
                               is_closer(t))) {
                return false;
            }
            if (is_opener(t) || is_punct(t, "<")) {
                ++depth;
            } else if ((is_closer(t) || is_punct(t, ">")) && depth > 0) {
                --depth;
            }
        }
        return false;
    }

    // ========================================================================
    // Parameters
    // ========================================================================

    auto parse_params(size_t open) -> std::optional<ParsedParams> {
        std::vector<std::vector<const Token*>> groups(1);
        int depth = 0;
        size_t k = open + 1;
        for (; k < toks_.size(); ++k) {
            const Token& t = toks_[k];
            if (t.kind == TokenKind::Comment) {
                continue;
            }
            if (is_opener(t)) {
                ++depth;
            } else if (is_closer(t)) {
                if (depth == 0) {
                    if (t.text != ")") {
                        error_ = ScanError{"unbalanced '" + t.text + "' in parameter list", t.line};
                        return std::nullopt;
                    }
                    break;
                }
                --depth;
            } else if (depth == 0 && is_punct(t, ",")) {
                // A comma inside an open generic (`Map<K, V>`) does not split
                int angle = 0;
                for (const Token* g : groups.back()) {
                    if (is_punct(*g, "<")) {
                        ++angle;
                    } else if (is_punct(*g, ">") && angle > 0) {
                        --angle;
                    }
                }
                if (angle == 0) {
                    groups.emplace_back();
                    continue;
                }
            }
            groups.back().push_back(&t);
        }
        if (k >= toks_.size()) {
            error_ = ScanError{"unclosed parameter list", toks_[open].line};
            return std::nullopt;
        }

        ParsedParams parsed;
        parsed.next = k + 1;
        for (const auto& group : groups) {
            if (group.empty()) {
                continue;
            }
            auto param = lang_ == Language::Rust ? parse_rust_param(group) : parse_ts_param(group);
            if (param) {
                parsed.params.push_back(std::move(*param));
            }
        }
        return parsed;
    }

    static auto parse_rust_param(const std::vector<const Token*>& g) -> std::optional<DeclParam> {
        size_t b = 0;
        while (b + 1 < g.size() && is_punct(*g[b], "#") && is_punct(*g[b + 1], "[")) {
            int depth = 0;
            for (; b < g.size(); ++b) {
                if (is_punct(*g[b], "[")) {
                    ++depth;
                } else if (is_punct(*g[b], "]") && --depth == 0) {
                    ++b;
                    break;
                }
            }
        }

        size_t colon = find_top_level(g, b, ":");
        size_t pattern_end = colon == NPOS ? g.size() : colon;

        for (size_t k = b; k < pattern_end; ++k) {
            if (is_ident(*g[k], "self")) {
                return std::nullopt;
            }
        }
        while (b < pattern_end && (is_ident(*g[b], "mut") || is_ident(*g[b], "ref"))) {
            ++b;
        }
        if (pattern_end - b != 1 || g[b]->kind != TokenKind::Ident || g[b]->text == "_") {
            return std::nullopt; // destructuring pattern
        }

        DeclParam param;
        param.name = g[b]->text;
        if (colon != NPOS && colon + 1 < g.size()) {
            param.type = join_tokens(g, colon + 1, g.size());
        }
        return param;
    }

    auto parse_ts_param(const std::vector<const Token*>& g) const -> std::optional<DeclParam> {
        size_t b = 0;
        while (b < g.size()) {
            if (is_punct(*g[b], "@") && b + 1 < g.size()) {
                b += 2;
                while (b + 1 < g.size() && is_punct(*g[b], ".")) {
                    b += 2;
                }
                if (b < g.size() && is_punct(*g[b], "(")) {
                    int depth = 0;
                    for (; b < g.size(); ++b) {
                        if (is_opener(*g[b])) {
                            ++depth;
                        } else if (is_closer(*g[b]) && --depth == 0) {
                            ++b;
                            break;
                        }
                    }
                }
                continue;
            }
            if (is_one_of(*g[b], TS_PARAM_MODIFIERS) && b + 1 < g.size() &&
                g[b + 1]->kind == TokenKind::Ident) {
                ++b;
                continue;
            }
            break;
        }
        if (b >= g.size()) {
            return std::nullopt;
        }
        if (is_punct(*g[b], "{") || is_punct(*g[b], "[")) {
            return std::nullopt; // destructured
        }
        if (is_punct(*g[b], "...")) {
            ++b;
        }
        if (b >= g.size() || g[b]->kind != TokenKind::Ident || g[b]->text == "this") {
            return std::nullopt;
        }

        DeclParam param;
        param.name = g[b]->text;
        ++b;
        if (b < g.size() && is_punct(*g[b], "?")) {
            ++b;
        }
        if (lang_ == Language::TypeScript && b < g.size() && is_punct(*g[b], ":")) {
            size_t end = find_top_level(g, b + 1, "=");
            auto type = join_tokens(g, b + 1, end == NPOS ? g.size() : end);
            if (!type.empty()) {
                param.type = std::move(type);
            }
        }
        return param;
    }

    // ========================================================================
    // Recognizers
    // ========================================================================

    auto try_declaration(size_t i) -> std::optional<Found> {
        if (lang_ == Language::Rust) {
            return try_rust_fn(i);
        }
        if (in_class_body()) {
            return member_start_ ? try_class_member(i) : std::nullopt;
        }
        if (auto found = try_ts_function(i)) {
            return found;
        }
        if (error_) {
            return std::nullopt;
        }
        return try_ts_variable(i);
    }

    auto finish(size_t start, std::string name, size_t open) -> std::optional<Found> {
        auto params = parse_params(open);
        if (!params) {
            return std::nullopt;
        }
        Found found;
        found.node.name = std::move(name);
        found.node.line = toks_[start].line;
        found.node.params = std::move(params->params);
        found.next = params->next;
        return found;
    }

    auto try_rust_fn(size_t i) -> std::optional<Found> {
        size_t j = i;
        while (true) {
            const Token& t = tok(j);
            if (is_ident(t, "pub")) {
                ++j;
                if (is_punct(tok(j), "(")) {
                    j = skip_group(j);
                    if (j == NPOS) {
                        return std::nullopt;
                    }
                }
            } else if (is_ident(t, "extern")) {
                ++j;
                if (tok(j).kind == TokenKind::String) {
                    ++j;
                }
            } else if (is_one_of(t, RUST_MODIFIERS)) {
                ++j;
            } else {
                break;
            }
        }
        if (!is_ident(tok(j), "fn")) {
            return std::nullopt;
        }
        ++j;
        const Token& name = tok(j);
        if (name.kind != TokenKind::Ident || name.text.starts_with('$')) {
            return std::nullopt; // fn pointer type or macro fragment
        }
        ++j;
        if (is_punct(tok(j), "<")) {
            j = skip_angles(j);
            if (j == NPOS) {
                return std::nullopt;
            }
        }
        if (!is_punct(tok(j), "(")) {
            return std::nullopt;
        }
        return finish(i, name.text, j);
    }

    auto try_ts_function(size_t i) -> std::optional<Found> {
        size_t j = i;
        while (is_one_of(tok(j), TS_FUNCTION_MODIFIERS)) {
            ++j;
        }
        if (!is_ident(tok(j), "function")) {
            return std::nullopt;
        }
        ++j;
        if (is_punct(tok(j), "*")) {
            ++j;
        }
        const Token& name = tok(j);
        if (name.kind != TokenKind::Ident) {
            return std::nullopt; // anonymous function expression
        }
        ++j;
        if (is_punct(tok(j), "<")) {
            j = skip_angles(j);
            if (j == NPOS) {
                return std::nullopt;
            }
        }
        if (!is_punct(tok(j), "(")) {
            return std::nullopt;
        }
        return finish(i, name.text, j);
    }

    /// Parses the value side of `name = <function value>`: a function
    /// expression or an arrow function.
    auto try_function_value(size_t start, std::string name, size_t j) -> std::optional<Found> {
        if (is_ident(tok(j), "async")) {
            ++j;
        }
        if (is_ident(tok(j), "function")) {
            ++j;
            if (is_punct(tok(j), "*")) {
                ++j;
            }
            if (tok(j).kind == TokenKind::Ident) {
                ++j;
            }
            if (is_punct(tok(j), "<")) {
                j = skip_angles(j);
                if (j == NPOS) {
                    return std::nullopt;
                }
            }
            if (!is_punct(tok(j), "(")) {
                return std::nullopt;
            }
            return finish(start, std::move(name), j);
        }

        if (is_punct(tok(j), "<")) {
            j = skip_angles(j);
            if (j == NPOS) {
                return std::nullopt;
            }
        }
        if (is_punct(tok(j), "(")) {
            size_t close = skip_group(j);
            if (close == NPOS || !arrow_follows(close)) {
                return std::nullopt;
            }
            return finish(start, std::move(name), j);
        }
        if (tok(j).kind == TokenKind::Ident && is_punct(tok(j + 1), "=>")) {
            Found found;
            found.node.name = std::move(name);
            found.node.line = toks_[start].line;
            found.node.params.push_back(DeclParam{tok(j).text, std::nullopt});
            found.next = j + 1;
            return found;
        }
        return std::nullopt;
    }

    auto try_ts_variable(size_t i) -> std::optional<Found> {
        size_t j = i;
        while (is_ident(tok(j), "export") || is_ident(tok(j), "declare")) {
            ++j;
        }
        if (!is_ident(tok(j), "const") && !is_ident(tok(j), "let") && !is_ident(tok(j), "var")) {
            return std::nullopt;
        }
        ++j;
        const Token& name = tok(j);
        if (name.kind != TokenKind::Ident) {
            return std::nullopt;
        }
        ++j;
        if (is_punct(tok(j), ":")) {
            j = skip_type_annotation(j + 1);
            if (j == NPOS) {
                return std::nullopt;
            }
        }
        if (!is_punct(tok(j), "=")) {
            return std::nullopt;
        }
        return try_function_value(i, name.text, j + 1);
    }

    auto try_class_member(size_t i) -> std::optional<Found> {
        size_t j = i;
        while (is_one_of(tok(j), TS_MEMBER_MODIFIERS)) {
            const Token& next = tok(j + 1);
            bool names_follow = next.kind == TokenKind::Ident || is_punct(next, "*") ||
                                is_punct(next, "#");
            if (!names_follow) {
                break; // the modifier word is the member name itself
            }
            ++j;
        }
        if (is_punct(tok(j), "*")) {
            ++j;
        }

        std::string name;
        if (is_punct(tok(j), "#") && tok(j + 1).kind == TokenKind::Ident) {
            name = "#" + tok(j + 1).text;
            j += 2;
        } else if (tok(j).kind == TokenKind::Ident) {
            name = tok(j).text;
            ++j;
        } else {
            return std::nullopt;
        }
        if (is_punct(tok(j), "?") || is_punct(tok(j), "!")) {
            ++j;
        }

        if (is_punct(tok(j), "<") || is_punct(tok(j), "(")) {
            if (is_punct(tok(j), "<")) {
                j = skip_angles(j);
                if (j == NPOS || !is_punct(tok(j), "(")) {
                    return std::nullopt;
                }
            }
            size_t close = skip_group(j);
            if (close == NPOS) {
                return std::nullopt;
            }
            const Token& after = tok(close);
            if (!is_punct(after, "{") && !is_punct(after, ":") && !is_punct(after, ";")) {
                return std::nullopt;
            }
            return finish(i, std::move(name), j);
        }

        if (is_punct(tok(j), ":")) {
            j = skip_type_annotation(j + 1);
            if (j == NPOS) {
                return std::nullopt;
            }
        }
        if (is_punct(tok(j), "=")) {
            return try_function_value(i, std::move(name), j + 1);
        }
        return std::nullopt;
    }
};

} // namespace

auto scan_declarations(std::string_view source, Language lang)
    -> Result<std::vector<DeclNode>, ScanError> {
    auto tokens = tokenize(source, lang);
    if (is_err(tokens)) {
        const auto& err = unwrap_err(tokens);
        return ScanError{err.message, err.line};
    }
    Scanner scanner(std::move(unwrap(tokens)), lang);
    return scanner.run();
}

} // namespace docsguard::code
