//! # Declaration Lexer Implementation

#include "code/decl_lexer.hpp"

#include <algorithm>
#include <array>

namespace docsguard::code {

namespace {

auto is_ident_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || u >= 0x80;
}

auto is_ident_char(char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

class Lexer {
public:
    Lexer(std::string_view src, Language lang) : src_(src), lang_(lang) {}

    auto run() -> Result<std::vector<Token>, LexError> {
        while (pos_ < src_.size()) {
            char c = src_[pos_];

            if (c == '\n') {
                ++line_;
                ++pos_;
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                ++pos_;
                continue;
            }

            bool ok = true;
            if (c == '/' && peek(1) == '/') {
                lex_line_comment();
            } else if (c == '/' && peek(1) == '*') {
                ok = lex_block_comment();
            } else if (lang_ == Language::Rust && starts_rust_prefixed_string()) {
                ok = lex_rust_prefixed_string();
            } else if (lang_ == Language::Rust && c == 'r' && peek(1) == '#' &&
                       is_ident_start(peek(2))) {
                pos_ += 2; // raw identifier r#type
                lex_ident();
            } else if (is_ident_start(c)) {
                lex_ident();
            } else if (is_digit(c)) {
                lex_number();
            } else if (lang_ == Language::Rust && c == '"') {
                ok = lex_quoted('"', true);
            } else if (lang_ == Language::Rust && c == '\'') {
                ok = lex_rust_quote();
            } else if (c == '"' || c == '\'') {
                // JSX text may hold a lone apostrophe: keep it as punctuation
                size_t saved_pos = pos_;
                size_t saved_line = line_;
                if (!lex_quoted(c, false)) {
                    pos_ = saved_pos;
                    line_ = saved_line;
                    push(TokenKind::Punct, pos_, 1, line_);
                    ++pos_;
                }
            } else if (c == '`' && lang_ != Language::Rust) {
                ok = lex_template();
            } else if (c == '/' && lang_ != Language::Rust && regex_allowed()) {
                if (!lex_regex()) {
                    push(TokenKind::Punct, pos_, 1, line_);
                    ++pos_;
                }
            } else {
                lex_punct();
            }

            if (!ok) {
                return error_;
            }
        }
        return std::move(tokens_);
    }

private:
    std::string_view src_;
    Language lang_;
    size_t pos_ = 0;
    size_t line_ = 1;
    std::vector<Token> tokens_;
    LexError error_;

    [[nodiscard]] auto peek(size_t offset) const -> char {
        return pos_ + offset < src_.size() ? src_[pos_ + offset] : '\0';
    }

    void push(TokenKind kind, size_t start, size_t len, size_t start_line) {
        tokens_.push_back(Token{kind, std::string(src_.substr(start, len)), start_line, line_});
    }

    auto fail(std::string message, size_t line) -> bool {
        error_ = LexError{std::move(message), line};
        return false;
    }

    /// Advances over one character, counting newlines.
    void step() {
        if (src_[pos_] == '\n') {
            ++line_;
        }
        ++pos_;
    }

    void lex_line_comment() {
        size_t start = pos_;
        while (pos_ < src_.size() && src_[pos_] != '\n') {
            ++pos_;
        }
        push(TokenKind::Comment, start, pos_ - start, line_);
    }

    auto lex_block_comment() -> bool {
        size_t start = pos_;
        size_t start_line = line_;
        pos_ += 2;
        int depth = 1;
        while (pos_ < src_.size()) {
            if (src_[pos_] == '*' && peek(1) == '/') {
                pos_ += 2;
                if (--depth == 0) {
                    push(TokenKind::Comment, start, pos_ - start, start_line);
                    return true;
                }
                continue;
            }
            if (lang_ == Language::Rust && src_[pos_] == '/' && peek(1) == '*') {
                pos_ += 2;
                ++depth;
                continue;
            }
            step();
        }
        return fail("unterminated block comment", start_line);
    }

    void lex_ident() {
        size_t start = pos_;
        while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
            ++pos_;
        }
        push(TokenKind::Ident, start, pos_ - start, line_);
    }

    void lex_number() {
        size_t start = pos_;
        while (pos_ < src_.size() &&
               (is_ident_char(src_[pos_]) ||
                (src_[pos_] == '.' && is_digit(peek(1))))) {
            ++pos_;
        }
        push(TokenKind::Number, start, pos_ - start, line_);
    }

    /// Strings delimited by `quote` with backslash escapes.
    auto lex_quoted(char quote, bool multiline) -> bool {
        size_t start = pos_;
        size_t start_line = line_;
        ++pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\') {
                ++pos_;
                if (pos_ < src_.size()) {
                    step();
                }
                continue;
            }
            if (c == quote) {
                ++pos_;
                push(TokenKind::String, start, pos_ - start, start_line);
                return true;
            }
            if (c == '\n' && !multiline) {
                return fail("unterminated string literal", start_line);
            }
            step();
        }
        return fail("unterminated string literal", start_line);
    }

    [[nodiscard]] auto starts_rust_prefixed_string() const -> bool {
        char c = src_[pos_];
        if (c == 'b' && (peek(1) == '"' || peek(1) == '\'')) {
            return true;
        }
        size_t raw = pos_;
        if (c == 'b' && peek(1) == 'r') {
            raw = pos_ + 1;
        } else if (c == 'c' && peek(1) == '"') {
            return true;
        } else if (c != 'r') {
            return false;
        }
        size_t i = raw + 1;
        while (i < src_.size() && src_[i] == '#') {
            ++i;
        }
        return i < src_.size() && src_[i] == '"';
    }

    auto lex_rust_prefixed_string() -> bool {
        size_t start = pos_;
        size_t start_line = line_;
        if (src_[pos_] == 'b' && peek(1) == '\'') {
            ++pos_;
            if (!lex_rust_quote()) {
                return false;
            }
            tokens_.back().text = std::string(src_.substr(start, pos_ - start));
            return true;
        }
        if ((src_[pos_] == 'b' || src_[pos_] == 'c') && peek(1) == '"') {
            ++pos_;
            if (!lex_quoted('"', true)) {
                return false;
            }
            tokens_.back().text = std::string(src_.substr(start, pos_ - start));
            return true;
        }

        // Raw string: [b]r#*"..."#*
        if (src_[pos_] == 'b') {
            ++pos_;
        }
        ++pos_; // r
        size_t hashes = 0;
        while (pos_ < src_.size() && src_[pos_] == '#') {
            ++hashes;
            ++pos_;
        }
        ++pos_; // opening quote
        while (pos_ < src_.size()) {
            if (src_[pos_] == '"') {
                size_t n = 0;
                while (n < hashes && pos_ + 1 + n < src_.size() && src_[pos_ + 1 + n] == '#') {
                    ++n;
                }
                if (n == hashes) {
                    pos_ += 1 + hashes;
                    push(TokenKind::String, start, pos_ - start, start_line);
                    return true;
                }
            }
            step();
        }
        return fail("unterminated raw string literal", start_line);
    }

    /// Rust `'`: char literal, lifetime or label.
    auto lex_rust_quote() -> bool {
        size_t start = pos_;
        char next = peek(1);
        if (next == '\\') {
            return lex_quoted('\'', false);
        }
        if (peek(2) == '\'' && next != '\n') {
            pos_ += 3;
            push(TokenKind::String, start, 3, line_);
            return true;
        }
        if (static_cast<unsigned char>(next) >= 0x80) {
            for (size_t i = 2; i <= 5 && pos_ + i < src_.size(); ++i) {
                if (src_[pos_ + i] == '\'') {
                    pos_ += i + 1;
                    push(TokenKind::String, start, i + 1, line_);
                    return true;
                }
            }
        }
        if (is_ident_start(next)) {
            ++pos_;
            while (pos_ < src_.size() && is_ident_char(src_[pos_])) {
                ++pos_;
            }
            push(TokenKind::Lifetime, start, pos_ - start, line_);
            return true;
        }
        push(TokenKind::Punct, start, 1, line_);
        ++pos_;
        return true;
    }

    /// Skips a `${ ... }` substitution, including nested strings.
    auto skip_substitution(size_t start_line) -> bool {
        pos_ += 2;
        int depth = 1;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    ++pos_;
                    return true;
                }
            } else if (c == '`') {
                size_t saved = tokens_.size();
                if (!lex_template()) {
                    return false;
                }
                tokens_.resize(saved);
                continue;
            } else if (c == '"' || c == '\'') {
                size_t saved = tokens_.size();
                if (!lex_quoted(c, false)) {
                    return false;
                }
                tokens_.resize(saved);
                continue;
            }
            step();
        }
        return fail("unterminated template substitution", start_line);
    }

    auto lex_template() -> bool {
        size_t start = pos_;
        size_t start_line = line_;
        ++pos_;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\\') {
                ++pos_;
                if (pos_ < src_.size()) {
                    step();
                }
                continue;
            }
            if (c == '`') {
                ++pos_;
                push(TokenKind::String, start, pos_ - start, start_line);
                return true;
            }
            if (c == '$' && peek(1) == '{') {
                if (!skip_substitution(start_line)) {
                    return false;
                }
                continue;
            }
            step();
        }
        return fail("unterminated template literal", start_line);
    }

    /// A `/` starts a regex literal when it cannot be a division operator.
    [[nodiscard]] auto regex_allowed() const -> bool {
        const Token* prev = nullptr;
        for (auto it = tokens_.rbegin(); it != tokens_.rend(); ++it) {
            if (it->kind != TokenKind::Comment) {
                prev = &*it;
                break;
            }
        }
        if (!prev) {
            return true;
        }
        if (prev->kind == TokenKind::Punct) {
            static constexpr std::string_view OPERATORS = "(,=:[!&|?{};+-*%<>~^";
            return prev->text.size() == 1 ? OPERATORS.find(prev->text[0]) != std::string_view::npos
                                          : prev->text == "=>";
        }
        if (prev->kind == TokenKind::Ident) {
            static constexpr std::array<std::string_view, 11> KEYWORDS = {
                "return", "typeof", "case",  "in",    "of",   "delete",
                "void",   "throw",  "new",   "yield", "await"};
            return std::find(KEYWORDS.begin(), KEYWORDS.end(), prev->text) != KEYWORDS.end();
        }
        return false;
    }

    auto lex_regex() -> bool {
        size_t start = pos_;
        size_t i = pos_ + 1;
        bool in_class = false;
        while (i < src_.size()) {
            char c = src_[i];
            if (c == '\n') {
                return false;
            }
            if (c == '\\') {
                i += 2;
                continue;
            }
            if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                ++i;
                while (i < src_.size() && is_ident_char(src_[i])) {
                    ++i;
                }
                pos_ = i;
                push(TokenKind::String, start, pos_ - start, line_);
                return true;
            }
            ++i;
        }
        return false;
    }

    void lex_punct() {
        static constexpr std::array<std::string_view, 5> MULTI = {"...", "->", "=>", "::", "?."};
        auto rest = src_.substr(pos_);
        for (auto op : MULTI) {
            // "?." followed by a digit is a ternary with a decimal literal
            if (rest.starts_with(op) && !(op == "?." && rest.size() > 2 && is_digit(rest[2]))) {
                push(TokenKind::Punct, pos_, op.size(), line_);
                pos_ += op.size();
                return;
            }
        }
        push(TokenKind::Punct, pos_, 1, line_);
        ++pos_;
    }
};

} // namespace

auto language_name(Language lang) -> const char* {
    switch (lang) {
    case Language::Rust:
        return "rust";
    case Language::TypeScript:
        return "typescript";
    case Language::JavaScript:
        return "javascript";
    }
    return "unknown";
}

auto language_for_path(std::string_view path) -> std::optional<Language> {
    size_t dot = path.rfind('.');
    size_t slash = path.find_last_of("/\\");
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return std::nullopt;
    }
    auto ext = path.substr(dot);
    if (ext == ".rs") {
        return Language::Rust;
    }
    if (ext == ".ts" || ext == ".tsx" || ext == ".mts" || ext == ".cts") {
        return Language::TypeScript;
    }
    if (ext == ".js" || ext == ".jsx" || ext == ".mjs" || ext == ".cjs") {
        return Language::JavaScript;
    }
    return std::nullopt;
}

auto tokenize(std::string_view source, Language lang) -> Result<std::vector<Token>, LexError> {
    Lexer lexer(source, lang);
    return lexer.run();
}

} // namespace docsguard::code
