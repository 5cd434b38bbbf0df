//! # JSON Parser
//!
//! Recursive descent parser for RFC 8259 JSON.
//!
//! ## Features
//!
//! - Line and column tracking for error messages
//! - `\uXXXX` escapes including surrogate pairs, encoded as UTF-8
//! - Integers kept as `int64_t` when they fit, doubles otherwise
//! - Nesting depth limit

#include "json/json.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>

namespace docsguard::json {

namespace {

constexpr size_t MAX_DEPTH = 256;

class Parser {
public:
    explicit Parser(std::string_view input) : input_(input) {}

    auto parse_document() -> Result<JsonValue, JsonError> {
        skip_whitespace();
        auto value = parse_value(0);
        if (!value) {
            return error_;
        }
        skip_whitespace();
        if (pos_ < input_.size()) {
            return make_error("unexpected trailing content");
        }
        return std::move(*value);
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    JsonError error_;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= input_.size();
    }

    [[nodiscard]] auto peek() const -> char {
        return at_end() ? '\0' : input_[pos_];
    }

    auto advance() -> char {
        char c = input_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    void skip_whitespace() {
        while (!at_end()) {
            char c = peek();
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
                break;
            }
            advance();
        }
    }

    auto make_error(std::string message) -> JsonError {
        return JsonError::make(std::move(message), line_, column_);
    }

    auto fail(std::string message) -> std::optional<JsonValue> {
        error_ = make_error(std::move(message));
        return std::nullopt;
    }

    auto parse_value(size_t depth) -> std::optional<JsonValue> {
        if (depth > MAX_DEPTH) {
            return fail("nesting too deep");
        }
        if (at_end()) {
            return fail("unexpected end of input");
        }

        char c = peek();
        switch (c) {
        case '{':
            return parse_object(depth);
        case '[':
            return parse_array(depth);
        case '"': {
            auto s = parse_string();
            if (!s) {
                return std::nullopt;
            }
            return JsonValue(std::move(*s));
        }
        case 't':
            return parse_literal("true", JsonValue(true));
        case 'f':
            return parse_literal("false", JsonValue(false));
        case 'n':
            return parse_literal("null", JsonValue());
        default:
            if (c == '-' || (c >= '0' && c <= '9')) {
                return parse_number();
            }
            return fail(std::string("unexpected character '") + c + "'");
        }
    }

    auto parse_literal(std::string_view word, JsonValue value) -> std::optional<JsonValue> {
        if (input_.substr(pos_, word.size()) != word) {
            return fail("invalid literal, expected '" + std::string(word) + "'");
        }
        for (size_t i = 0; i < word.size(); ++i) {
            advance();
        }
        return value;
    }

    auto parse_number() -> std::optional<JsonValue> {
        size_t start = pos_;
        bool is_float = false;

        if (peek() == '-') {
            advance();
        }
        if (peek() == '0') {
            advance();
        } else if (peek() >= '1' && peek() <= '9') {
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        } else {
            return fail("invalid number");
        }
        if (peek() == '.') {
            is_float = true;
            advance();
            if (!(peek() >= '0' && peek() <= '9')) {
                return fail("expected digit after decimal point");
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            is_float = true;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            if (!(peek() >= '0' && peek() <= '9')) {
                return fail("expected digit in exponent");
            }
            while (peek() >= '0' && peek() <= '9') {
                advance();
            }
        }

        std::string text(input_.substr(start, pos_ - start));
        if (!is_float) {
            errno = 0;
            long long v = std::strtoll(text.c_str(), nullptr, 10);
            if (errno != ERANGE) {
                return JsonValue(static_cast<int64_t>(v));
            }
        }
        return JsonValue(std::strtod(text.c_str(), nullptr));
    }

    auto parse_hex4() -> std::optional<uint32_t> {
        uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            if (at_end()) {
                return std::nullopt;
            }
            char c = advance();
            value <<= 4;
            if (c >= '0' && c <= '9') {
                value |= static_cast<uint32_t>(c - '0');
            } else if (c >= 'a' && c <= 'f') {
                value |= static_cast<uint32_t>(c - 'a' + 10);
            } else if (c >= 'A' && c <= 'F') {
                value |= static_cast<uint32_t>(c - 'A' + 10);
            } else {
                return std::nullopt;
            }
        }
        return value;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    auto parse_string() -> std::optional<std::string> {
        advance(); // opening quote
        std::string out;

        while (true) {
            if (at_end()) {
                error_ = make_error("unterminated string");
                return std::nullopt;
            }
            char c = advance();
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                error_ = make_error("control character in string");
                return std::nullopt;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                error_ = make_error("unterminated escape");
                return std::nullopt;
            }
            char esc = advance();
            switch (esc) {
            case '"':
                out += '"';
                break;
            case '\\':
                out += '\\';
                break;
            case '/':
                out += '/';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'n':
                out += '\n';
                break;
            case 'r':
                out += '\r';
                break;
            case 't':
                out += '\t';
                break;
            case 'u': {
                auto cp = parse_hex4();
                if (!cp) {
                    error_ = make_error("invalid unicode escape");
                    return std::nullopt;
                }
                uint32_t code = *cp;
                if (code >= 0xD800 && code <= 0xDBFF) {
                    if (peek() != '\\') {
                        error_ = make_error("unpaired surrogate");
                        return std::nullopt;
                    }
                    advance();
                    if (peek() != 'u') {
                        error_ = make_error("unpaired surrogate");
                        return std::nullopt;
                    }
                    advance();
                    auto low = parse_hex4();
                    if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                        error_ = make_error("invalid low surrogate");
                        return std::nullopt;
                    }
                    code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                }
                append_utf8(out, code);
                break;
            }
            default:
                error_ = make_error(std::string("invalid escape '\\") + esc + "'");
                return std::nullopt;
            }
        }
    }

    auto parse_array(size_t depth) -> std::optional<JsonValue> {
        advance(); // [
        JsonArray items;
        skip_whitespace();
        if (peek() == ']') {
            advance();
            return JsonValue(std::move(items));
        }

        while (true) {
            skip_whitespace();
            auto item = parse_value(depth + 1);
            if (!item) {
                return std::nullopt;
            }
            items.push_back(std::move(*item));
            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == ']') {
                advance();
                return JsonValue(std::move(items));
            }
            return fail("expected ',' or ']' in array");
        }
    }

    auto parse_object(size_t depth) -> std::optional<JsonValue> {
        advance(); // {
        JsonObject members;
        skip_whitespace();
        if (peek() == '}') {
            advance();
            return JsonValue(std::move(members));
        }

        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                return fail("expected string key in object");
            }
            auto key = parse_string();
            if (!key) {
                return std::nullopt;
            }
            skip_whitespace();
            if (peek() != ':') {
                return fail("expected ':' after object key");
            }
            advance();
            skip_whitespace();
            auto value = parse_value(depth + 1);
            if (!value) {
                return std::nullopt;
            }
            members[std::move(*key)] = std::move(*value);
            skip_whitespace();
            if (peek() == ',') {
                advance();
                continue;
            }
            if (peek() == '}') {
                advance();
                return JsonValue(std::move(members));
            }
            return fail("expected ',' or '}' in object");
        }
    }
};

} // namespace

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    Parser parser(input);
    return parser.parse_document();
}

} // namespace docsguard::json
