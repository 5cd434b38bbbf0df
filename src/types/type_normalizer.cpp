//! # Type Normalizer Implementation

#include "types/type_normalizer.hpp"

#include <cctype>

namespace docsguard::types {

namespace {

auto is_ident_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

/// Strips a leading keyword only when followed by a non-identifier char.
auto strip_keyword(std::string_view& s, std::string_view keyword) -> bool {
    if (!s.starts_with(keyword)) {
        return false;
    }
    if (s.size() > keyword.size() && is_ident_char(s[keyword.size()])) {
        return false;
    }
    s.remove_prefix(keyword.size());
    s = trim(s);
    return true;
}

/// Strips leading reference, pointer, mutability and lifetime decoration.
auto strip_decoration(std::string_view s) -> std::string_view {
    bool changed = true;
    while (changed && !s.empty()) {
        changed = false;
        if (s.front() == '&' || s.front() == '*') {
            s.remove_prefix(1);
            s = trim(s);
            changed = true;
        } else if (s.front() == '\'' && s.size() > 1 &&
                   (is_ident_char(s[1]))) {
            size_t i = 1;
            while (i < s.size() && is_ident_char(s[i])) {
                ++i;
            }
            s.remove_prefix(i);
            s = trim(s);
            changed = true;
        } else if (strip_keyword(s, "mut") || strip_keyword(s, "const") ||
                   strip_keyword(s, "dyn") || strip_keyword(s, "impl")) {
            changed = true;
        }
    }
    while (!s.empty() && (s.back() == '*' || s.back() == '&' || s.back() == '?')) {
        s.remove_suffix(1);
        s = trim(s);
    }
    return s;
}

auto builtin_table() -> const std::unordered_map<std::string, CanonicalType>& {
    static const std::unordered_map<std::string, CanonicalType> table = [] {
        std::unordered_map<std::string, CanonicalType> t;
        for (const char* name : {"string", "str", "text", "char", "uuid", "path", "pathbuf",
                                 "osstring", "osstr", "cow<str>", "cow<'_,str>",
                                 "cow<'static,str>"}) {
            t.emplace(name, CanonicalType::String);
        }
        for (const char* name :
             {"number", "integer", "int", "long", "short", "float", "double", "decimal",
              "bigint", "i8", "i16", "i32", "i64", "i128", "u8", "u16", "u32", "u64", "u128",
              "isize", "usize", "f32", "f64"}) {
            t.emplace(name, CanonicalType::Number);
        }
        for (const char* name : {"bool", "boolean"}) {
            t.emplace(name, CanonicalType::Boolean);
        }
        for (const char* name : {"object", "map", "dict", "record", "hashmap", "btreemap", "json",
                                 "value", "struct"}) {
            t.emplace(name, CanonicalType::Object);
        }
        t.emplace("unknown", CanonicalType::Unknown);
        return t;
    }();
    return table;
}

} // namespace

auto canonical_name(CanonicalType type) -> const char* {
    switch (type) {
    case CanonicalType::String:
        return "string";
    case CanonicalType::Number:
        return "number";
    case CanonicalType::Boolean:
        return "boolean";
    case CanonicalType::Object:
        return "object";
    case CanonicalType::Unknown:
        return "unknown";
    }
    return "unknown";
}

auto parse_canonical_type(std::string_view name) -> std::optional<CanonicalType> {
    std::string lower;
    for (char c : trim(name)) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    for (auto type : {CanonicalType::String, CanonicalType::Number, CanonicalType::Boolean,
                      CanonicalType::Object, CanonicalType::Unknown}) {
        if (lower == canonical_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

auto clean_type_token(std::string_view raw) -> std::string {
    std::string lower;
    lower.reserve(raw.size());
    for (char c : raw) {
        if (c == '`') {
            continue;
        }
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    std::string_view s = strip_decoration(trim(lower));

    // option<T> → T
    if (s.starts_with("option<") && s.ends_with(">")) {
        s = strip_decoration(trim(s.substr(7, s.size() - 8)));
    }

    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            out += c;
        }
    }
    return out;
}

auto normalize(std::string_view raw, const AliasTable& aliases) -> CanonicalType {
    std::string token = clean_type_token(raw);
    if (token.empty()) {
        return CanonicalType::Unknown;
    }

    if (auto canonical = parse_canonical_type(token)) {
        return *canonical;
    }

    if (auto it = aliases.find(token); it != aliases.end()) {
        return it->second;
    }

    const auto& builtin = builtin_table();
    if (auto it = builtin.find(token); it != builtin.end()) {
        return it->second;
    }

    return CanonicalType::Unknown;
}

} // namespace docsguard::types
