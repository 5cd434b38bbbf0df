//! # JSON Serializer
//!
//! Converts `JsonValue` to text in compact or pretty-printed form.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Control (0x00-0x1F) | `\uXXXX` |

#include "json/json.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace docsguard::json {

auto escape_json_string(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

namespace {

auto format_double(double value) -> std::string {
    if (std::isnan(value) || std::isinf(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << value;
    std::string result = oss.str();
    if (result.find_first_of(".eE") == std::string::npos) {
        result += ".0";
    }
    return result;
}

/// Writes scalars; returns false for arrays and objects.
auto serialize_scalar(const JsonValue& value, std::string& out) -> bool {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_integer()) {
        out += std::to_string(value.as_i64());
    } else if (value.is_number()) {
        out += format_double(value.as_f64());
    } else if (value.is_string()) {
        out += '"';
        out += escape_json_string(value.as_string());
        out += '"';
    } else {
        return false;
    }
    return true;
}

void serialize_compact(const JsonValue& value, std::string& out) {
    if (serialize_scalar(value, out)) {
        return;
    }

    if (value.is_array()) {
        out += '[';
        const auto& arr = value.as_array();
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out += ',';
            }
            serialize_compact(arr[i], out);
        }
        out += ']';
        return;
    }

    out += '{';
    bool first = true;
    for (const auto& [key, item] : value.as_object()) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += '"';
        out += escape_json_string(key);
        out += "\":";
        serialize_compact(item, out);
    }
    out += '}';
}

void serialize_pretty(const JsonValue& value, std::string& out, int indent, int depth) {
    if (serialize_scalar(value, out)) {
        return;
    }

    std::string inner(static_cast<size_t>(indent * (depth + 1)), ' ');
    std::string outer(static_cast<size_t>(indent * depth), ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += "[\n";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += inner;
            serialize_pretty(arr[i], out, indent, depth + 1);
            if (i + 1 < arr.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += outer;
        out += ']';
        return;
    }

    const auto& obj = value.as_object();
    if (obj.empty()) {
        out += "{}";
        return;
    }
    out += "{\n";
    size_t remaining = obj.size();
    for (const auto& [key, item] : obj) {
        out += inner;
        out += '"';
        out += escape_json_string(key);
        out += "\": ";
        serialize_pretty(item, out, indent, depth + 1);
        if (--remaining > 0) {
            out += ',';
        }
        out += '\n';
    }
    out += outer;
    out += '}';
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize_pretty(*this, out, indent, 0);
    return out;
}

} // namespace docsguard::json
