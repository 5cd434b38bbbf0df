//! # JSON Value Implementation
//!
//! Deep copy, numeric accessors, object/array mutation and equality for
//! `JsonValue`.

#include "json/json_value.hpp"

namespace docsguard::json {

JsonValue::JsonValue(JsonArray value) : data(std::make_unique<JsonArray>(std::move(value))) {}

JsonValue::JsonValue(JsonObject value) : data(std::make_unique<JsonObject>(std::move(value))) {}

JsonValue::JsonValue(const JsonValue& other) {
    if (other.is_array()) {
        data = std::make_unique<JsonArray>(other.as_array());
    } else if (other.is_object()) {
        data = std::make_unique<JsonObject>(other.as_object());
    } else if (other.is_bool()) {
        data = std::get<bool>(other.data);
    } else if (other.is_integer()) {
        data = std::get<int64_t>(other.data);
    } else if (std::holds_alternative<double>(other.data)) {
        data = std::get<double>(other.data);
    } else if (other.is_string()) {
        data = std::get<std::string>(other.data);
    } else {
        data = Null{};
    }
}

auto JsonValue::operator=(const JsonValue& other) -> JsonValue& {
    if (this != &other) {
        JsonValue copy(other);
        data = std::move(copy.data);
    }
    return *this;
}

auto JsonValue::as_i64() const -> int64_t {
    if (const auto* d = std::get_if<double>(&data)) {
        return static_cast<int64_t>(*d);
    }
    return std::get<int64_t>(data);
}

auto JsonValue::as_f64() const -> double {
    if (const auto* i = std::get_if<int64_t>(&data)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data);
}

auto JsonValue::get(const std::string& key) const -> const JsonValue* {
    if (!is_object()) {
        return nullptr;
    }
    const auto& obj = as_object();
    auto it = obj.find(key);
    return it == obj.end() ? nullptr : &it->second;
}

void JsonValue::set(const std::string& key, JsonValue value) {
    if (!is_object()) {
        return;
    }
    as_object()[key] = std::move(value);
}

void JsonValue::push(JsonValue value) {
    if (!is_array()) {
        return;
    }
    as_array().push_back(std::move(value));
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (is_null() || other.is_null()) {
        return is_null() && other.is_null();
    }
    if (is_bool() || other.is_bool()) {
        return is_bool() && other.is_bool() && as_bool() == other.as_bool();
    }
    if (is_integer() && other.is_integer()) {
        return as_i64() == other.as_i64();
    }
    if (is_number() || other.is_number()) {
        return is_number() && other.is_number() && as_f64() == other.as_f64();
    }
    if (is_string() || other.is_string()) {
        return is_string() && other.is_string() && as_string() == other.as_string();
    }
    if (is_array() && other.is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object() && other.is_object()) {
        return as_object() == other.as_object();
    }
    return false;
}

} // namespace docsguard::json
