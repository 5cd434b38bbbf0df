//! # JSON Values
//!
//! The JSON value type used by the baseline store and the machine-readable
//! report.
//!
//! ## Features
//!
//! - **Integer preservation**: integers are stored as `int64_t`, not doubles
//! - **Ordered objects**: keys serialize in sorted order, so output is stable
//! - **Value semantics**: `JsonValue` can be copied, moved and compared
//!
//! ## Example
//!
//! ```cpp
//! JsonValue entry(JsonObject{});
//! entry.set("kind", JsonValue("LinkMissing"));
//! entry.set("line", JsonValue(12));
//! std::cout << entry.to_string_pretty(2);
//! ```

#ifndef DOCSGUARD_JSON_JSON_VALUE_HPP
#define DOCSGUARD_JSON_JSON_VALUE_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace docsguard::json {

struct JsonValue;

/// A JSON array.
using JsonArray = std::vector<JsonValue>;

/// A JSON object, ordered by key.
using JsonObject = std::map<std::string, JsonValue>;

/// JSON value variant type.
///
/// Arrays and objects are boxed so the type can be recursive.
struct JsonValue {
    using Null = std::monostate;
    using ValueVariant = std::variant<Null, bool, int64_t, double, std::string,
                                      std::unique_ptr<JsonArray>, std::unique_ptr<JsonObject>>;

    ValueVariant data;

    // ========================================================================
    // Constructors
    // ========================================================================

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(static_cast<int64_t>(value)) {}
    explicit JsonValue(int64_t value) : data(value) {}
    explicit JsonValue(double value) : data(value) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(JsonArray value);
    explicit JsonValue(JsonObject value);

    JsonValue(const JsonValue& other);
    JsonValue(JsonValue&& other) noexcept = default;
    auto operator=(const JsonValue& other) -> JsonValue&;
    auto operator=(JsonValue&& other) noexcept -> JsonValue& = default;
    ~JsonValue() = default;

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        return std::holds_alternative<int64_t>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return is_integer() || std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<std::unique_ptr<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<std::unique_ptr<JsonObject>>(data);
    }

    // ========================================================================
    // Accessors
    // ========================================================================
    //
    // Accessors throw std::bad_variant_access on a type mismatch; query the
    // type first when the input is untrusted.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_i64() const -> int64_t;
    [[nodiscard]] auto as_f64() const -> double;
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<std::unique_ptr<JsonArray>>(data);
    }
    [[nodiscard]] auto as_array() -> JsonArray& {
        return *std::get<std::unique_ptr<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<std::unique_ptr<JsonObject>>(data);
    }
    [[nodiscard]] auto as_object() -> JsonObject& {
        return *std::get<std::unique_ptr<JsonObject>>(data);
    }

    /// Looks up a key; returns nullptr if this is not an object or the key
    /// is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// Sets a key. Has no effect if this is not an object.
    void set(const std::string& key, JsonValue value);

    /// Appends to an array. Has no effect if this is not an array.
    void push(JsonValue value);

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact serialization (no whitespace).
    [[nodiscard]] auto to_string() const -> std::string;

    /// Pretty serialization with `indent` spaces per level.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

} // namespace docsguard::json

#endif // DOCSGUARD_JSON_JSON_VALUE_HPP
