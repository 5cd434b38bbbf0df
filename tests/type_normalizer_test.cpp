//! # Type Normalizer Tests
//!
//! Built-in aliases, decoration stripping, alias tables and idempotence.

#include "types/type_normalizer.hpp"

#include <gtest/gtest.h>

using namespace docsguard::types;

// ============================================================================
// Built-in Table
// ============================================================================

TEST(TypeNormalizerTest, StringLikeTokens) {
    EXPECT_EQ(normalize("&str"), CanonicalType::String);
    EXPECT_EQ(normalize("String"), CanonicalType::String);
    EXPECT_EQ(normalize("string"), CanonicalType::String);
    EXPECT_EQ(normalize("Text"), CanonicalType::String);
    EXPECT_EQ(normalize("PathBuf"), CanonicalType::String);
    EXPECT_EQ(normalize("Cow<'_, str>"), CanonicalType::String);
}

TEST(TypeNormalizerTest, NumberLikeTokens) {
    EXPECT_EQ(normalize("i32"), CanonicalType::Number);
    EXPECT_EQ(normalize("number"), CanonicalType::Number);
    EXPECT_EQ(normalize("Integer"), CanonicalType::Number);
    EXPECT_EQ(normalize("u64"), CanonicalType::Number);
    EXPECT_EQ(normalize("f64"), CanonicalType::Number);
    EXPECT_EQ(normalize("usize"), CanonicalType::Number);
    EXPECT_EQ(normalize("float"), CanonicalType::Number);
}

TEST(TypeNormalizerTest, BooleanAndObjectTokens) {
    EXPECT_EQ(normalize("bool"), CanonicalType::Boolean);
    EXPECT_EQ(normalize("Boolean"), CanonicalType::Boolean);
    EXPECT_EQ(normalize("HashMap"), CanonicalType::Object);
    EXPECT_EQ(normalize("Record"), CanonicalType::Object);
    EXPECT_EQ(normalize("object"), CanonicalType::Object);
}

TEST(TypeNormalizerTest, UnrecognizedTokensAreUnknown) {
    EXPECT_EQ(normalize("Vec<String>"), CanonicalType::Unknown);
    EXPECT_EQ(normalize("UserProfile"), CanonicalType::Unknown);
    EXPECT_EQ(normalize(""), CanonicalType::Unknown);
    EXPECT_EQ(normalize("   "), CanonicalType::Unknown);
}

// ============================================================================
// Cleaning
// ============================================================================

TEST(TypeNormalizerTest, StripsReferencesAndLifetimes) {
    EXPECT_EQ(clean_type_token("&'a mut str"), "str");
    EXPECT_EQ(clean_type_token("&mut String"), "string");
    EXPECT_EQ(clean_type_token("*const u8"), "u8");
    EXPECT_EQ(clean_type_token("  `String`  "), "string");
    EXPECT_EQ(normalize("&'static str"), CanonicalType::String);
}

TEST(TypeNormalizerTest, StripsOptionalMarkers) {
    EXPECT_EQ(clean_type_token("string?"), "string");
    EXPECT_EQ(clean_type_token("Option<&str>"), "str");
    EXPECT_EQ(normalize("Option<u32>"), CanonicalType::Number);
}

TEST(TypeNormalizerTest, KeywordPrefixNeedsBoundary) {
    EXPECT_EQ(clean_type_token("constant"), "constant");
    EXPECT_EQ(clean_type_token("mutex"), "mutex");
}

// ============================================================================
// Aliases
// ============================================================================

TEST(TypeNormalizerTest, AliasTableExtendsBuiltins) {
    AliasTable aliases{{"money", CanonicalType::Number}};
    EXPECT_EQ(normalize("Money", aliases), CanonicalType::Number);
    EXPECT_EQ(normalize("Money"), CanonicalType::Unknown);
}

TEST(TypeNormalizerTest, AliasTableOverridesBuiltins) {
    AliasTable aliases{{"uuid", CanonicalType::Object}};
    EXPECT_EQ(normalize("uuid"), CanonicalType::String);
    EXPECT_EQ(normalize("UUID", aliases), CanonicalType::Object);
}

TEST(TypeNormalizerTest, CanonicalNamesCannotBeAliased) {
    AliasTable aliases{{"string", CanonicalType::Number}};
    EXPECT_EQ(normalize("string", aliases), CanonicalType::String);
}

// ============================================================================
// Properties
// ============================================================================

TEST(TypeNormalizerTest, AliasesCollapse) {
    EXPECT_EQ(normalize("&str"), normalize("String"));
    EXPECT_STREQ(canonical_name(normalize("&str")), "string");
    EXPECT_EQ(normalize("i32"), normalize("number"));
    EXPECT_STREQ(canonical_name(normalize("i32")), "number");
}

TEST(TypeNormalizerTest, NormalizeIsIdempotent) {
    AliasTable aliases{{"money", CanonicalType::Number}};
    for (const char* token : {"&str", "String", "i32", "number", "BOOL", "HashMap", "money",
                              "Vec<u8>", "unknown", "Option<String>", ""}) {
        auto once = normalize(token, aliases);
        auto twice = normalize(canonical_name(once), aliases);
        EXPECT_EQ(once, twice) << "token: " << token;
    }
}

TEST(TypeNormalizerTest, ParseCanonicalType) {
    EXPECT_EQ(parse_canonical_type("string"), CanonicalType::String);
    EXPECT_EQ(parse_canonical_type("NUMBER"), CanonicalType::Number);
    EXPECT_EQ(parse_canonical_type("unknown"), CanonicalType::Unknown);
    EXPECT_FALSE(parse_canonical_type("integer").has_value());
}
