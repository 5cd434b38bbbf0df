//! # Link Validator Tests

#include "validate/link_validator.hpp"

#include <gtest/gtest.h>

using namespace docsguard;
using namespace docsguard::validate;
using model::FindingKind;
using model::Severity;

namespace {

auto param(std::string name, std::optional<std::string> type = std::nullopt) -> model::Parameter {
    return model::Parameter{std::move(name), std::move(type)};
}

auto arg(std::string name, std::optional<std::string> type = std::nullopt) -> model::Arg {
    return model::Arg{std::move(name), std::move(type), ""};
}

auto entity(std::string name, std::optional<std::string> doc_id,
            std::vector<model::Parameter> params, size_t line = 10) -> model::CodeEntity {
    model::CodeEntity e;
    e.name = std::move(name);
    e.file = "src/auth.ts";
    e.line = line;
    e.params = std::move(params);
    e.doc_id = std::move(doc_id);
    return e;
}

auto section(std::string id, std::vector<model::Arg> args, size_t line = 1) -> model::DocSection {
    model::DocSection s;
    s.id = std::move(id);
    s.title = "Title";
    s.file = "docs/api.md";
    s.line = line;
    s.args = std::move(args);
    return s;
}

auto index_of(std::vector<model::DocSection> sections) -> SectionIndex {
    auto result = SectionIndex::build(std::move(sections));
    EXPECT_TRUE(is_ok(result));
    if (is_err(result)) {
        return {};
    }
    return std::move(unwrap(result));
}

auto kinds(const std::vector<model::ValidationResult>& results) -> std::vector<FindingKind> {
    std::vector<FindingKind> out;
    for (const auto& r : results) {
        out.push_back(r.kind);
    }
    return out;
}

} // namespace

// ============================================================================
// Section Index
// ============================================================================

TEST(SectionIndexTest, FindsById) {
    auto index = index_of({section("a", {}), section("b", {}, 5)});
    EXPECT_EQ(index.size(), 2u);
    ASSERT_NE(index.find("b"), nullptr);
    EXPECT_EQ(index.find("b")->line, 5u);
    EXPECT_EQ(index.find("c"), nullptr);
}

TEST(SectionIndexTest, DuplicateIdRejected) {
    auto second = section("a", {}, 9);
    second.file = "docs/other.md";
    auto result = SectionIndex::build({section("a", {}), second});
    ASSERT_TRUE(is_err(result));
    const auto& err = unwrap_err(result);
    EXPECT_EQ(err.kind, model::FileErrorKind::DuplicateDocId);
    EXPECT_EQ(err.file, "docs/other.md");
    EXPECT_EQ(err.line, 9u);
    ASSERT_EQ(err.ids.size(), 1u);
    EXPECT_EQ(err.ids[0], "a");
}

// ============================================================================
// Links
// ============================================================================

TEST(LinkValidatorTest, FullyDocumentedLoginVerifiesOnly) {
    auto index = index_of({section("auth-login", {arg("username", "string"), arg("password")})});
    auto results = validate_links(
        {entity("login", "auth-login", {param("username", "string"), param("password", "string")})},
        index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].kind, FindingKind::LinkVerified);
    EXPECT_EQ(results[0].severity, Severity::Info);
    EXPECT_FALSE(has_errors(results));
}

TEST(LinkValidatorTest, UnlinkedEntitiesProduceNothing) {
    auto index = index_of({section("a", {})});
    auto results = validate_links({entity("helper", std::nullopt, {param("x")})}, index);
    EXPECT_TRUE(results.empty());
}

TEST(LinkValidatorTest, MissingLinkIsError) {
    auto index = index_of({section("auth-logout", {})});
    auto results = validate_links({entity("login", "auth-login", {})}, index);
    ASSERT_EQ(results.size(), 1u);
    const auto& r = results[0];
    EXPECT_EQ(r.kind, FindingKind::LinkMissing);
    EXPECT_EQ(r.severity, Severity::Error);
    EXPECT_EQ(r.location.file, "src/auth.ts");
    EXPECT_EQ(r.location.line, 10u);
    EXPECT_EQ(r.doc_id, "auth-login");
    EXPECT_NE(r.message.find("'auth-login'"), std::string::npos);
    EXPECT_NE(r.hint.find("<!-- @docs-id: auth-login -->"), std::string::npos);
    EXPECT_FALSE(r.suggested_id.has_value());
    EXPECT_TRUE(has_errors(results));
}

TEST(LinkValidatorTest, MissingLinkSuggestsCloseId) {
    auto index = index_of({section("user-create", {}), section("billing", {})});
    auto results = validate_links({entity("createUser", "user-creat", {})}, index);
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].suggested_id, "user-create");
}

TEST(LinkValidatorTest, UndocumentedParameter) {
    auto index = index_of({section("user-create", {arg("email")})});
    auto results = validate_links(
        {entity("create_user", "user-create", {param("email"), param("tenant_id")})}, index);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].kind, FindingKind::MissingArgument);
    EXPECT_EQ(results[1].severity, Severity::Warning);
    EXPECT_EQ(results[1].subject, "tenant_id");
    EXPECT_NE(results[1].message.find("'tenant_id'"), std::string::npos);
    EXPECT_FALSE(has_errors(results));
}

TEST(LinkValidatorTest, GhostArgument) {
    auto index = index_of({section("s", {arg("id"), arg("legacy_flag")})});
    auto results = validate_links({entity("get", "s", {param("id")})}, index);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].kind, FindingKind::GhostArgument);
    EXPECT_EQ(results[1].subject, "legacy_flag");
    EXPECT_NE(results[1].message.find("get"), std::string::npos);
}

TEST(LinkValidatorTest, StringVersusIntegerIsTypeMismatch) {
    auto index = index_of({section("s", {arg("count", "Integer")})});
    auto results = validate_links({entity("f", "s", {param("count", "string")})}, index);
    ASSERT_EQ(results.size(), 2u);
    const auto& r = results[1];
    EXPECT_EQ(r.kind, FindingKind::TypeMismatch);
    EXPECT_EQ(r.severity, Severity::Warning);
    EXPECT_EQ(r.code_type, "string");
    EXPECT_EQ(r.doc_type, "number");
    EXPECT_NE(r.message.find("`string`"), std::string::npos);
    EXPECT_NE(r.message.find("`Integer`"), std::string::npos);
}

TEST(LinkValidatorTest, EquivalentTypesMatch) {
    auto index = index_of({section("s", {arg("name", "String"), arg("n", "number")})});
    auto results =
        validate_links({entity("f", "s", {param("name", "&str"), param("n", "i32")})}, index);
    EXPECT_EQ(kinds(results), std::vector<FindingKind>{FindingKind::LinkVerified});
}

TEST(LinkValidatorTest, UnknownOrMissingTypesNeverMismatch) {
    auto index = index_of({section("s", {arg("a", "Widget"), arg("b"), arg("c", "number")})});
    auto results = validate_links(
        {entity("f", "s", {param("a", "string"), param("b", "string"), param("c")})}, index);
    EXPECT_EQ(kinds(results), std::vector<FindingKind>{FindingKind::LinkVerified});
}

TEST(LinkValidatorTest, AliasTableApplies) {
    auto index = index_of({section("s", {arg("price", "Money")})});
    ValidatorOptions options;
    options.aliases["money"] = types::CanonicalType::Number;
    auto results = validate_links({entity("f", "s", {param("price", "string")})}, index, options);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].kind, FindingKind::TypeMismatch);
    EXPECT_EQ(results[1].doc_type, "number");
}

TEST(LinkValidatorTest, FindingOrder) {
    auto index = index_of({section("s", {arg("b", "number"), arg("ghost"), arg("a", "bool")})});
    auto results = validate_links(
        {entity("first", "missing", {}, 1),
         entity("second", "s", {param("a", "string"), param("b", "string"), param("c")}, 2)},
        index);
    EXPECT_EQ(kinds(results),
              (std::vector<FindingKind>{FindingKind::LinkMissing, FindingKind::LinkVerified,
                                        FindingKind::GhostArgument, FindingKind::MissingArgument,
                                        FindingKind::TypeMismatch, FindingKind::TypeMismatch}));
    EXPECT_EQ(results[2].subject, "ghost");
    EXPECT_EQ(results[3].subject, "c");
    EXPECT_EQ(results[4].subject, "a");
    EXPECT_EQ(results[5].subject, "b");
}

TEST(LinkValidatorTest, RepeatedRunsAreIdentical) {
    auto index = index_of({section("s", {arg("x", "number")})});
    std::vector<model::CodeEntity> entities = {entity("f", "s", {param("x", "string")}),
                                               entity("g", "nope", {})};
    auto a = validate_links(entities, index);
    auto b = validate_links(entities, index);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].kind, b[i].kind);
        EXPECT_EQ(a[i].message, b[i].message);
        EXPECT_EQ(a[i].hint, b[i].hint);
    }
}

TEST(LinkValidatorTest, SharedSectionServesSeveralEntities) {
    auto index = index_of({section("s", {arg("x")})});
    auto results =
        validate_links({entity("f", "s", {param("x")}), entity("g", "s", {param("x")})}, index);
    EXPECT_EQ(kinds(results),
              (std::vector<FindingKind>{FindingKind::LinkVerified, FindingKind::LinkVerified}));
}

// ============================================================================
// Orphans
// ============================================================================

TEST(LinkValidatorTest, OrphansAreOptIn) {
    auto index = index_of({section("used", {}), section("orphan", {}, 7)});
    std::vector<model::CodeEntity> entities = {entity("f", "used", {})};

    EXPECT_EQ(validate_links(entities, index).size(), 1u);

    ValidatorOptions options;
    options.report_orphans = true;
    auto results = validate_links(entities, index, options);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[1].kind, FindingKind::OrphanSection);
    EXPECT_EQ(results[1].severity, Severity::Warning);
    EXPECT_EQ(results[1].doc_id, "orphan");
    EXPECT_EQ(results[1].location.file, "docs/api.md");
    EXPECT_EQ(results[1].location.line, 7u);
}
