//! # Baseline Engine Tests
//!
//! Fingerprints, cold and warm classification, the blocking threshold and
//! the on-disk store.

#include "baseline/baseline.hpp"
#include "baseline/fingerprint.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace docsguard;
using namespace docsguard::baseline;
using model::FindingKind;
using model::Severity;

namespace {

auto finding(FindingKind kind, Severity severity, std::string entity, std::string subject = "")
    -> model::ValidationResult {
    model::ValidationResult r;
    r.kind = kind;
    r.severity = severity;
    r.location = {"src/auth.rs", 12};
    r.entity_name = std::move(entity);
    r.doc_id = "auth-login";
    r.subject = std::move(subject);
    r.message = "message";
    return r;
}

auto sample_findings() -> std::vector<model::ValidationResult> {
    return {finding(FindingKind::LinkVerified, Severity::Info, "login"),
            finding(FindingKind::MissingArgument, Severity::Warning, "login", "tenant_id"),
            finding(FindingKind::LinkMissing, Severity::Error, "logout")};
}

class BaselineStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("docsguard_baseline_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }

    void write(const std::filesystem::path& path, const std::string& content) {
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    std::filesystem::path dir_;
};

} // namespace

// ============================================================================
// Fingerprints
// ============================================================================

TEST(FingerprintTest, Crc32cCheckValue) {
    const char* data = "123456789";
    EXPECT_EQ(crc32c(data, 9), 0xE3069283u);
    EXPECT_EQ(crc32c(data, 0), 0u);
}

TEST(FingerprintTest, HexDigest) {
    auto fp = fingerprint(finding(FindingKind::LinkMissing, Severity::Error, "login"));
    ASSERT_EQ(fp.size(), 16u);
    EXPECT_EQ(fp.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(FingerprintTest, IgnoresLineAndMessage) {
    auto a = finding(FindingKind::LinkMissing, Severity::Error, "login");
    auto b = a;
    b.location.line = 99;
    b.message = "reworded";
    b.hint = "another hint";
    EXPECT_EQ(fingerprint(a), fingerprint(b));
}

TEST(FingerprintTest, PortablePaths) {
    auto a = finding(FindingKind::LinkMissing, Severity::Error, "login");
    auto b = a;
    b.location.file = "src\\auth.rs";
    EXPECT_EQ(fingerprint(a), fingerprint(b));
}

TEST(FingerprintTest, DistinguishesIdentity) {
    auto a = finding(FindingKind::MissingArgument, Severity::Warning, "login", "user");
    auto b = finding(FindingKind::MissingArgument, Severity::Warning, "login", "tenant_id");
    auto c = finding(FindingKind::GhostArgument, Severity::Warning, "login", "user");
    EXPECT_NE(fingerprint(a), fingerprint(b));
    EXPECT_NE(fingerprint(a), fingerprint(c));
    EXPECT_EQ(fingerprint_payload(a), "MissingArgument|src/auth.rs|login|auth-login|user||");
}

// ============================================================================
// Classification
// ============================================================================

TEST(BaselineEngineTest, ColdPassesThrough) {
    auto outcome = apply_baseline(sample_findings(), std::nullopt);
    EXPECT_FALSE(outcome.warm);
    ASSERT_EQ(outcome.findings.size(), 3u);
    for (const auto& f : outcome.findings) {
        EXPECT_EQ(f.status, FindingStatus::Cold);
    }
    EXPECT_FALSE(outcome.findings[1].blocking);
    EXPECT_TRUE(outcome.findings[2].blocking);
    EXPECT_TRUE(outcome.has_blocking);
    EXPECT_EQ(outcome.counts.errors, 1u);
    EXPECT_EQ(outcome.counts.warnings, 1u);
    EXPECT_EQ(outcome.counts.infos, 1u);
    EXPECT_EQ(outcome.counts.blocking, 1u);
}

TEST(BaselineEngineTest, FailOnWarning) {
    auto outcome = apply_baseline(sample_findings(), std::nullopt, Severity::Warning);
    EXPECT_FALSE(outcome.findings[0].blocking);
    EXPECT_TRUE(outcome.findings[1].blocking);
    EXPECT_EQ(outcome.counts.blocking, 2u);
}

TEST(BaselineEngineTest, DumpThenRevalidateHasNothingNew) {
    auto snapshot = make_snapshot(sample_findings(), "unix:0");
    EXPECT_EQ(snapshot.size(), 3u);

    auto outcome = apply_baseline(sample_findings(), snapshot);
    EXPECT_TRUE(outcome.warm);
    EXPECT_FALSE(outcome.has_blocking);
    EXPECT_EQ(outcome.counts.fresh, 0u);
    EXPECT_EQ(outcome.counts.known, 3u);
    for (const auto& f : outcome.findings) {
        EXPECT_EQ(f.status, FindingStatus::Known);
        EXPECT_FALSE(f.blocking);
    }
    // Known findings keep their severity and are still reported
    EXPECT_EQ(outcome.findings[2].result.severity, Severity::Error);
}

TEST(BaselineEngineTest, NewFindingBlocksAlongsideKnown) {
    auto snapshot = make_snapshot(sample_findings(), "unix:0");
    auto results = sample_findings();
    results.push_back(finding(FindingKind::LinkMissing, Severity::Error, "refresh"));

    auto outcome = apply_baseline(results, snapshot);
    ASSERT_EQ(outcome.findings.size(), 4u);
    EXPECT_EQ(outcome.findings[3].status, FindingStatus::New);
    EXPECT_TRUE(outcome.findings[3].blocking);
    EXPECT_FALSE(outcome.findings[2].blocking);
    EXPECT_EQ(outcome.counts.fresh, 1u);
    EXPECT_EQ(outcome.counts.blocking, 1u);
    EXPECT_TRUE(outcome.has_blocking);
}

TEST(BaselineEngineTest, SnapshotDeduplicates) {
    auto results = sample_findings();
    results.push_back(results[2]);
    EXPECT_EQ(make_snapshot(results, "unix:0").size(), 3u);
}

TEST(BaselineEngineTest, Timestamp) {
    auto stamp = unix_timestamp_now();
    ASSERT_TRUE(stamp.starts_with("unix:"));
    EXPECT_GT(stamp.size(), 5u);
}

// ============================================================================
// Store
// ============================================================================

TEST_F(BaselineStoreTest, MissingFileIsCold) {
    auto result = load_baseline(dir_ / "absent.json");
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).has_value());
}

TEST_F(BaselineStoreTest, UnstatableFileIsCorruption) {
    auto path = dir_ / "baseline.json";
    std::error_code ec;
    std::filesystem::create_symlink("baseline.json", path, ec);
    ASSERT_FALSE(ec) << ec.message();

    auto result = load_baseline(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, model::FileErrorKind::BaselineCorruption);
    EXPECT_NE(unwrap_err(result).message.find("cannot stat"), std::string::npos);
}

TEST_F(BaselineStoreTest, SaveThenLoad) {
    auto path = dir_ / ".docsguard" / "baseline.json";
    auto snapshot = make_snapshot(sample_findings(), "unix:1767225600");

    auto saved = save_baseline(path, snapshot);
    ASSERT_TRUE(is_ok(saved));
    EXPECT_EQ(unwrap(saved), 3u);

    auto loaded = load_baseline(path);
    ASSERT_TRUE(is_ok(loaded));
    ASSERT_TRUE(unwrap(loaded).has_value());
    const auto& back = *unwrap(loaded);
    EXPECT_EQ(back.generated_at(), "unix:1767225600");
    ASSERT_EQ(back.size(), 3u);
    EXPECT_EQ(back.entries()[2].kind, "LinkMissing");
    EXPECT_EQ(back.entries()[2].entity, "logout");
    EXPECT_EQ(back.entries()[2].doc_id, "auth-login");

    auto outcome = apply_baseline(sample_findings(), back);
    EXPECT_EQ(outcome.counts.fresh, 0u);
}

TEST_F(BaselineStoreTest, MalformedJsonIsCorruption) {
    auto path = dir_ / "baseline.json";
    write(path, "{\"version\": 1, \"entries\": [");
    auto result = load_baseline(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).kind, model::FileErrorKind::BaselineCorruption);
    EXPECT_NE(unwrap_err(result).message.find("malformed JSON"), std::string::npos);
}

TEST_F(BaselineStoreTest, WrongVersionIsCorruption) {
    auto path = dir_ / "baseline.json";
    write(path, R"({"version": 2, "generated_at": "unix:0", "entries": []})");
    auto result = load_baseline(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("version 2"), std::string::npos);
}

TEST_F(BaselineStoreTest, MalformedEntryIsCorruption) {
    auto path = dir_ / "baseline.json";
    write(path, R"({"version": 1, "generated_at": "unix:0", "entries": [{"kind": "LinkMissing"}]})");
    auto result = load_baseline(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("entry #0"), std::string::npos);
}

TEST(BaselineCodecTest, JsonShape) {
    auto snapshot = make_snapshot({finding(FindingKind::LinkMissing, Severity::Error, "login")},
                                  "unix:5");
    auto json = snapshot_to_json(snapshot);
    ASSERT_TRUE(json.is_object());
    ASSERT_NE(json.get("version"), nullptr);
    EXPECT_EQ(json.get("version")->as_i64(), 1);
    EXPECT_EQ(json.get("generated_at")->as_string(), "unix:5");
    const auto& entries = json.get("entries")->as_array();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].get("entity")->as_string(), "login");
    EXPECT_EQ(entries[0].get("fingerprint")->as_string().size(), 16u);
}
