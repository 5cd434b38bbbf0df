//! # Pipeline Tests
//!
//! End-to-end passes over a temporary project tree.

#include "pipeline/pipeline.hpp"
#include "pipeline/run_gate.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace docsguard;
using namespace docsguard::pipeline;
using model::FindingKind;

namespace fs = std::filesystem;

namespace {

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("docsguard_pipeline_" +
                 std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_);
        options_.project_root = root_;
    }

    void TearDown() override {
        fs::remove_all(root_);
    }

    void write(const std::string& rel, const std::string& content) {
        auto path = root_ / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
    }

    auto check(const std::vector<std::string>& rels) -> std::pair<ScanResult, std::vector<model::ValidationResult>> {
        std::vector<std::string> paths;
        for (const auto& rel : rels) {
            paths.push_back((root_ / rel).string());
        }
        auto scan = scan_inputs(collect_inputs(paths), options_);
        auto findings = run_validation(scan, options_);
        EXPECT_TRUE(is_ok(findings));
        if (is_err(findings)) {
            return {std::move(scan), {}};
        }
        return {std::move(scan), std::move(unwrap(findings))};
    }

    fs::path root_;
    PipelineOptions options_;
};

const char* AUTH_TS = "// @docs: [auth-login]\n"
                      "export function login(username: string, password: string) {}\n"
                      "\n"
                      "// @docs: [auth-logout]\n"
                      "export function logout(token: string) {}\n";

const char* API_MD = "# Auth\n"
                     "\n"
                     "<!-- @docs-id: auth-login -->\n"
                     "## Login\n"
                     "\n"
                     "| Param | Type | Description |\n"
                     "|-------|------|-------------|\n"
                     "| username | string | Account |\n"
                     "| password | string | Secret |\n";

} // namespace

// ============================================================================
// Inputs
// ============================================================================

TEST(PipelineInputTest, Classification) {
    EXPECT_TRUE(is_documentation_path("docs/API.MD"));
    EXPECT_TRUE(is_documentation_path("guide.markdown"));
    EXPECT_FALSE(is_documentation_path("src/lib.rs"));
    EXPECT_TRUE(is_skipped_directory("node_modules"));
    EXPECT_TRUE(is_skipped_directory(".git"));
    EXPECT_TRUE(is_skipped_directory("target"));
    EXPECT_FALSE(is_skipped_directory("src"));
}

TEST_F(PipelineTest, WalkSkipsVendoredAndHiddenDirectories) {
    write("src/b.ts", "");
    write("src/a.rs", "");
    write("docs/api.md", "");
    write("notes.txt", "");
    write("node_modules/pkg/index.js", "");
    write(".cache/x.md", "");
    write("target/debug/gen.rs", "");

    auto inputs = collect_inputs({root_.string()});
    EXPECT_TRUE(inputs.errors.empty());
    ASSERT_EQ(inputs.sources.size(), 2u);
    EXPECT_EQ(inputs.sources[0].filename(), "a.rs");
    EXPECT_EQ(inputs.sources[1].filename(), "b.ts");
    ASSERT_EQ(inputs.documents.size(), 1u);
    EXPECT_EQ(inputs.all_files().size(), 3u);
}

TEST_F(PipelineTest, ExplicitPathErrors) {
    write("notes.txt", "x");
    auto inputs = collect_inputs({(root_ / "notes.txt").string(), (root_ / "absent.rs").string()});
    ASSERT_EQ(inputs.errors.size(), 2u);
    EXPECT_EQ(inputs.errors[0].kind, model::FileErrorKind::ParseFailure);
    EXPECT_NE(inputs.errors[0].message.find("unsupported"), std::string::npos);
    EXPECT_NE(inputs.errors[1].message.find("no such file"), std::string::npos);
}

TEST_F(PipelineTest, DuplicatePathsAreCollectedOnce) {
    write("src/a.rs", "");
    auto inputs = collect_inputs({(root_ / "src/a.rs").string(), (root_ / "src").string()});
    EXPECT_EQ(inputs.sources.size(), 1u);
}

TEST_F(PipelineTest, OversizedFileIsParseFailure) {
    write("big.md", std::string(MAX_FILE_BYTES + 1, 'x'));
    auto result = read_input_file(root_ / "big.md", "big.md");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).message.find("limit"), std::string::npos);
}

TEST_F(PipelineTest, DisplayPathsAreProjectRelative) {
    EXPECT_EQ(display_path(root_ / "src" / "a.rs", root_), "src/a.rs");
}

// ============================================================================
// Passes
// ============================================================================

TEST_F(PipelineTest, EndToEnd) {
    write("src/auth.ts", AUTH_TS);
    write("docs/api.md", API_MD);

    auto [scan, findings] = check({"src", "docs"});
    EXPECT_TRUE(scan.errors.empty());
    EXPECT_EQ(scan.source_files, 1u);
    EXPECT_EQ(scan.document_files, 1u);
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].kind, FindingKind::LinkVerified);
    EXPECT_EQ(findings[0].entity_name, "login");
    EXPECT_EQ(findings[1].kind, FindingKind::LinkMissing);
    EXPECT_EQ(findings[1].location.file, "src/auth.ts");
    EXPECT_EQ(findings[1].location.line, 5u);
}

TEST_F(PipelineTest, ParseFailureDoesNotStopOtherFiles) {
    write("src/auth.ts", AUTH_TS);
    write("src/broken.rs", "fn broken(a: u8 {\n");
    write("docs/api.md", API_MD);

    auto [scan, findings] = check({"src", "docs"});
    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, model::FileErrorKind::ParseFailure);
    EXPECT_EQ(scan.errors[0].file, "src/broken.rs");
    EXPECT_EQ(findings.size(), 2u);
}

TEST_F(PipelineTest, DuplicateIdsInOneDocumentBlockItsLinks) {
    write("src/auth.ts", AUTH_TS);
    write("docs/api.md", "<!-- @docs-id: auth-login -->\n"
                         "<!-- @docs-id: auth-logout -->\n"
                         "<!-- @docs-id: auth-login -->\n");

    auto [scan, findings] = check({"src", "docs"});
    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, model::FileErrorKind::DuplicateDocId);
    EXPECT_EQ(scan.blocked_ids.size(), 2u);
    EXPECT_TRUE(findings.empty());
}

TEST_F(PipelineTest, DuplicateIdsAcrossDocuments) {
    write("src/auth.ts", AUTH_TS);
    write("docs/a.md", "<!-- @docs-id: auth-login -->\n# Login\n");
    write("docs/b.md", "<!-- @docs-id: auth-login -->\n# Login again\n"
                       "<!-- @docs-id: auth-logout -->\n# Logout\n");

    auto [scan, findings] = check({"src", "docs"});
    ASSERT_EQ(scan.errors.size(), 1u);
    EXPECT_EQ(scan.errors[0].kind, model::FileErrorKind::DuplicateDocId);
    EXPECT_EQ(scan.errors[0].file, "docs/b.md");
    EXPECT_EQ(scan.blocked_ids, std::set<std::string>{"auth-login"});
    ASSERT_EQ(scan.sections.size(), 1u);
    EXPECT_EQ(scan.sections[0].id, "auth-logout");

    // login is withheld; logout resolves
    ASSERT_EQ(findings.size(), 2u);
    EXPECT_EQ(findings[0].entity_name, "logout");
    EXPECT_EQ(findings[0].kind, FindingKind::LinkVerified);
    EXPECT_EQ(findings[1].kind, FindingKind::MissingArgument);
}

TEST_F(PipelineTest, ConfigDrivesMarkersAndOrphans) {
    write("src/pay.rs", "/// @ref: [pay]\npub fn pay(amount: u64) {}\n");
    write("docs/pay.md", "<!-- @ref-id: pay -->\n- `amount` (`Money`): Cents\n"
                         "<!-- @ref-id: refund -->\n# Refund\n");

    config::Config config;
    config.annotation = "@ref";
    config.marker = "@ref-id";
    config.report_orphans = true;
    config.aliases["money"] = types::CanonicalType::String;
    options_ = options_from_config(config, root_);

    auto [scan, findings] = check({"src", "docs"});
    ASSERT_EQ(findings.size(), 3u);
    EXPECT_EQ(findings[0].kind, FindingKind::LinkVerified);
    EXPECT_EQ(findings[1].kind, FindingKind::TypeMismatch);
    EXPECT_EQ(findings[2].kind, FindingKind::OrphanSection);
    EXPECT_EQ(findings[2].doc_id, "refund");
}

// ============================================================================
// Run Gate
// ============================================================================

TEST_F(PipelineTest, RunGateAcceptsStablePass) {
    write("src/a.rs", "fn a() {}\n");
    std::vector<fs::path> files = {root_ / "src/a.rs"};
    RunGate gate([&] { return files; });

    int passes = 0;
    EXPECT_TRUE(gate.run([&] { ++passes; }));
    EXPECT_EQ(passes, 1);
    EXPECT_EQ(gate.attempts(), 1u);
    EXPECT_FALSE(gate.changed());

    write("src/a.rs", "fn a() {}\nfn b() {}\n");
    EXPECT_TRUE(gate.changed());
}

TEST_F(PipelineTest, RunGateDiscardsStalePass) {
    write("src/a.rs", "fn a() {}\n");
    std::vector<fs::path> files = {root_ / "src/a.rs"};
    RunGate gate([&] { return files; });

    int passes = 0;
    EXPECT_TRUE(gate.run([&] {
        if (++passes == 1) {
            write("src/a.rs", "fn a() {}\nfn edited() {}\n");
        }
    }));
    EXPECT_EQ(passes, 2);
    EXPECT_EQ(gate.attempts(), 2u);
}

TEST_F(PipelineTest, RunGateGivesUpWhenAlwaysStale) {
    write("src/a.rs", "");
    std::vector<fs::path> files = {root_ / "src/a.rs"};
    RunGate gate([&] { return files; }, 3);

    std::string content;
    EXPECT_FALSE(gate.run([&] {
        content += "x";
        write("src/a.rs", content);
    }));
    EXPECT_EQ(gate.attempts(), 3u);
}
