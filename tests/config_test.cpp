//! # Configuration Tests

#include "config/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace docsguard;
using namespace docsguard::config;

TEST(ConfigTest, Defaults) {
    auto config = parse_config("");
    EXPECT_EQ(config.baseline_path, ".docsguard/baseline.json");
    EXPECT_EQ(config.fail_on, model::Severity::Error);
    EXPECT_FALSE(config.report_orphans);
    EXPECT_EQ(config.annotation, "@docs");
    EXPECT_EQ(config.marker, "@docs-id");
    EXPECT_TRUE(config.aliases.empty());
    EXPECT_TRUE(config.warnings.empty());
}

TEST(ConfigTest, FullFile) {
    auto config = parse_config("# project settings\n"
                               "[docsguard]\n"
                               "baseline = \"ci/baseline.json\"  # shared\n"
                               "fail-on = \"warning\"\n"
                               "report-orphans = true # noisy\n"
                               "annotation = \"@ref\"\n"
                               "marker = \"@ref-id\"\n"
                               "\n"
                               "[types]\n"
                               "uuid = \"number\"\n"
                               "Money = \"number\"\n"
                               "\"cow<str>\" = \"object\"\n");
    EXPECT_EQ(config.baseline_path, "ci/baseline.json");
    EXPECT_EQ(config.fail_on, model::Severity::Warning);
    EXPECT_TRUE(config.report_orphans);
    EXPECT_EQ(config.annotation, "@ref");
    EXPECT_EQ(config.marker, "@ref-id");
    ASSERT_EQ(config.aliases.size(), 3u);
    EXPECT_EQ(config.aliases.at("uuid"), types::CanonicalType::Number);
    EXPECT_EQ(config.aliases.at("money"), types::CanonicalType::Number);
    EXPECT_EQ(config.aliases.at("cow<str>"), types::CanonicalType::Object);
    EXPECT_TRUE(config.warnings.empty());

    EXPECT_EQ(types::normalize("Uuid", config.aliases), types::CanonicalType::Number);
}

TEST(ConfigTest, InvalidValuesWarnAndKeepDefaults) {
    auto config = parse_config("[docsguard]\n"
                               "fail-on = \"sometimes\"\n"
                               "report-orphans = yes\n"
                               "colour = \"blue\"\n"
                               "annotation = \"@has space\"\n"
                               "[types]\n"
                               "widget = \"thing\"\n"
                               "string = \"number\"\n");
    EXPECT_EQ(config.fail_on, model::Severity::Error);
    EXPECT_FALSE(config.report_orphans);
    EXPECT_EQ(config.annotation, "@docs");
    EXPECT_TRUE(config.aliases.empty());
    ASSERT_EQ(config.warnings.size(), 6u);
    EXPECT_NE(config.warnings[0].find(":2:"), std::string::npos);
    EXPECT_NE(config.warnings[2].find("colour"), std::string::npos);
}

TEST(ConfigTest, OtherSectionsAreIgnored) {
    auto config = parse_config("[package]\nname = \"x\"\n[docsguard]\nreport-orphans = true\n");
    EXPECT_TRUE(config.report_orphans);
    EXPECT_TRUE(config.warnings.empty());
}

TEST(ConfigTest, LoadFromProjectRoot) {
    auto root = std::filesystem::temp_directory_path() / "docsguard_config_test";
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);

    EXPECT_FALSE(load_config(root).report_orphans);

    {
        std::ofstream out(root / CONFIG_FILE);
        out << "[docsguard]\nreport-orphans = true\n";
    }
    EXPECT_TRUE(load_config(root).report_orphans);

    std::filesystem::remove_all(root);
}
