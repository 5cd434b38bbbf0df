//! # Project Configuration
//!
//! Loads `docsguard.toml` from the project root.
//!
//! ## File Format
//!
//! ```toml
//! [docsguard]
//! baseline = ".docsguard/baseline.json"
//! fail-on = "error"          # or "warning"
//! report-orphans = false
//! annotation = "@docs"
//! marker = "@docs-id"
//!
//! [types]
//! uuid = "string"
//! money = "number"
//! ```
//!
//! A missing file gives the defaults. Unknown keys and invalid values are
//! reported as warnings and leave the default in place.

#ifndef DOCSGUARD_CONFIG_CONFIG_HPP
#define DOCSGUARD_CONFIG_CONFIG_HPP

#include "model/entity.hpp"
#include "types/type_normalizer.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::config {

constexpr const char* CONFIG_FILE = "docsguard.toml";

struct Config {
    std::string baseline_path = ".docsguard/baseline.json"; ///< Project-relative
    model::Severity fail_on = model::Severity::Error;
    bool report_orphans = false;
    std::string annotation = "@docs";
    std::string marker = "@docs-id";
    types::AliasTable aliases;

    /// Problems found while parsing, one per line, already logged.
    std::vector<std::string> warnings;
};

/// Parses configuration text. Never fails.
[[nodiscard]] auto parse_config(std::string_view text) -> Config;

/// Loads `docsguard.toml` from `project_root`, or the defaults.
[[nodiscard]] auto load_config(const std::filesystem::path& project_root) -> Config;

} // namespace docsguard::config

#endif // DOCSGUARD_CONFIG_CONFIG_HPP
