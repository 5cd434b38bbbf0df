//! # Check Command Interface
//!
//! - `docsguard check [paths...]`: validate and report
//! - `--format json`: machine-readable report on stdout
//! - `--show-info`: include verified links

#ifndef DOCSGUARD_CLI_COMMANDS_CMD_CHECK_HPP
#define DOCSGUARD_CLI_COMMANDS_CMD_CHECK_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace docsguard::cli {

struct CheckOptions {
    std::vector<std::string> paths;
    std::filesystem::path project_root = ".";
    bool json = false;
    bool colors = false;
    bool show_info = false;
};

/// A finished report, not yet printed.
struct CheckReport {
    int exit_code = 0;
    std::string output;
};

/// Runs one check pass and renders it.
[[nodiscard]] auto build_check_report(const CheckOptions& options) -> CheckReport;

int run_check(int argc, char* argv[]);

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_COMMANDS_CMD_CHECK_HPP
