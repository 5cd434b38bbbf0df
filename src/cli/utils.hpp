//! # CLI Utilities
//!
//! Helpers shared by the command handlers.
//!
//! | Function              | Description                             |
//! |-----------------------|-----------------------------------------|
//! | `print_usage()`       | Print CLI help text                     |
//! | `print_version()`     | Print the docsguard version             |
//! | `stdout_supports_colors()` | Terminal detection for reports     |
//! | `match_option()`      | `--name value` / `--name=value` parsing |
//! | `load_project()`      | Config plus pipeline options for a root |
//! | `run_pass()`          | Collect, scan and validate in one go    |

#ifndef DOCSGUARD_CLI_UTILS_HPP
#define DOCSGUARD_CLI_UTILS_HPP

#include "config/config.hpp"
#include "pipeline/pipeline.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::cli {

/// Exit codes shared by every command.
constexpr int EXIT_PASS = 0;
constexpr int EXIT_BLOCKING = 1;
constexpr int EXIT_FATAL = 2;

void print_usage();
void print_version();

/// True when stdout is a terminal that understands ANSI colors and
/// `NO_COLOR` is unset.
bool stdout_supports_colors();

/// Matches `--name value` or `--name=value` at `argv[i]`.
///
/// On a match `value` receives the argument (empty when missing) and `i`
/// is advanced past a separate value.
bool match_option(int argc, char* argv[], int& i, std::string_view name, std::string& value);

/// Reports an unknown option or a missing value. Returns `EXIT_FATAL`.
int usage_error(std::string_view command, const std::string& message);

struct Project {
    std::filesystem::path root;
    config::Config config;
    pipeline::PipelineOptions options;

    /// The baseline store location, resolved against the root.
    [[nodiscard]] auto baseline_path() const -> std::filesystem::path;
};

/// Loads `docsguard.toml` from `root`.
[[nodiscard]] auto load_project(const std::filesystem::path& root) -> Project;

/// Outcome of one pass, before the baseline is applied.
struct PassResult {
    pipeline::ScanResult scan;
    std::vector<model::ValidationResult> findings;
    std::vector<model::FileError> errors; ///< Everything fatal, in discovery order
};

/// Collects, scans and validates `paths`. An empty list means the project
/// root.
[[nodiscard]] auto run_pass(const std::vector<std::string>& paths, const Project& project)
    -> PassResult;

/// The files a pass over `paths` would read, including the configuration
/// and the baseline store.
[[nodiscard]] auto watched_files(const std::vector<std::string>& paths, const Project& project)
    -> std::vector<std::filesystem::path>;

} // namespace docsguard::cli

#endif // DOCSGUARD_CLI_UTILS_HPP
