//! # Check Command
//!
//! ```text
//! run_check()
//!   ├─ Parse arguments (--project-root, --format, --show-info, --no-color)
//!   ├─ load_project()          docsguard.toml
//!   ├─ run_pass()              collect, scan, validate
//!   ├─ load_baseline()         .docsguard/baseline.json, if present
//!   ├─ apply_baseline()        known / new / blocking
//!   └─ render text or JSON, exit 0 / 1 / 2
//! ```

#include "cli/commands/cmd_check.hpp"

#include "baseline/baseline.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "report/renderer.hpp"

#include <iostream>
#include <sstream>

namespace docsguard::cli {

namespace {

void print_check_help() {
    std::cout << "Usage: docsguard check [paths...] [options]\n\n";
    std::cout << "Validates every code to documentation link under the given paths\n";
    std::cout << "(default: the project root).\n\n";
    std::cout << "Options:\n";
    std::cout << "  --project-root DIR   Root holding docsguard.toml and the baseline\n";
    std::cout << "  --format text|json   Report format (default: text)\n";
    std::cout << "  --show-info          Also print verified links\n";
    std::cout << "  --no-color           Disable ANSI colors\n";
}

auto render_text(const baseline::BaselineOutcome& outcome,
                 const std::vector<model::FileError>& errors, const CheckOptions& options)
    -> std::string {
    std::ostringstream out;
    for (const auto& error : errors) {
        out << report::render_file_error(error, options.colors);
    }
    for (const auto& finding : outcome.findings) {
        if (finding.result.severity == model::Severity::Info && !options.show_info) {
            continue;
        }
        out << report::render_finding(finding.result, finding.status, options.colors);
    }
    if (!errors.empty() || !outcome.findings.empty()) {
        out << "\n";
    }
    out << report::render_summary(outcome, errors.size(), options.colors);
    return out.str();
}

} // namespace

auto build_check_report(const CheckOptions& options) -> CheckReport {
    auto project = load_project(options.project_root);
    auto pass = run_pass(options.paths, project);

    std::optional<baseline::BaselineSnapshot> snapshot;
    auto loaded = baseline::load_baseline(project.baseline_path());
    if (is_err(loaded)) {
        // A corrupt store invalidates the whole classification
        pass.errors.push_back(std::move(unwrap_err(loaded)));
        pass.findings.clear();
    } else {
        snapshot = std::move(unwrap(loaded));
    }

    auto outcome = baseline::apply_baseline(std::move(pass.findings), snapshot,
                                            project.config.fail_on);

    CheckReport result;
    if (options.json) {
        result.output = report::findings_to_json(outcome, pass.errors).to_string_pretty() + "\n";
    } else {
        result.output = render_text(outcome, pass.errors, options);
    }

    if (!pass.errors.empty()) {
        result.exit_code = EXIT_FATAL;
    } else if (outcome.has_blocking) {
        result.exit_code = EXIT_BLOCKING;
    } else {
        result.exit_code = EXIT_PASS;
    }

    DOCSGUARD_LOG_INFO("check", outcome.findings.size()
                                    << " findings, " << outcome.counts.blocking << " blocking, "
                                    << pass.errors.size() << " file errors, exit "
                                    << result.exit_code);
    return result;
}

/// Main entry point for the `docsguard check` command.
int run_check(int argc, char* argv[]) {
    CheckOptions options;
    bool no_color = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_check_help();
            return EXIT_PASS;
        } else if (match_option(argc, argv, i, "--project-root", value)) {
            if (value.empty()) {
                return usage_error("check", "--project-root needs a directory");
            }
            options.project_root = value;
        } else if (match_option(argc, argv, i, "--format", value)) {
            if (value == "json") {
                options.json = true;
            } else if (value == "text") {
                options.json = false;
            } else {
                return usage_error("check", "--format must be 'text' or 'json', got '" + value +
                                                "'");
            }
        } else if (arg == "--show-info") {
            options.show_info = true;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("check", "unknown option '" + arg + "'");
        } else {
            options.paths.push_back(arg);
        }
    }
    options.colors = !no_color && !options.json && stdout_supports_colors();

    auto result = build_check_report(options);
    std::cout << result.output << std::flush;
    return result.exit_code;
}

} // namespace docsguard::cli
