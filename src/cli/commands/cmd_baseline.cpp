//! # Baseline Command
//!
//! Dumps the current findings, Info included, into the baseline store. A
//! pass with fatal file errors is not recorded: the baseline would hide
//! whatever the broken files contain.

#include "cli/commands/cmd_baseline.hpp"

#include "baseline/baseline.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "report/renderer.hpp"

#include <iostream>

namespace docsguard::cli {

namespace {

void print_baseline_help() {
    std::cout << "Usage: docsguard baseline [paths...] [--project-root DIR]\n\n";
    std::cout << "Records every current finding as known. Later checks block only on\n";
    std::cout << "findings that are not in the baseline.\n";
}

} // namespace

/// Main entry point for the `docsguard baseline` command.
int run_baseline(int argc, char* argv[]) {
    std::vector<std::string> paths;
    std::filesystem::path project_root = ".";
    bool no_color = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_baseline_help();
            return EXIT_PASS;
        } else if (match_option(argc, argv, i, "--project-root", value)) {
            if (value.empty()) {
                return usage_error("baseline", "--project-root needs a directory");
            }
            project_root = value;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("baseline", "unknown option '" + arg + "'");
        } else {
            paths.push_back(arg);
        }
    }
    bool colors = !no_color && stdout_supports_colors();

    auto project = load_project(project_root);
    auto pass = run_pass(paths, project);

    if (!pass.errors.empty()) {
        for (const auto& error : pass.errors) {
            std::cout << report::render_file_error(error, colors);
        }
        std::cout << "\nbaseline not written: " << pass.errors.size()
                  << " file errors must be fixed first\n";
        return EXIT_FATAL;
    }

    auto snapshot = baseline::make_snapshot(pass.findings, baseline::unix_timestamp_now());
    auto path = project.baseline_path();
    auto saved = baseline::save_baseline(path, snapshot);
    if (is_err(saved)) {
        std::cout << report::render_file_error(unwrap_err(saved), colors);
        return EXIT_FATAL;
    }

    std::cout << "baseline: recorded " << unwrap(saved) << " findings in "
              << model::portable_path(path.string()) << "\n";
    std::cout << "check now blocks only on findings that are not in the baseline\n";
    return EXIT_PASS;
}

} // namespace docsguard::cli
