//! # Watch Command
//!
//! Polls the stamps of every input and re-runs `check` on change:
//!
//! ```text
//! loop:
//!   changed or stale? ──no──> sleep(interval)
//!        │yes
//!        └─> RunGate::run(build_check_report)
//!              ├─ stable ──> clear screen, print report
//!              └─ stale  ──> keep the old report, retry next tick
//! ```

#include "cli/commands/cmd_watch.hpp"

#include "cli/commands/cmd_check.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"
#include "pipeline/run_gate.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace docsguard::cli {

namespace {

constexpr long DEFAULT_INTERVAL_MS = 500;

void print_watch_help() {
    std::cout << "Usage: docsguard watch [paths...] [options]\n\n";
    std::cout << "Re-runs check whenever an input, docsguard.toml or the baseline\n";
    std::cout << "changes. Stop with Ctrl+C.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --project-root DIR   Root holding docsguard.toml and the baseline\n";
    std::cout << "  --interval-ms N      Polling interval (default: 500)\n";
    std::cout << "  --show-info          Also print verified links\n";
    std::cout << "  --no-color           Disable ANSI colors\n";
}

} // namespace

/// Main entry point for the `docsguard watch` command.
int run_watch(int argc, char* argv[]) {
    CheckOptions options;
    long interval_ms = DEFAULT_INTERVAL_MS;
    bool no_color = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_watch_help();
            return EXIT_PASS;
        } else if (match_option(argc, argv, i, "--project-root", value)) {
            if (value.empty()) {
                return usage_error("watch", "--project-root needs a directory");
            }
            options.project_root = value;
        } else if (match_option(argc, argv, i, "--interval-ms", value)) {
            char* end = nullptr;
            interval_ms = std::strtol(value.c_str(), &end, 10);
            if (value.empty() || *end != '\0' || interval_ms <= 0) {
                return usage_error("watch", "--interval-ms needs a positive number of "
                                            "milliseconds");
            }
        } else if (arg == "--show-info") {
            options.show_info = true;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("watch", "unknown option '" + arg + "'");
        } else {
            options.paths.push_back(arg);
        }
    }
    bool terminal = stdout_supports_colors();
    options.colors = !no_color && terminal;

    auto project = load_project(options.project_root);
    pipeline::RunGate gate([&] { return watched_files(options.paths, project); });

    bool pending = true;
    while (true) {
        if (pending || gate.changed()) {
            // The configuration itself may have changed
            project = load_project(options.project_root);

            auto start = std::chrono::steady_clock::now();
            CheckReport report;
            bool stable = gate.run([&] { report = build_check_report(options); });
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);

            if (stable) {
                if (terminal) {
                    std::cout << "\x1B[2J\x1B[1;1H";
                }
                std::cout << report.output;
                std::cout << "\nchecked in " << elapsed.count() << " ms; watching for changes "
                          << "(Ctrl+C to stop)\n"
                          << std::flush;
                pending = false;
            } else {
                DOCSGUARD_LOG_WARN("watch", "inputs changed during " << gate.attempts()
                                                                     << " passes in a row, "
                                                                        "waiting for them to "
                                                                        "settle");
                pending = true;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms));
    }
}

} // namespace docsguard::cli
