//! # CLI Command Dispatcher
//!
//! Parses the global flags, initializes logging and routes to the command
//! handler.
//!
//! ```text
//! docsguard_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ check          → run_check()
//!   ├─ baseline       → run_baseline()
//!   ├─ scaffold       → run_scaffold()
//!   └─ watch          → run_watch()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`-v`, `-q`, `--log-level=`, `--log-filter=`,
//! `--log-file=`, `--log-format=`) are accepted anywhere on the command
//! line. `DOCSGUARD_LOG` applies when none is given.

#include "cli/commands/cmd_baseline.hpp"
#include "cli/commands/cmd_check.hpp"
#include "cli/commands/cmd_scaffold.hpp"
#include "cli/commands/cmd_watch.hpp"
#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace docsguard::cli {

/// Main entry point for the docsguard CLI.
///
/// ## Return Codes
///
/// | Code | Meaning                                              |
/// |------|------------------------------------------------------|
/// | 0    | Passed                                               |
/// | 1    | Blocking findings                                    |
/// | 2    | Fatal: file errors, corrupt baseline, usage error    |
int docsguard_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    // The command is the first argument that is not a logging flag
    int command_index = 1;
    while (command_index < argc && log::is_log_option(argv[command_index])) {
        ++command_index;
    }
    if (command_index >= argc) {
        print_usage();
        return EXIT_PASS;
    }

    std::string command = argv[command_index];
    if (command == "--help" || command == "-h" || command == "help") {
        print_usage();
        return EXIT_PASS;
    }
    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_PASS;
    }

    // Handlers read their arguments from argv[2] on
    std::vector<char*> args;
    args.push_back(argv[0]);
    args.push_back(argv[command_index]);
    for (int i = 1; i < argc; ++i) {
        if (i != command_index) {
            args.push_back(argv[i]);
        }
    }
    int sub_argc = static_cast<int>(args.size());
    char** sub_argv = args.data();

    DOCSGUARD_LOG_DEBUG("cli", "command '" << command << "' with " << sub_argc - 2
                                           << " arguments");

    int code = EXIT_FATAL;
    if (command == "check") {
        code = run_check(sub_argc, sub_argv);
    } else if (command == "baseline") {
        code = run_baseline(sub_argc, sub_argv);
    } else if (command == "scaffold") {
        code = run_scaffold(sub_argc, sub_argv);
    } else if (command == "watch") {
        code = run_watch(sub_argc, sub_argv);
    } else {
        return usage_error("", "unknown command '" + command + "'");
    }

    log::Logger::instance().flush();
    return code;
}

} // namespace docsguard::cli
