//! # Scaffold Command
//!
//! ```text
//! run_scaffold()
//!   ├─ run_pass()               abort on file errors
//!   ├─ suggest_links()          unlinked declarations vs untargeted sections
//!   ├─ for each suggestion:     [y]es / [n]o / [q]uit  (--force: yes)
//!   └─ write_annotations()      per file, unless --dry-run
//! ```
//!
//! Nothing is written before every question has been answered.

#include "cli/commands/cmd_scaffold.hpp"

#include "cli/annotation_writer.hpp"
#include "cli/utils.hpp"
#include "heuristic/matcher.hpp"
#include "log/log.hpp"
#include "report/renderer.hpp"

#include <iostream>
#include <map>

namespace docsguard::cli {

namespace fs = std::filesystem;

namespace {

enum class Decision { Accept, Reject, Quit };

void print_scaffold_help() {
    std::cout << "Usage: docsguard scaffold [paths...] [options]\n\n";
    std::cout << "Proposes links between unlinked declarations and documentation\n";
    std::cout << "sections with a similar name, and inserts the accepted annotations.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --project-root DIR   Root holding docsguard.toml\n";
    std::cout << "  --force              Accept every suggestion without asking\n";
    std::cout << "  --dry-run            Show the edits, write nothing\n";
    std::cout << "  --no-color           Disable ANSI colors\n";
}

/// Asks until the answer is y, n or q. End of input counts as quit.
auto prompt_decision() -> Decision {
    while (true) {
        std::cout << "    link? [y]es/[n]o/[q]uit: " << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            return Decision::Quit;
        }
        auto start = line.find_first_not_of(" \t\r");
        char answer = start == std::string::npos ? '\0' : line[start];
        switch (answer) {
        case 'y':
        case 'Y':
            return Decision::Accept;
        case 'n':
        case 'N':
            return Decision::Reject;
        case 'q':
        case 'Q':
            return Decision::Quit;
        default:
            std::cout << "    please answer y, n or q\n";
        }
    }
}

/// Display paths are relative to the project root when inside it.
auto disk_path(const std::string& display, const fs::path& root) -> fs::path {
    fs::path path(display);
    return path.is_relative() ? root / path : path;
}

} // namespace

/// Main entry point for the `docsguard scaffold` command.
int run_scaffold(int argc, char* argv[]) {
    std::vector<std::string> paths;
    fs::path project_root = ".";
    bool dry_run = false;
    bool force = false;
    bool no_color = false;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        if (log::is_log_option(arg)) {
            continue;
        } else if (arg == "--help" || arg == "-h") {
            print_scaffold_help();
            return EXIT_PASS;
        } else if (match_option(argc, argv, i, "--project-root", value)) {
            if (value.empty()) {
                return usage_error("scaffold", "--project-root needs a directory");
            }
            project_root = value;
        } else if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--force") {
            force = true;
        } else if (arg == "--no-color") {
            no_color = true;
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("scaffold", "unknown option '" + arg + "'");
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
        std::cout << "\nscaffold aborted: " << pass.errors.size() << " file errors\n";
        return EXIT_FATAL;
    }

    auto suggestions = heuristic::suggest_links(pass.scan.entities, pass.scan.sections);
    if (suggestions.empty()) {
        std::cout << "no link suggestions: every declaration is linked or no section name "
                     "is close enough\n";
        return EXIT_PASS;
    }
    if (dry_run) {
        std::cout << "dry run: no file will be modified\n";
    }
    std::cout << suggestions.size() << " link suggestions\n\n";

    // file -> edits, in suggestion order
    std::map<std::string, std::vector<AnnotationEdit>> accepted;
    size_t accepted_count = 0;
    size_t rejected = 0;
    size_t answered = 0;

    for (size_t i = 0; i < suggestions.size(); ++i) {
        const auto& suggestion = suggestions[i];
        std::cout << "(" << i + 1 << "/" << suggestions.size() << ") "
                  << report::render_suggestion(suggestion, colors);

        Decision decision = force ? Decision::Accept : prompt_decision();
        if (decision == Decision::Quit) {
            break;
        }
        ++answered;
        if (decision == Decision::Reject) {
            ++rejected;
            continue;
        }
        accepted[suggestion.location.file].push_back(
            AnnotationEdit{suggestion.location.line, suggestion.section_id});
        ++accepted_count;
    }

    std::cout << "\naccepted " << accepted_count << ", rejected " << rejected << ", skipped "
              << suggestions.size() - answered << "\n";
    if (accepted.empty()) {
        return EXIT_PASS;
    }

    const auto& token = project.config.annotation;
    for (const auto& [file, edits] : accepted) {
        auto lang = code::language_for_path(file);
        if (!lang) {
            // Suggestions only come from scanned sources
            DOCSGUARD_LOG_ERROR("scaffold", "no language for " << file);
            return EXIT_FATAL;
        }
        if (dry_run) {
            for (const auto& edit : edits) {
                std::cout << "would insert `" << annotation_comment(*lang, token, edit.id)
                          << "` above " << file << ":" << edit.line << "\n";
            }
            continue;
        }

        auto written = write_annotations(disk_path(file, project.root), edits, *lang, token);
        if (is_err(written)) {
            const auto& error = unwrap_err(written);
            std::cout << report::render_file_error(
                model::FileError::parse_failure(file, error.line, error.message,
                                                "no annotation was written to this file"),
                colors);
            return EXIT_FATAL;
        }
        std::cout << "wrote " << unwrap(written) << " annotations to " << file << "\n";
    }
    return EXIT_PASS;
}

} // namespace docsguard::cli
