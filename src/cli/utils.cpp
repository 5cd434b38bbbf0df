#include "utils.hpp"

#include "common.hpp"
#include "log/log.hpp"

#include <cstdio>
#include <cstdlib>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace docsguard::cli {

namespace fs = std::filesystem;

void print_usage() {
    std::cout << "docsguard " << VERSION << "\n\n";
    std::cout << "Usage: docsguard <command> [paths...] [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  check     Validate links between code and documentation\n";
    std::cout << "  baseline  Record current findings as accepted\n";
    std::cout << "  scaffold  Propose links and insert accepted annotations\n";
    std::cout << "  watch     Re-run check whenever an input changes\n";
    std::cout << "\nPaths ending in .md or .markdown are documentation; .rs, .ts, .tsx,\n";
    std::cout << ".js and .jsx files are source; directories are walked.\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --project-root DIR      Root holding docsguard.toml (default: .)\n";
    std::cout << "  --format text|json      Report format for check (default: text)\n";
    std::cout << "  --show-info             Also print verified links\n";
    std::cout << "  --no-color              Disable ANSI colors\n";
    std::cout << "  --dry-run               scaffold: show edits without writing\n";
    std::cout << "  --force                 scaffold: accept every suggestion\n";
    std::cout << "  --interval-ms N         watch: polling interval (default: 500)\n";
    std::cout << "  -v, -vv, -vvv, -q       Log verbosity (logs go to stderr)\n";
    std::cout << "  --log-level=LEVEL       trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=SPEC       e.g. scan=trace,*=warn\n";
    std::cout << "  --log-file=PATH         Also write logs to a file\n";
    std::cout << "  --help, -h              Show this help\n";
    std::cout << "  --version, -V           Show version\n";
    std::cout << "\nExit codes: 0 passed, 1 blocking findings, 2 fatal error.\n";
}

void print_version() {
    std::cout << "docsguard " << VERSION << "\n";
}

bool stdout_supports_colors() {
    if (!isatty(fileno(stdout)))
        return false;
    if (std::getenv("NO_COLOR") != nullptr)
        return false;
    const char* term = std::getenv("TERM");
    if (!term)
        return false;
    return std::string(term) != "dumb";
}

bool match_option(int argc, char* argv[], int& i, std::string_view name, std::string& value) {
    std::string_view arg = argv[i];
    if (!arg.starts_with(name)) {
        return false;
    }
    if (arg.size() == name.size()) {
        if (i + 1 < argc) {
            value = argv[++i];
        } else {
            value.clear();
        }
        return true;
    }
    if (arg[name.size()] == '=') {
        value = std::string(arg.substr(name.size() + 1));
        return true;
    }
    return false;
}

int usage_error(std::string_view command, const std::string& message) {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Run 'docsguard --help' for usage";
    if (!command.empty()) {
        std::cerr << " of '" << command << "'";
    }
    std::cerr << ".\n";
    return EXIT_FATAL;
}

// ============================================================================
// Project Passes
// ============================================================================

auto Project::baseline_path() const -> fs::path {
    fs::path path(config.baseline_path);
    return path.is_absolute() ? path : root / path;
}

auto load_project(const fs::path& root) -> Project {
    Project project;
    project.root = root;
    project.config = config::load_config(root);
    project.options = pipeline::options_from_config(project.config, root);
    return project;
}

namespace {

auto effective_paths(const std::vector<std::string>& paths, const Project& project)
    -> std::vector<std::string> {
    if (!paths.empty()) {
        return paths;
    }
    return {project.root.string()};
}

} // namespace

auto run_pass(const std::vector<std::string>& paths, const Project& project) -> PassResult {
    PassResult pass;
    auto inputs = pipeline::collect_inputs(effective_paths(paths, project));
    pass.scan = pipeline::scan_inputs(inputs, project.options);
    pass.errors = pass.scan.errors;

    auto findings = pipeline::run_validation(pass.scan, project.options);
    if (is_err(findings)) {
        pass.errors.push_back(std::move(unwrap_err(findings)));
    } else {
        pass.findings = std::move(unwrap(findings));
    }
    return pass;
}

auto watched_files(const std::vector<std::string>& paths, const Project& project)
    -> std::vector<fs::path> {
    auto files = pipeline::collect_inputs(effective_paths(paths, project)).all_files();
    files.push_back(project.root / config::CONFIG_FILE);
    files.push_back(project.baseline_path());
    return files;
}

} // namespace docsguard::cli
