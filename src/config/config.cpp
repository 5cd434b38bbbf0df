//! # Configuration Loading
//!
//! Line-oriented reader for the subset of TOML docsguard uses: section
//! headers, `key = value` pairs with string or boolean values, and `#`
//! comments.

#include "config/config.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace docsguard::config {

namespace {

enum class Section { None, Docsguard, Types, Other };

auto trim(std::string_view s) -> std::string_view {
    size_t start = s.find_first_not_of(" \t\r");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

/// Unquotes a string value or strips a trailing comment from a bare one.
auto parse_value(std::string_view raw) -> std::string {
    raw = trim(raw);
    if (!raw.empty() && raw.front() == '"') {
        size_t close = raw.find('"', 1);
        return std::string(raw.substr(1, close == std::string_view::npos ? std::string_view::npos
                                                                          : close - 1));
    }
    size_t hash = raw.find('#');
    if (hash != std::string_view::npos) {
        raw = trim(raw.substr(0, hash));
    }
    return std::string(raw);
}

auto parse_key(std::string_view raw) -> std::string {
    raw = trim(raw);
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        raw = raw.substr(1, raw.size() - 2);
    }
    return std::string(raw);
}

class ConfigParser {
public:
    auto parse(std::string_view text) -> Config {
        std::istringstream input{std::string(text)};
        std::string line;
        while (std::getline(input, line)) {
            ++line_no_;
            std::string_view view = trim(line);
            if (view.empty() || view.front() == '#') {
                continue;
            }

            if (view.front() == '[') {
                size_t close = view.find(']');
                std::string_view name =
                    trim(view.substr(1, close == std::string_view::npos ? std::string_view::npos
                                                                        : close - 1));
                if (name == "docsguard") {
                    section_ = Section::Docsguard;
                } else if (name == "types") {
                    section_ = Section::Types;
                } else {
                    section_ = Section::Other;
                }
                continue;
            }

            // Keys may be quoted and contain '=' only inside quotes
            size_t eq = view.front() == '"' ? view.find('=', view.find('"', 1)) : view.find('=');
            if (eq == std::string_view::npos) {
                warn("expected `key = value`");
                continue;
            }
            std::string key = parse_key(view.substr(0, eq));
            std::string value = parse_value(view.substr(eq + 1));

            if (section_ == Section::Docsguard) {
                apply_option(key, value);
            } else if (section_ == Section::Types) {
                apply_alias(key, value);
            }
        }
        return std::move(config_);
    }

private:
    Config config_;
    Section section_ = Section::None;
    size_t line_no_ = 0;

    void warn(const std::string& message) {
        std::string text = std::string(CONFIG_FILE) + ":" + std::to_string(line_no_) + ": " + message;
        DOCSGUARD_LOG_WARN("config", text);
        config_.warnings.push_back(std::move(text));
    }

    void apply_option(const std::string& key, const std::string& value) {
        if (key == "baseline") {
            if (value.empty()) {
                warn("`baseline` must not be empty");
            } else {
                config_.baseline_path = value;
            }
        } else if (key == "fail-on") {
            if (value == "error") {
                config_.fail_on = model::Severity::Error;
            } else if (value == "warning") {
                config_.fail_on = model::Severity::Warning;
            } else {
                warn("`fail-on` must be \"error\" or \"warning\", got \"" + value + "\"");
            }
        } else if (key == "report-orphans") {
            if (value == "true") {
                config_.report_orphans = true;
            } else if (value == "false") {
                config_.report_orphans = false;
            } else {
                warn("`report-orphans` must be true or false");
            }
        } else if (key == "annotation" || key == "marker") {
            if (value.empty() || value.find_first_of(" \t:[]") != std::string::npos) {
                warn("`" + key + "` must be a single token");
            } else if (key == "annotation") {
                config_.annotation = value;
            } else {
                config_.marker = value;
            }
        } else {
            warn("unknown option `" + key + "`");
        }
    }

    void apply_alias(const std::string& key, const std::string& value) {
        auto canonical = types::parse_canonical_type(value);
        if (!canonical) {
            warn("type alias `" + key +
                 "` must map to string, number, boolean, object or unknown");
            return;
        }
        std::string token = types::clean_type_token(key);
        if (token.empty()) {
            warn("empty type alias");
            return;
        }
        if (types::parse_canonical_type(token)) {
            warn("`" + key + "` is a canonical type name and cannot be aliased");
            return;
        }
        config_.aliases[token] = *canonical;
    }
};

} // namespace

auto parse_config(std::string_view text) -> Config {
    ConfigParser parser;
    return parser.parse(text);
}

auto load_config(const std::filesystem::path& project_root) -> Config {
    std::filesystem::path config_path = project_root / CONFIG_FILE;
    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        DOCSGUARD_LOG_DEBUG("config", "no " << CONFIG_FILE << " in " << project_root.string()
                                            << ", using defaults");
        return Config{};
    }

    std::ifstream file(config_path);
    if (!file) {
        DOCSGUARD_LOG_WARN("config", "cannot read " << config_path.string() << ", using defaults");
        return Config{};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    DOCSGUARD_LOG_DEBUG("config", "loading " << config_path.string());
    return parse_config(buffer.str());
}

} // namespace docsguard::config
