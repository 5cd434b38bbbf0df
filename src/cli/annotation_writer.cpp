#include "cli/annotation_writer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace docsguard::cli {

namespace fs = std::filesystem;

namespace {

/// Splits into lines, each keeping its terminator.
auto split_lines_keep(std::string_view source) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < source.size()) {
        size_t nl = source.find('\n', start);
        size_t end = nl == std::string_view::npos ? source.size() : nl + 1;
        lines.push_back(source.substr(start, end - start));
        start = end;
    }
    return lines;
}

auto leading_indent(std::string_view line) -> std::string_view {
    size_t n = 0;
    while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
        ++n;
    }
    return line.substr(0, n);
}

auto detect_newline(std::string_view source) -> std::string_view {
    size_t nl = source.find('\n');
    if (nl != std::string_view::npos && nl > 0 && source[nl - 1] == '\r') {
        return "\r\n";
    }
    return "\n";
}

} // namespace

auto annotation_comment(code::Language lang, std::string_view token, std::string_view id)
    -> std::string {
    std::string out = lang == code::Language::Rust ? "/// " : "// ";
    out += token;
    out += ": [";
    out += id;
    out += "]";
    return out;
}

auto insert_annotations(std::string_view source, const std::vector<AnnotationEdit>& edits,
                        code::Language lang, std::string_view token)
    -> Result<std::string, WriteError> {
    auto lines = split_lines_keep(source);

    std::map<size_t, const AnnotationEdit*> by_line;
    for (const auto& edit : edits) {
        if (edit.line == 0 || edit.line > lines.size()) {
            return WriteError{"line " + std::to_string(edit.line) + " is outside the file (" +
                                  std::to_string(lines.size()) + " lines)",
                              edit.line};
        }
        if (!by_line.emplace(edit.line, &edit).second) {
            return WriteError{"two annotations target line " + std::to_string(edit.line),
                              edit.line};
        }
    }

    auto newline = detect_newline(source);
    std::string out;
    out.reserve(source.size() + edits.size() * 32);
    for (size_t i = 0; i < lines.size(); ++i) {
        auto it = by_line.find(i + 1);
        if (it != by_line.end()) {
            out += leading_indent(lines[i]);
            out += annotation_comment(lang, token, it->second->id);
            out += newline;
        }
        out += lines[i];
    }
    return out;
}

auto write_annotations(const fs::path& path, const std::vector<AnnotationEdit>& edits,
                       code::Language lang, std::string_view token)
    -> Result<size_t, WriteError> {
    std::string source;
    {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return WriteError{"cannot read " + path.string()};
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        source = buffer.str();
    }

    auto updated = insert_annotations(source, edits, lang, token);
    if (is_err(updated)) {
        return std::move(unwrap_err(updated));
    }

    // Write beside the target, then replace it
    auto tmp = path;
    tmp += ".docsguard-tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return WriteError{"cannot write " + tmp.string()};
        }
        out << unwrap(updated);
        if (!out.flush()) {
            return WriteError{"write to " + tmp.string() + " failed"};
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return WriteError{"cannot replace " + path.string()};
    }

    DOCSGUARD_LOG_INFO("scaffold", "inserted " << edits.size() << " annotations into "
                                               << path.string());
    return edits.size();
}

} // namespace docsguard::cli
