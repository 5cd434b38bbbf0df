//! # Code Entity Extractor Implementation

#include "code/entity_extractor.hpp"

#include "log/log.hpp"

#include <array>

namespace docsguard::code {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\r';
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

auto is_id_char(char c) -> bool {
    return !is_space(c) && c != ']' && c != ',' && c != '*';
}

} // namespace

auto strip_comment_prefix(std::string_view line) -> std::string_view {
    line = trim(line);
    if (line.ends_with("*/")) {
        line.remove_suffix(2);
        line = trim(line);
    }

    // Longest prefixes first
    constexpr std::array<std::string_view, 7> PREFIXES = {"///", "//!", "//", "/**",
                                                          "/*",  "*",   "#"};
    for (auto prefix : PREFIXES) {
        if (line.starts_with(prefix)) {
            line.remove_prefix(prefix.size());
            break;
        }
    }
    return trim(line);
}

auto parse_annotation(std::string_view line, std::string_view token)
    -> std::optional<std::string> {
    std::string_view text = strip_comment_prefix(line);

    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string_view::npos) {
        bool starts_word = pos == 0 || is_space(text[pos - 1]);
        size_t after = pos + token.size();
        size_t k = after;
        while (k < text.size() && is_space(text[k])) {
            ++k;
        }
        if (starts_word && k < text.size() && text[k] == ':') {
            std::string_view rest = trim(text.substr(k + 1));
            if (rest.starts_with("[")) {
                size_t close = rest.find(']');
                std::string_view inner =
                    rest.substr(1, close == std::string_view::npos ? std::string_view::npos
                                                                   : close - 1);
                return std::string(trim(inner));
            }
            size_t end = 0;
            while (end < rest.size() && is_id_char(rest[end])) {
                ++end;
            }
            return std::string(rest.substr(0, end));
        }
        pos = after;
    }
    return std::nullopt;
}

auto extract_entities(const std::vector<DeclNode>& decls, const std::string& file, Language lang,
                      const AnnotationOptions& options) -> std::vector<model::CodeEntity> {
    std::vector<model::CodeEntity> entities;
    entities.reserve(decls.size());

    for (const auto& decl : decls) {
        model::CodeEntity entity;
        entity.name = decl.name;
        entity.file = file;
        entity.line = decl.line;

        for (const auto& param : decl.params) {
            model::Parameter p;
            p.name = param.name;
            if (lang != Language::JavaScript) {
                p.type = param.type;
            }
            entity.params.push_back(std::move(p));
        }

        for (const auto& line : decl.comment_lines) {
            auto id = parse_annotation(line, options.token);
            if (!id) {
                continue;
            }
            if (id->empty()) {
                DOCSGUARD_LOG_WARN("extract", file << ":" << decl.line << ": empty " << options.token
                                                   << " annotation on '" << decl.name
                                                   << "' ignored");
                continue;
            }
            if (entity.doc_id) {
                DOCSGUARD_LOG_WARN("extract", file << ":" << decl.line << ": '" << decl.name
                                                   << "' has several annotations, keeping '"
                                                   << *entity.doc_id << "' and ignoring '" << *id
                                                   << "'");
                continue;
            }
            entity.doc_id = std::move(*id);
        }

        DOCSGUARD_LOG_DEBUG("extract", file << ":" << entity.line << ": " << entity.name
                                            << (entity.doc_id ? " -> " + *entity.doc_id
                                                              : std::string(" (unlinked)")));
        entities.push_back(std::move(entity));
    }
    return entities;
}

} // namespace docsguard::code
