//! # Documentation Section Extractor Implementation

#include "doc/section_extractor.hpp"

#include "doc/arg_strategies.hpp"
#include "log/log.hpp"

#include <cctype>
#include <span>
#include <unordered_map>

namespace docsguard::doc {

namespace {

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

/// Body of one section while the document is being walked.
struct OpenSection {
    model::DocSection section;
    size_t first_block = 0;
    size_t end_block = 0;
};

} // namespace

auto parse_marker(std::string_view comment, std::string_view marker)
    -> std::optional<std::string> {
    auto text = trim(comment);
    if (marker.empty() || !text.starts_with(marker)) {
        return std::nullopt;
    }
    text.remove_prefix(marker.size());

    // "@docs-id-extra: x" is not our marker
    if (!text.empty() && text.front() != ':' && !std::isspace(static_cast<unsigned char>(text.front()))) {
        return std::nullopt;
    }
    text = trim(text);
    if (!text.empty() && text.front() == ':') {
        text.remove_prefix(1);
    }
    text = trim(text);

    size_t end = 0;
    while (end < text.size() && !std::isspace(static_cast<unsigned char>(text[end]))) {
        ++end;
    }
    return std::string(text.substr(0, end));
}

auto extract_sections(const std::vector<Block>& blocks, const std::string& file,
                      const SectionOptions& options)
    -> Result<std::vector<model::DocSection>, model::FileError> {
    std::vector<OpenSection> open;
    std::vector<std::string> ids;
    std::unordered_map<std::string, size_t> first_line;
    std::optional<model::FileError> duplicate;

    for (size_t i = 0; i < blocks.size(); ++i) {
        const auto& block = blocks[i];
        if (block.kind != BlockKind::HtmlComment) {
            continue;
        }
        auto id = parse_marker(block.text, options.marker);
        if (!id) {
            continue;
        }
        if (id->empty()) {
            DOCSGUARD_LOG_WARN("extract", file << ":" << block.line << ": marker '"
                                               << options.marker
                                               << "' has no id and is ignored");
            continue;
        }

        if (!open.empty()) {
            open.back().end_block = i;
        }

        auto [it, inserted] = first_line.emplace(*id, block.line);
        if (!inserted && !duplicate) {
            duplicate = model::FileError::duplicate_doc_id(
                file, block.line,
                "documentation id '" + *id + "' is declared twice (lines " +
                    std::to_string(it->second) + " and " + std::to_string(block.line) + ")",
                {});
        }
        ids.push_back(*id);

        OpenSection next;
        next.section.id = *id;
        next.section.file = file;
        next.section.line = block.line;
        next.first_block = i + 1;
        next.end_block = blocks.size();
        open.push_back(std::move(next));
    }

    if (duplicate) {
        duplicate->ids = std::move(ids);
        return *duplicate;
    }

    std::vector<model::DocSection> sections;
    sections.reserve(open.size());
    std::span<const Block> all(blocks);
    for (auto& entry : open) {
        auto body = all.subspan(entry.first_block, entry.end_block - entry.first_block);

        for (const auto& block : body) {
            if (block.kind == BlockKind::Heading) {
                entry.section.title = block.text;
                break;
            }
        }

        auto extraction = extract_args(body);
        entry.section.args = std::move(extraction.args);

        DOCSGUARD_LOG_DEBUG("extract", "section '"
                                           << entry.section.id << "' (" << file << ":"
                                           << entry.section.line << ") has "
                                           << entry.section.args.size() << " args via "
                                           << (extraction.strategy
                                                   ? strategy_name(*extraction.strategy)
                                                   : "no strategy"));
        sections.push_back(std::move(entry.section));
    }

    return sections;
}

auto extract_sections_from_text(std::string_view text, const std::string& file,
                                 const SectionOptions& options)
    -> Result<std::vector<model::DocSection>, model::FileError> {
    return extract_sections(lex_markdown(text), file, options);
}

} // namespace docsguard::doc
