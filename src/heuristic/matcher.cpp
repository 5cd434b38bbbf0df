//! # Heuristic Matcher Implementation

#include "heuristic/matcher.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace docsguard::heuristic {

namespace {

auto is_upper(char c) -> bool {
    return std::isupper(static_cast<unsigned char>(c)) != 0;
}

auto is_lower(char c) -> bool {
    return std::islower(static_cast<unsigned char>(c)) != 0;
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

auto is_alnum(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

auto to_lower(std::string s) -> std::string {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

auto join(const std::vector<std::string>& words) -> std::string {
    std::string out;
    for (const auto& w : words) {
        if (!out.empty()) {
            out += ' ';
        }
        out += w;
    }
    return out;
}

/// Lowercases, maps punctuation to spaces and collapses whitespace.
auto normalize_text(std::string_view text) -> std::string {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (is_alnum(c)) {
            if (pending_space && !out.empty()) {
                out += ' ';
            }
            pending_space = false;
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        } else {
            pending_space = true;
        }
    }
    return out;
}

} // namespace

auto split_identifier(std::string_view name) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            words.push_back(to_lower(std::move(current)));
            current.clear();
        }
    };

    for (size_t i = 0; i < name.size(); ++i) {
        char c = name[i];
        if (!is_alnum(c)) {
            flush();
            continue;
        }
        if (!current.empty()) {
            char prev = current.back();
            bool boundary = false;
            if (is_digit(c) != is_digit(prev)) {
                boundary = true;
            } else if (is_upper(c) && is_lower(prev)) {
                boundary = true; // camelCase
            } else if (is_upper(c) && is_upper(prev) && i + 1 < name.size() &&
                       is_lower(name[i + 1])) {
                boundary = true; // HTTPServer: split before "Server"
            }
            if (boundary) {
                flush();
            }
        }
        current += c;
    }
    flush();
    return words;
}

auto entity_key(const model::CodeEntity& entity) -> std::string {
    return join(split_identifier(entity.name));
}

auto section_keys(const model::DocSection& section) -> std::vector<std::string> {
    std::vector<std::string> keys;
    if (section.title) {
        auto key = normalize_text(*section.title);
        if (!key.empty()) {
            keys.push_back(std::move(key));
        }
    }
    auto id_key = normalize_text(section.id);
    if (!id_key.empty() && (keys.empty() || keys.front() != id_key)) {
        keys.push_back(std::move(id_key));
    }
    return keys;
}

auto levenshtein(std::string_view a, std::string_view b) -> size_t {
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) {
        prev[j] = j;
    }
    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

auto similarity(std::string_view a, std::string_view b) -> double {
    size_t longest = std::max(a.size(), b.size());
    if (longest == 0) {
        return 1.0;
    }
    return 1.0 - static_cast<double>(levenshtein(a, b)) / static_cast<double>(longest);
}

auto suggest_links(const std::vector<model::CodeEntity>& entities,
                   const std::vector<model::DocSection>& sections) -> std::vector<Suggestion> {
    std::unordered_set<std::string> targeted;
    for (const auto& entity : entities) {
        if (entity.doc_id) {
            targeted.insert(*entity.doc_id);
        }
    }

    // Candidate sections with their keys, in document order
    std::vector<std::pair<const model::DocSection*, std::vector<std::string>>> candidates;
    for (const auto& section : sections) {
        if (targeted.count(section.id) > 0) {
            continue;
        }
        auto keys = section_keys(section);
        if (!keys.empty()) {
            candidates.emplace_back(&section, std::move(keys));
        }
    }

    std::vector<Suggestion> suggestions;
    for (size_t i = 0; i < entities.size(); ++i) {
        const auto& entity = entities[i];
        if (entity.doc_id) {
            continue;
        }
        auto key = entity_key(entity);
        if (key.empty()) {
            continue;
        }

        const model::DocSection* best = nullptr;
        double best_score = 0.0;
        for (const auto& [section, keys] : candidates) {
            double score = 0.0;
            for (const auto& section_key : keys) {
                score = std::max(score, similarity(key, section_key));
            }
            if (score > SUGGESTION_THRESHOLD && (best == nullptr || score > best_score)) {
                best = section;
                best_score = score;
            }
        }
        if (best == nullptr) {
            continue;
        }

        DOCSGUARD_LOG_DEBUG("match", entity.name << " ~ " << best->id << " (" << best_score
                                                 << ")");
        Suggestion suggestion;
        suggestion.entity_index = i;
        suggestion.entity_name = entity.name;
        suggestion.location = {entity.file, entity.line};
        suggestion.section_id = best->id;
        suggestion.section_title = best->title;
        suggestion.score = best_score;
        suggestions.push_back(std::move(suggestion));
    }
    return suggestions;
}

} // namespace docsguard::heuristic
