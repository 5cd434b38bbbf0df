//! # Heuristic Matcher
//!
//! Proposes links between unlinked code entities and untargeted
//! documentation sections by comparing normalized names.
//!
//! ## Keys
//!
//! | Side | Key |
//! |------|-----|
//! | Entity | name split on case, digit and `_`/`-` boundaries, lowercased, space-joined |
//! | Section | title and id, each lowercased, punctuation to spaces, whitespace collapsed |
//!
//! `HTTPServer` becomes `http server`, `get_user2FA` becomes `get user 2 fa`.
//!
//! A section scores the best normalized Levenshtein similarity among its
//! keys. A pair is proposed when that score is strictly above
//! `SUGGESTION_THRESHOLD`. Matching is read-only.

#ifndef DOCSGUARD_HEURISTIC_MATCHER_HPP
#define DOCSGUARD_HEURISTIC_MATCHER_HPP

#include "model/entity.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace docsguard::heuristic {

/// Scores must be strictly greater than this to be proposed.
constexpr double SUGGESTION_THRESHOLD = 0.80;

/// Splits an identifier into lowercase words.
[[nodiscard]] auto split_identifier(std::string_view name) -> std::vector<std::string>;

[[nodiscard]] auto entity_key(const model::CodeEntity& entity) -> std::string;
/// Title key first, then the id key when it differs. Empty keys are dropped.
[[nodiscard]] auto section_keys(const model::DocSection& section) -> std::vector<std::string>;

/// Edit distance over bytes.
[[nodiscard]] auto levenshtein(std::string_view a, std::string_view b) -> size_t;

/// `1 - distance / max(len)`. Two empty strings score 1.0.
[[nodiscard]] auto similarity(std::string_view a, std::string_view b) -> double;

/// A proposed link.
struct Suggestion {
    size_t entity_index = 0; ///< Index into the entity list given to `suggest_links`
    std::string entity_name;
    model::SourceLocation location;
    std::string section_id;
    std::optional<std::string> section_title;
    double score = 0.0;
};

/// Proposes at most one section per unlinked entity, in entity order.
///
/// Sections already targeted by some entity are not candidates. Ties go to
/// the earliest section.
[[nodiscard]] auto suggest_links(const std::vector<model::CodeEntity>& entities,
                                 const std::vector<model::DocSection>& sections)
    -> std::vector<Suggestion>;

} // namespace docsguard::heuristic

#endif // DOCSGUARD_HEURISTIC_MATCHER_HPP
