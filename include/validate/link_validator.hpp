//! # Link Validator
//!
//! Cross-references code entities with documentation sections by id and
//! emits one ordered list of findings.
//!
//! ## Findings per Entity
//!
//! | Condition | Kind | Severity |
//! |-----------|------|----------|
//! | id resolves | `LinkVerified` | Info |
//! | id unknown | `LinkMissing` | Error |
//! | argument without parameter | `GhostArgument` | Warning |
//! | parameter without argument | `MissingArgument` | Warning |
//! | both typed, canonical types differ | `TypeMismatch` | Warning |
//!
//! Unlinked entities produce nothing. With `report_orphans`, every section no
//! entity targets yields an `OrphanSection` warning after all entity
//! findings.
//!
//! The validator performs no I/O and never fails: the only failure mode,
//! two sections sharing one id, is rejected by `SectionIndex::build`.

#ifndef DOCSGUARD_VALIDATE_LINK_VALIDATOR_HPP
#define DOCSGUARD_VALIDATE_LINK_VALIDATOR_HPP

#include "common.hpp"
#include "model/entity.hpp"
#include "types/type_normalizer.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace docsguard::validate {

/// Build-once id to section index.
class SectionIndex {
public:
    SectionIndex() = default;

    /// Indexes `sections`, keeping their order. Fails with `DuplicateDocId`
    /// when two sections share an id.
    [[nodiscard]] static auto build(std::vector<model::DocSection> sections)
        -> Result<SectionIndex, model::FileError>;

    /// Returns the section with `id`, or nullptr.
    [[nodiscard]] auto find(std::string_view id) const -> const model::DocSection*;

    [[nodiscard]] auto sections() const -> const std::vector<model::DocSection>& {
        return sections_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return sections_.size();
    }

private:
    std::vector<model::DocSection> sections_;
    std::unordered_map<std::string, size_t> by_id_;
};

struct ValidatorOptions {
    types::AliasTable aliases;
    bool report_orphans = false;
    std::string marker = "@docs-id";  ///< Used in LinkMissing hints
    std::string annotation = "@docs"; ///< Used in OrphanSection hints
};

/// Validates every entity against the index.
///
/// Findings are ordered by entity input order, then finding kind, then
/// parameter or argument order. Identical input gives identical output.
[[nodiscard]] auto validate_links(const std::vector<model::CodeEntity>& entities,
                                  const SectionIndex& index, const ValidatorOptions& options = {})
    -> std::vector<model::ValidationResult>;

/// Returns true if any finding has Error severity.
[[nodiscard]] auto has_errors(const std::vector<model::ValidationResult>& results) -> bool;

} // namespace docsguard::validate

#endif // DOCSGUARD_VALIDATE_LINK_VALIDATOR_HPP
