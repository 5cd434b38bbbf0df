//! # Link Validator Implementation

#include "validate/link_validator.hpp"

#include "heuristic/matcher.hpp"
#include "log/log.hpp"

#include <unordered_set>

namespace docsguard::validate {

using model::FindingKind;
using model::Severity;
using model::ValidationResult;

// ============================================================================
// Section Index
// ============================================================================

auto SectionIndex::build(std::vector<model::DocSection> sections)
    -> Result<SectionIndex, model::FileError> {
    SectionIndex index;
    index.by_id_.reserve(sections.size());
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& section = sections[i];
        auto [it, inserted] = index.by_id_.emplace(section.id, i);
        if (!inserted) {
            const auto& first = sections[it->second];
            return model::FileError::duplicate_doc_id(
                section.file, section.line,
                "documentation id '" + section.id + "' is declared twice (" + first.file + ":" +
                    std::to_string(first.line) + " and " + section.file + ":" +
                    std::to_string(section.line) + ")",
                {section.id});
        }
    }
    index.sections_ = std::move(sections);
    return index;
}

auto SectionIndex::find(std::string_view id) const -> const model::DocSection* {
    auto it = by_id_.find(std::string(id));
    return it == by_id_.end() ? nullptr : &sections_[it->second];
}

// ============================================================================
// Finding Builders
// ============================================================================

namespace {

auto section_label(const model::DocSection& section) -> std::string {
    return "'" + section.id + "' (" + section.file + ":" + std::to_string(section.line) + ")";
}

auto base_result(const model::CodeEntity& entity, FindingKind kind, Severity severity)
    -> ValidationResult {
    ValidationResult result;
    result.kind = kind;
    result.severity = severity;
    result.location = {model::portable_path(entity.file), entity.line};
    result.entity_name = entity.name;
    result.doc_id = entity.doc_id;
    return result;
}

/// Closest existing id to a dangling one.
auto closest_id(std::string_view missing, const SectionIndex& index) -> std::optional<std::string> {
    const model::DocSection* best = nullptr;
    double best_score = 0.0;
    for (const auto& section : index.sections()) {
        double score = heuristic::similarity(missing, section.id);
        if (score > heuristic::SUGGESTION_THRESHOLD && (best == nullptr || score > best_score)) {
            best = &section;
            best_score = score;
        }
    }
    if (best == nullptr) {
        return std::nullopt;
    }
    return best->id;
}

auto link_missing(const model::CodeEntity& entity, const SectionIndex& index,
                  const ValidatorOptions& options) -> ValidationResult {
    auto result = base_result(entity, FindingKind::LinkMissing, Severity::Error);
    const auto& id = *entity.doc_id;
    result.message = "documentation id '" + id + "' was not found in any documentation file";
    result.suggested_id = closest_id(id, index);
    if (result.suggested_id) {
        result.hint = "did you mean '" + *result.suggested_id + "'? otherwise add `<!-- " +
                      options.marker + ": " + id + " -->` above the section that documents " +
                      entity.name;
    } else {
        result.hint = "add `<!-- " + options.marker + ": " + id +
                      " -->` above the section that documents " + entity.name;
    }
    return result;
}

auto link_verified(const model::CodeEntity& entity, const model::DocSection& section)
    -> ValidationResult {
    auto result = base_result(entity, FindingKind::LinkVerified, Severity::Info);
    result.section_title = section.title;
    result.message = "linked to documentation section " + section_label(section);
    return result;
}

auto find_arg(const model::DocSection& section, std::string_view name) -> const model::Arg* {
    for (const auto& arg : section.args) {
        if (arg.name == name) {
            return &arg;
        }
    }
    return nullptr;
}

auto has_param(const model::CodeEntity& entity, std::string_view name) -> bool {
    for (const auto& param : entity.params) {
        if (param.name == name) {
            return true;
        }
    }
    return false;
}

} // namespace

// ============================================================================
// Validation
// ============================================================================

auto validate_links(const std::vector<model::CodeEntity>& entities, const SectionIndex& index,
                    const ValidatorOptions& options) -> std::vector<ValidationResult> {
    std::vector<ValidationResult> results;
    std::unordered_set<std::string> targeted;

    for (const auto& entity : entities) {
        if (!entity.doc_id) {
            continue;
        }
        const auto& id = *entity.doc_id;
        targeted.insert(id);

        const model::DocSection* section = index.find(id);
        if (section == nullptr) {
            DOCSGUARD_LOG_DEBUG("validate", entity.name << ": missing id '" << id << "'");
            results.push_back(link_missing(entity, index, options));
            continue;
        }
        results.push_back(link_verified(entity, *section));

        std::string where = "section " + section_label(*section);

        for (const auto& arg : section->args) {
            if (has_param(entity, arg.name)) {
                continue;
            }
            auto result = base_result(entity, FindingKind::GhostArgument, Severity::Warning);
            result.section_title = section->title;
            result.subject = arg.name;
            result.message = "documented argument '" + arg.name +
                             "' does not exist in the signature of " + entity.name;
            result.hint = "remove '" + arg.name + "' from " + where +
                          " or rename it to match a parameter";
            results.push_back(std::move(result));
        }

        for (const auto& param : entity.params) {
            if (find_arg(*section, param.name) != nullptr) {
                continue;
            }
            auto result = base_result(entity, FindingKind::MissingArgument, Severity::Warning);
            result.section_title = section->title;
            result.subject = param.name;
            result.message = "parameter '" + param.name + "' is not documented in " + where;
            result.hint = "document `" + param.name + "` in " + where;
            results.push_back(std::move(result));
        }

        for (const auto& param : entity.params) {
            const model::Arg* arg = find_arg(*section, param.name);
            if (arg == nullptr || !param.type || !arg->type) {
                continue;
            }
            auto code_type = types::normalize(*param.type, options.aliases);
            auto doc_type = types::normalize(*arg->type, options.aliases);
            if (code_type == types::CanonicalType::Unknown ||
                doc_type == types::CanonicalType::Unknown || code_type == doc_type) {
                continue;
            }
            auto result = base_result(entity, FindingKind::TypeMismatch, Severity::Warning);
            result.section_title = section->title;
            result.subject = param.name;
            result.code_type = types::canonical_name(code_type);
            result.doc_type = types::canonical_name(doc_type);
            result.message = "parameter '" + param.name + "' is declared as `" + *param.type +
                             "` (" + *result.code_type + ") but documented as `" + *arg->type +
                             "` (" + *result.doc_type + ")";
            result.hint = "update the documented type of '" + param.name + "' in " + where +
                          " or the declaration";
            results.push_back(std::move(result));
        }
    }

    if (options.report_orphans) {
        for (const auto& section : index.sections()) {
            if (targeted.count(section.id) > 0) {
                continue;
            }
            ValidationResult result;
            result.kind = FindingKind::OrphanSection;
            result.severity = Severity::Warning;
            result.location = {model::portable_path(section.file), section.line};
            result.doc_id = section.id;
            result.section_title = section.title;
            result.message =
                "documentation section '" + section.id + "' is not referenced by any code entity";
            result.hint = "link a declaration with `" + options.annotation + ": [" + section.id +
                          "]` or remove the section";
            results.push_back(std::move(result));
        }
    }

    DOCSGUARD_LOG_INFO("validate", entities.size() << " entities, " << index.size()
                                                   << " sections, " << results.size()
                                                   << " findings");
    return results;
}

auto has_errors(const std::vector<ValidationResult>& results) -> bool {
    for (const auto& result : results) {
        if (result.severity == Severity::Error) {
            return true;
        }
    }
    return false;
}

} // namespace docsguard::validate
