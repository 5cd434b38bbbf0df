//! # Check Pipeline Implementation

#include "pipeline/pipeline.hpp"

#include "code/decl_scanner.hpp"
#include "code/entity_extractor.hpp"
#include "doc/section_extractor.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <sstream>
#include <system_error>

namespace docsguard::pipeline {

namespace fs = std::filesystem;

auto options_from_config(const config::Config& config, const fs::path& project_root)
    -> PipelineOptions {
    PipelineOptions options;
    options.project_root = project_root;
    options.validator.aliases = config.aliases;
    options.validator.report_orphans = config.report_orphans;
    options.validator.marker = config.marker;
    options.validator.annotation = config.annotation;
    return options;
}

// ============================================================================
// Inputs
// ============================================================================

auto is_documentation_path(const fs::path& path) -> bool {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".md" || ext == ".markdown";
}

auto is_skipped_directory(const std::string& name) -> bool {
    if (name.size() > 1 && name[0] == '.' && name != "..") {
        return true;
    }
    return name == "node_modules" || name == "target" || name == "build" || name == "dist";
}

auto InputSet::all_files() const -> std::vector<fs::path> {
    std::vector<fs::path> files = sources;
    files.insert(files.end(), documents.begin(), documents.end());
    return files;
}

namespace {

auto missing_path_error(const std::string& path, const std::string& message) -> model::FileError {
    return model::FileError::parse_failure(model::portable_path(path), 0, message,
                                           "check the path given on the command line");
}

/// Walks `dir`, returning documentation and source files in sorted order.
void walk_directory(const fs::path& dir, std::vector<fs::path>& found, InputSet& inputs) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        inputs.errors.push_back(missing_path_error(dir.string(), "cannot read directory: " +
                                                                     ec.message()));
        return;
    }
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            DOCSGUARD_LOG_WARN("pipeline", "walk of " << dir.string()
                                                      << " stopped: " << ec.message());
            break;
        }
        const auto& entry = *it;
        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (is_skipped_directory(entry.path().filename().string())) {
                DOCSGUARD_LOG_TRACE("pipeline", "skipping " << entry.path().string());
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(type_ec)) {
            continue;
        }
        const auto& path = entry.path();
        if (is_documentation_path(path) || code::language_for_path(path.string())) {
            found.push_back(path);
        }
    }
}

void classify(const fs::path& path, InputSet& inputs) {
    if (is_documentation_path(path)) {
        inputs.documents.push_back(path);
    } else if (code::language_for_path(path.string())) {
        inputs.sources.push_back(path);
    }
}

} // namespace

auto collect_inputs(const std::vector<std::string>& paths) -> InputSet {
    InputSet inputs;
    std::set<std::string> seen;

    auto add = [&](const fs::path& path) {
        auto key = path.lexically_normal().generic_string();
        if (seen.insert(key).second) {
            classify(path, inputs);
        }
    };

    for (const auto& raw : paths) {
        fs::path path(raw);
        std::error_code ec;
        auto status = fs::status(path, ec);
        if (ec || !fs::exists(status)) {
            inputs.errors.push_back(missing_path_error(raw, "no such file or directory"));
            continue;
        }

        if (fs::is_directory(status)) {
            std::vector<fs::path> found;
            walk_directory(path, found, inputs);
            std::sort(found.begin(), found.end(), [](const fs::path& a, const fs::path& b) {
                return a.generic_string() < b.generic_string();
            });
            for (const auto& file : found) {
                add(file);
            }
            continue;
        }

        if (!is_documentation_path(path) && !code::language_for_path(raw)) {
            inputs.errors.push_back(model::FileError::parse_failure(
                model::portable_path(raw), 0, "unsupported file extension",
                "pass .rs, .ts, .tsx, .js, .jsx or .md files, or a directory"));
            continue;
        }
        add(path);
    }

    DOCSGUARD_LOG_INFO("pipeline", "collected " << inputs.sources.size() << " source files and "
                                                << inputs.documents.size() << " documents");
    return inputs;
}

auto read_input_file(const fs::path& path, const std::string& display)
    -> Result<std::string, model::FileError> {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return model::FileError::parse_failure(display, 0, "cannot read file: " + ec.message(),
                                               "check that the file exists and is readable");
    }
    if (size > MAX_FILE_BYTES) {
        return model::FileError::parse_failure(
            display, 0,
            "file is " + std::to_string(size) + " bytes, over the " +
                std::to_string(MAX_FILE_BYTES) + " byte limit",
            "exclude generated or bundled files from the checked paths");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return model::FileError::parse_failure(display, 0, "cannot open file",
                                               "check that the file is readable");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto display_path(const fs::path& path, const fs::path& root) -> std::string {
    std::error_code ec;
    auto abs_path = fs::absolute(path, ec);
    auto abs_root = fs::absolute(root, ec);
    if (!ec) {
        auto rel = abs_path.lexically_normal().lexically_relative(abs_root.lexically_normal());
        auto text = rel.generic_string();
        if (!rel.empty() && !text.starts_with("..")) {
            return text;
        }
    }
    return model::portable_path(path.lexically_normal().generic_string());
}

// ============================================================================
// Scanning
// ============================================================================

void drop_cross_document_duplicates(std::vector<model::DocSection>& sections,
                                    std::vector<model::FileError>& errors,
                                    std::set<std::string>& blocked_ids) {
    std::map<std::string, const model::DocSection*> first_seen;
    std::set<std::string> colliding;
    for (const auto& section : sections) {
        auto [it, inserted] = first_seen.emplace(section.id, &section);
        if (inserted || it->second->file == section.file) {
            continue;
        }
        const auto& first = *it->second;
        errors.push_back(model::FileError::duplicate_doc_id(
            section.file, section.line,
            "documentation id '" + section.id + "' is also declared in " + first.file + ":" +
                std::to_string(first.line),
            {section.id}));
        colliding.insert(section.id);
    }
    if (colliding.empty()) {
        return;
    }

    blocked_ids.insert(colliding.begin(), colliding.end());
    sections.erase(std::remove_if(sections.begin(), sections.end(),
                                  [&](const model::DocSection& s) {
                                      return colliding.count(s.id) > 0;
                                  }),
                   sections.end());
}

auto scan_inputs(const InputSet& inputs, const PipelineOptions& options) -> ScanResult {
    ScanResult scan;
    scan.errors = inputs.errors;

    doc::SectionOptions section_options;
    section_options.marker = options.validator.marker;

    for (const auto& path : inputs.documents) {
        auto display = display_path(path, options.project_root);
        auto text = read_input_file(path, display);
        if (is_err(text)) {
            scan.errors.push_back(std::move(unwrap_err(text)));
            continue;
        }
        ++scan.document_files;

        auto sections = doc::extract_sections_from_text(unwrap(text), display, section_options);
        if (is_err(sections)) {
            auto& err = unwrap_err(sections);
            DOCSGUARD_LOG_WARN("pipeline", display << ": " << err.message);
            scan.blocked_ids.insert(err.ids.begin(), err.ids.end());
            scan.errors.push_back(std::move(err));
            continue;
        }
        for (auto& section : unwrap(sections)) {
            scan.sections.push_back(std::move(section));
        }
    }

    // A blocked id must not resolve through some other document either
    if (!scan.blocked_ids.empty()) {
        scan.sections.erase(std::remove_if(scan.sections.begin(), scan.sections.end(),
                                           [&](const model::DocSection& s) {
                                               return scan.blocked_ids.count(s.id) > 0;
                                           }),
                            scan.sections.end());
    }
    drop_cross_document_duplicates(scan.sections, scan.errors, scan.blocked_ids);

    code::AnnotationOptions annotation;
    annotation.token = options.validator.annotation;

    for (const auto& path : inputs.sources) {
        auto display = display_path(path, options.project_root);
        auto lang = code::language_for_path(path.string());
        if (!lang) {
            scan.errors.push_back(model::FileError::parse_failure(
                display, 0, "unsupported file extension", "pass a .rs, .ts or .js file"));
            continue;
        }
        auto text = read_input_file(path, display);
        if (is_err(text)) {
            scan.errors.push_back(std::move(unwrap_err(text)));
            continue;
        }
        ++scan.source_files;

        auto decls = code::scan_declarations(unwrap(text), *lang);
        if (is_err(decls)) {
            const auto& err = unwrap_err(decls);
            DOCSGUARD_LOG_WARN("pipeline", display << ":" << err.line << ": " << err.message);
            scan.errors.push_back(model::FileError::parse_failure(
                display, err.line, err.message,
                "fix the " + std::string(code::language_name(*lang)) +
                    " syntax; no entity of this file was checked"));
            continue;
        }
        auto entities = code::extract_entities(unwrap(decls), display, *lang, annotation);
        for (auto& entity : entities) {
            scan.entities.push_back(std::move(entity));
        }
    }

    DOCSGUARD_LOG_INFO("pipeline", "scanned " << scan.entities.size() << " entities, "
                                              << scan.sections.size() << " sections, "
                                              << scan.errors.size() << " file errors");
    return scan;
}

// ============================================================================
// Validation
// ============================================================================

auto run_validation(const ScanResult& scan, const PipelineOptions& options)
    -> Result<std::vector<model::ValidationResult>, model::FileError> {
    auto index = validate::SectionIndex::build(scan.sections);
    if (is_err(index)) {
        return std::move(unwrap_err(index));
    }

    std::vector<model::CodeEntity> entities;
    entities.reserve(scan.entities.size());
    for (const auto& entity : scan.entities) {
        if (entity.doc_id && scan.blocked_ids.count(*entity.doc_id) > 0) {
            DOCSGUARD_LOG_DEBUG("pipeline", entity.name << " links to blocked id '"
                                                        << *entity.doc_id << "', not validated");
            continue;
        }
        entities.push_back(entity);
    }
    return validate::validate_links(entities, unwrap(index), options.validator);
}

} // namespace docsguard::pipeline
