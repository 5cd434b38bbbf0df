//! # Report Renderer Implementation

#include "report/renderer.hpp"

#include <cstdio>

namespace docsguard::report {

namespace {

auto paint(const std::string& text, const char* color, bool colors) -> std::string {
    if (!colors) {
        return text;
    }
    return std::string(color) + text + Colors::Reset;
}

auto severity_color(model::Severity severity) -> const char* {
    switch (severity) {
    case model::Severity::Error:
        return Colors::Red;
    case model::Severity::Warning:
        return Colors::Yellow;
    case model::Severity::Info:
        return Colors::Cyan;
    }
    return Colors::Reset;
}

auto location_text(const std::string& file, size_t line) -> std::string {
    std::string path = model::portable_path(file);
    return line > 0 ? path + ":" + std::to_string(line) : path;
}

auto plural(size_t n, const char* word) -> std::string {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

auto opt_string(const std::optional<std::string>& value) -> json::JsonValue {
    return value ? json::JsonValue(*value) : json::JsonValue(nullptr);
}

auto count(size_t n) -> json::JsonValue {
    return json::JsonValue(static_cast<int64_t>(n));
}

} // namespace

auto severity_marker(model::Severity severity) -> const char* {
    switch (severity) {
    case model::Severity::Error:
        return "[X]";
    case model::Severity::Warning:
        return "[!]";
    case model::Severity::Info:
        return "[i]";
    }
    return "[?]";
}

// ============================================================================
// Text
// ============================================================================

auto render_finding(const model::ValidationResult& result, baseline::FindingStatus status,
                    bool colors) -> std::string {
    bool orphan = result.kind == model::FindingKind::OrphanSection;

    std::string head = std::string(severity_marker(result.severity)) + " " +
                       model::severity_name(result.severity) + "[" +
                       model::kind_name(result.kind) + "]";
    std::string subject = orphan ? "section '" + result.doc_id.value_or("") + "'"
                                 : "fn " + result.entity_name;

    std::string out = paint(head, severity_color(result.severity), colors) + " " + subject + " " +
                      paint("(" + location_text(result.location.file, result.location.line) + ")",
                            Colors::Dim, colors);
    if (status == baseline::FindingStatus::Known) {
        out += paint(" (baseline)", Colors::Dim, colors);
    }
    out += "\n";

    out += "    -> " + result.message + "\n";

    std::string detail;
    if (result.doc_id) {
        detail = std::string(orphan ? "section id '" : "linked id '") + *result.doc_id + "'";
    } else {
        detail = "no linked id";
    }
    if (!result.hint.empty()) {
        detail += "; fix: " + result.hint;
    }
    out += "    -> " + detail + "\n";
    return out;
}

auto render_file_error(const model::FileError& error, bool colors) -> std::string {
    std::string head = std::string("[X] error[") + model::file_error_kind_name(error.kind) + "]";
    std::string out = paint(head, Colors::Red, colors) + " file " +
                      paint("(" + location_text(error.file, error.line) + ")", Colors::Dim, colors) +
                      "\n";
    out += "    -> " + error.message + "\n";

    std::string detail;
    if (!error.ids.empty()) {
        detail = "ids: ";
        for (size_t i = 0; i < error.ids.size(); ++i) {
            detail += (i > 0 ? ", " : "") + error.ids[i];
        }
        detail += "; ";
    }
    detail += "fix: " + (error.hint.empty() ? std::string("see the message above") : error.hint);
    out += "    -> " + detail + "\n";
    return out;
}

auto render_suggestion(const heuristic::Suggestion& suggestion, bool colors) -> std::string {
    char score[16];
    std::snprintf(score, sizeof(score), "%.2f", suggestion.score);

    std::string out = paint("[?] suggestion", Colors::Cyan, colors) + " fn " +
                      suggestion.entity_name + " " +
                      paint("(" + location_text(suggestion.location.file, suggestion.location.line) +
                                ")",
                            Colors::Dim, colors) +
                      "\n";
    out += "    -> looks like section '" + suggestion.section_id + "'";
    if (suggestion.section_title) {
        out += " \"" + *suggestion.section_title + "\"";
    }
    out += " (similarity " + std::string(score) + ")\n";
    return out;
}

auto render_summary(const baseline::BaselineOutcome& outcome, size_t file_errors, bool colors)
    -> std::string {
    const auto& c = outcome.counts;
    std::string out = "summary: " + plural(c.errors, "error") + ", " +
                      plural(c.warnings, "warning") + ", " + std::to_string(c.infos) +
                      " verified\n";
    if (outcome.warm) {
        out += "baseline: " + std::to_string(c.known) + " known, " + std::to_string(c.fresh) +
               " new\n";
    }
    if (file_errors > 0) {
        out += "file errors: " + std::to_string(file_errors) + "\n";
    }

    if (file_errors > 0) {
        out += "result: " + paint("aborted", Colors::Red, colors) + " (" +
               plural(file_errors, "file error") + ")\n";
    } else if (outcome.has_blocking) {
        out += "result: " + paint("FAILED", Colors::Red, colors) + " (" +
               std::to_string(c.blocking) + " blocking)\n";
    } else {
        out += "result: " + paint("passed", Colors::Green, colors) + "\n";
    }
    return out;
}

// ============================================================================
// JSON
// ============================================================================

auto finding_to_json(const baseline::ClassifiedFinding& finding) -> json::JsonValue {
    const auto& r = finding.result;
    json::JsonValue obj{json::JsonObject{}};
    obj.set("severity", json::JsonValue(model::severity_name(r.severity)));
    obj.set("kind", json::JsonValue(model::kind_name(r.kind)));
    obj.set("file", json::JsonValue(model::portable_path(r.location.file)));
    obj.set("line", count(r.location.line));
    obj.set("entity", json::JsonValue(r.entity_name));
    obj.set("doc_id", opt_string(r.doc_id));
    obj.set("subject", r.subject.empty() ? json::JsonValue(nullptr) : json::JsonValue(r.subject));
    obj.set("message", json::JsonValue(r.message));
    obj.set("hint", json::JsonValue(r.hint));
    obj.set("suggested_id", opt_string(r.suggested_id));
    obj.set("code_type", opt_string(r.code_type));
    obj.set("doc_type", opt_string(r.doc_type));
    obj.set("status", json::JsonValue(baseline::status_name(finding.status)));
    obj.set("blocking", json::JsonValue(finding.blocking));
    obj.set("fingerprint", json::JsonValue(finding.fingerprint));
    return obj;
}

auto file_error_to_json(const model::FileError& error) -> json::JsonValue {
    json::JsonArray ids;
    for (const auto& id : error.ids) {
        ids.push_back(json::JsonValue(id));
    }
    json::JsonValue obj{json::JsonObject{}};
    obj.set("kind", json::JsonValue(model::file_error_kind_name(error.kind)));
    obj.set("file", json::JsonValue(model::portable_path(error.file)));
    obj.set("line", count(error.line));
    obj.set("message", json::JsonValue(error.message));
    obj.set("hint", json::JsonValue(error.hint));
    obj.set("ids", json::JsonValue(std::move(ids)));
    return obj;
}

auto findings_to_json(const baseline::BaselineOutcome& outcome,
                      const std::vector<model::FileError>& errors) -> json::JsonValue {
    json::JsonArray findings;
    for (const auto& finding : outcome.findings) {
        findings.push_back(finding_to_json(finding));
    }
    json::JsonArray file_errors;
    for (const auto& error : errors) {
        file_errors.push_back(file_error_to_json(error));
    }

    json::JsonValue counts{json::JsonObject{}};
    counts.set("errors", count(outcome.counts.errors));
    counts.set("warnings", count(outcome.counts.warnings));
    counts.set("infos", count(outcome.counts.infos));
    counts.set("known", count(outcome.counts.known));
    counts.set("new", count(outcome.counts.fresh));
    counts.set("blocking", count(outcome.counts.blocking));

    json::JsonValue root{json::JsonObject{}};
    root.set("version", json::JsonValue(VERSION));
    root.set("baseline", json::JsonValue(outcome.warm ? "warm" : "cold"));
    root.set("findings", json::JsonValue(std::move(findings)));
    root.set("file_errors", json::JsonValue(std::move(file_errors)));
    root.set("counts", std::move(counts));
    root.set("has_blocking", json::JsonValue(outcome.has_blocking));
    return root;
}

} // namespace docsguard::report
