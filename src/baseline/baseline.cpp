//! # Baseline Engine Implementation

#include "baseline/baseline.hpp"

#include "baseline/fingerprint.hpp"
#include "log/log.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>

namespace docsguard::baseline {

// ============================================================================
// Snapshot
// ============================================================================

BaselineSnapshot::BaselineSnapshot(std::string generated_at, std::vector<BaselineEntry> entries)
    : generated_at_(std::move(generated_at)), entries_(std::move(entries)) {
    for (const auto& entry : entries_) {
        fingerprints_.insert(entry.fingerprint);
    }
}

auto BaselineSnapshot::contains(std::string_view fingerprint) const -> bool {
    return fingerprints_.count(std::string(fingerprint)) > 0;
}

auto status_name(FindingStatus status) -> const char* {
    switch (status) {
    case FindingStatus::Cold:
        return "cold";
    case FindingStatus::Known:
        return "known";
    case FindingStatus::New:
        return "new";
    }
    return "unknown";
}

auto apply_baseline(std::vector<model::ValidationResult> results,
                    const std::optional<BaselineSnapshot>& snapshot, model::Severity fail_on)
    -> BaselineOutcome {
    BaselineOutcome outcome;
    outcome.warm = snapshot.has_value();
    outcome.findings.reserve(results.size());

    for (auto& result : results) {
        ClassifiedFinding finding;
        finding.fingerprint = fingerprint(result);
        if (!snapshot) {
            finding.status = FindingStatus::Cold;
        } else if (snapshot->contains(finding.fingerprint)) {
            finding.status = FindingStatus::Known;
            ++outcome.counts.known;
        } else {
            finding.status = FindingStatus::New;
            ++outcome.counts.fresh;
        }

        switch (result.severity) {
        case model::Severity::Error:
            ++outcome.counts.errors;
            break;
        case model::Severity::Warning:
            ++outcome.counts.warnings;
            break;
        case model::Severity::Info:
            ++outcome.counts.infos;
            break;
        }

        finding.blocking = finding.status != FindingStatus::Known && result.severity >= fail_on;
        if (finding.blocking) {
            ++outcome.counts.blocking;
            outcome.has_blocking = true;
        }
        finding.result = std::move(result);
        outcome.findings.push_back(std::move(finding));
    }

    DOCSGUARD_LOG_INFO("baseline", (outcome.warm ? "warm" : "cold")
                                       << " run: " << outcome.findings.size() << " findings, "
                                       << outcome.counts.known << " known, "
                                       << outcome.counts.blocking << " blocking");
    return outcome;
}

auto make_snapshot(const std::vector<model::ValidationResult>& results, std::string generated_at)
    -> BaselineSnapshot {
    std::vector<BaselineEntry> entries;
    std::unordered_set<std::string> seen;
    for (const auto& result : results) {
        auto fp = fingerprint(result);
        if (!seen.insert(fp).second) {
            continue;
        }
        entries.push_back(BaselineEntry{std::move(fp), model::kind_name(result.kind),
                                        result.entity_name, result.doc_id.value_or("")});
    }
    return BaselineSnapshot(std::move(generated_at), std::move(entries));
}

auto unix_timestamp_now() -> std::string {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch())
                    .count();
    return "unix:" + std::to_string(secs);
}

// ============================================================================
// JSON Codec
// ============================================================================

auto snapshot_to_json(const BaselineSnapshot& snapshot) -> json::JsonValue {
    json::JsonArray entries;
    entries.reserve(snapshot.size());
    for (const auto& entry : snapshot.entries()) {
        json::JsonValue obj{json::JsonObject{}};
        obj.set("fingerprint", json::JsonValue(entry.fingerprint));
        obj.set("kind", json::JsonValue(entry.kind));
        obj.set("entity", json::JsonValue(entry.entity));
        obj.set("doc_id", json::JsonValue(entry.doc_id));
        entries.push_back(std::move(obj));
    }

    json::JsonValue root{json::JsonObject{}};
    root.set("version", json::JsonValue(BASELINE_VERSION));
    root.set("generated_at", json::JsonValue(snapshot.generated_at()));
    root.set("entries", json::JsonValue(std::move(entries)));
    return root;
}

namespace {

auto string_field(const json::JsonValue& obj, const std::string& key, std::string& out)
    -> bool {
    const json::JsonValue* value = obj.get(key);
    if (value == nullptr || !value->is_string()) {
        return false;
    }
    out = value->as_string();
    return true;
}

} // namespace

auto snapshot_from_json(const json::JsonValue& value) -> Result<BaselineSnapshot, std::string> {
    if (!value.is_object()) {
        return std::string("top-level value is not an object");
    }

    const json::JsonValue* version = value.get("version");
    if (version == nullptr || !version->is_integer()) {
        return std::string("missing or non-integer 'version'");
    }
    if (version->as_i64() != BASELINE_VERSION) {
        return "unsupported baseline version " + std::to_string(version->as_i64()) +
               " (expected " + std::to_string(BASELINE_VERSION) + ")";
    }

    std::string generated_at;
    if (!string_field(value, "generated_at", generated_at)) {
        return std::string("missing or non-string 'generated_at'");
    }

    const json::JsonValue* list = value.get("entries");
    if (list == nullptr || !list->is_array()) {
        return std::string("missing or non-array 'entries'");
    }

    std::vector<BaselineEntry> entries;
    entries.reserve(list->as_array().size());
    size_t index = 0;
    for (const auto& item : list->as_array()) {
        BaselineEntry entry;
        if (!item.is_object() || !string_field(item, "fingerprint", entry.fingerprint) ||
            entry.fingerprint.empty() || !string_field(item, "kind", entry.kind) ||
            !string_field(item, "entity", entry.entity) ||
            !string_field(item, "doc_id", entry.doc_id)) {
            return "malformed entry #" + std::to_string(index);
        }
        entries.push_back(std::move(entry));
        ++index;
    }
    return BaselineSnapshot(std::move(generated_at), std::move(entries));
}

// ============================================================================
// Store
// ============================================================================

auto load_baseline(const std::filesystem::path& path)
    -> Result<std::optional<BaselineSnapshot>, model::FileError> {
    std::string display = model::portable_path(path.string());

    std::error_code ec;
    bool present = std::filesystem::exists(path, ec);
    if (ec) {
        return model::FileError::baseline_corruption(display,
                                                     "cannot stat baseline file: " + ec.message());
    }
    if (!present) {
        DOCSGUARD_LOG_DEBUG("baseline", "no snapshot at " << display << ", running cold");
        return std::optional<BaselineSnapshot>{};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return model::FileError::baseline_corruption(display, "cannot read baseline file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto parsed = json::parse_json(buffer.str());
    if (is_err(parsed)) {
        return model::FileError::baseline_corruption(
            display, "malformed JSON: " + unwrap_err(parsed).to_string());
    }

    auto snapshot = snapshot_from_json(unwrap(parsed));
    if (is_err(snapshot)) {
        return model::FileError::baseline_corruption(display, unwrap_err(snapshot));
    }

    DOCSGUARD_LOG_INFO("baseline", "loaded " << unwrap(snapshot).size() << " entries from "
                                             << display);
    return std::optional<BaselineSnapshot>(std::move(unwrap(snapshot)));
}

auto save_baseline(const std::filesystem::path& path, const BaselineSnapshot& snapshot)
    -> Result<size_t, model::FileError> {
    std::string display = model::portable_path(path.string());

    auto write_error = [&](const std::string& message) {
        auto err = model::FileError::baseline_corruption(display, message);
        err.hint = "check that the baseline directory is writable";
        return err;
    };

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return write_error("cannot create directory: " + ec.message());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return write_error("cannot open baseline file for writing");
    }
    file << snapshot_to_json(snapshot).to_string_pretty(2) << '\n';
    file.close();
    if (!file) {
        return write_error("write failed");
    }

    DOCSGUARD_LOG_INFO("baseline", "wrote " << snapshot.size() << " entries to " << display);
    return snapshot.size();
}

} // namespace docsguard::baseline
