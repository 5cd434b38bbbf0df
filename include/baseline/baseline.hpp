//! # Baseline Engine
//!
//! Lets a project adopt docsguard without fixing every existing drift first.
//! A snapshot records the fingerprints of accepted findings; later runs
//! report those findings as `Known` and only block on new ones.
//!
//! ## Modes
//!
//! | Mode | Snapshot | Effect |
//! |------|----------|--------|
//! | Cold | absent | findings pass through, status `Cold` |
//! | Warm | loaded | fingerprint matches become `Known` and never block |
//! | Dump | written | every finding of the run is recorded |
//!
//! ## Store Format
//!
//! ```json
//! {
//!   "entries": [
//!     {"doc_id": "auth-login", "entity": "login",
//!      "fingerprint": "3f2a9c0d11e4b7a8", "kind": "LinkMissing"}
//!   ],
//!   "generated_at": "unix:1767225600",
//!   "version": 1
//! }
//! ```
//!
//! A missing file means cold mode. Anything unreadable, malformed or of
//! another version is a `BaselineCorruption` error.

#ifndef DOCSGUARD_BASELINE_BASELINE_HPP
#define DOCSGUARD_BASELINE_BASELINE_HPP

#include "common.hpp"
#include "json/json.hpp"
#include "model/entity.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace docsguard::baseline {

constexpr int64_t BASELINE_VERSION = 1;
constexpr const char* DEFAULT_BASELINE_PATH = ".docsguard/baseline.json";

// ============================================================================
// Snapshot
// ============================================================================

struct BaselineEntry {
    std::string fingerprint;
    std::string kind;
    std::string entity;
    std::string doc_id;
};

/// An immutable set of accepted findings.
class BaselineSnapshot {
public:
    BaselineSnapshot() = default;
    BaselineSnapshot(std::string generated_at, std::vector<BaselineEntry> entries);

    [[nodiscard]] auto contains(std::string_view fingerprint) const -> bool;

    [[nodiscard]] auto entries() const -> const std::vector<BaselineEntry>& {
        return entries_;
    }

    [[nodiscard]] auto generated_at() const -> const std::string& {
        return generated_at_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

private:
    std::string generated_at_;
    std::vector<BaselineEntry> entries_;
    std::unordered_set<std::string> fingerprints_;
};

// ============================================================================
// Classification
// ============================================================================

enum class FindingStatus { Cold, Known, New };

[[nodiscard]] auto status_name(FindingStatus status) -> const char*;

struct ClassifiedFinding {
    model::ValidationResult result;
    FindingStatus status = FindingStatus::Cold;
    bool blocking = false;
    std::string fingerprint;
};

struct FindingCounts {
    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;
    size_t known = 0;
    size_t fresh = 0; ///< `New` findings (warm mode only)
    size_t blocking = 0;
};

struct BaselineOutcome {
    std::vector<ClassifiedFinding> findings;
    FindingCounts counts;
    bool has_blocking = false;
    bool warm = false;
};

/// Classifies a run's findings against an optional snapshot.
///
/// A finding blocks when it is not `Known` and its severity is at least
/// `fail_on`. Order is preserved.
[[nodiscard]] auto apply_baseline(std::vector<model::ValidationResult> results,
                                  const std::optional<BaselineSnapshot>& snapshot,
                                  model::Severity fail_on = model::Severity::Error)
    -> BaselineOutcome;

/// Builds a snapshot of every finding, Info included. Duplicate
/// fingerprints are recorded once.
[[nodiscard]] auto make_snapshot(const std::vector<model::ValidationResult>& results,
                                 std::string generated_at) -> BaselineSnapshot;

/// Returns "unix:<seconds since epoch>".
[[nodiscard]] auto unix_timestamp_now() -> std::string;

// ============================================================================
// Store
// ============================================================================

[[nodiscard]] auto snapshot_to_json(const BaselineSnapshot& snapshot) -> json::JsonValue;

/// Decodes a snapshot. The error names the offending field.
[[nodiscard]] auto snapshot_from_json(const json::JsonValue& value)
    -> Result<BaselineSnapshot, std::string>;

/// Loads the store at `path`. Returns nullopt when the file does not exist.
[[nodiscard]] auto load_baseline(const std::filesystem::path& path)
    -> Result<std::optional<BaselineSnapshot>, model::FileError>;

/// Writes the store, creating parent directories. Returns the entry count.
[[nodiscard]] auto save_baseline(const std::filesystem::path& path,
                                 const BaselineSnapshot& snapshot)
    -> Result<size_t, model::FileError>;

} // namespace docsguard::baseline

#endif // DOCSGUARD_BASELINE_BASELINE_HPP
