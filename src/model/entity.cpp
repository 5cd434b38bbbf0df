#include "model/entity.hpp"

#include <algorithm>

namespace docsguard::model {

auto FileError::parse_failure(std::string file, size_t line, std::string message,
                              std::string hint) -> FileError {
    FileError err;
    err.kind = FileErrorKind::ParseFailure;
    err.file = std::move(file);
    err.line = line;
    err.message = std::move(message);
    err.hint = std::move(hint);
    return err;
}

auto FileError::duplicate_doc_id(std::string file, size_t line, std::string message,
                                 std::vector<std::string> ids) -> FileError {
    FileError err;
    err.kind = FileErrorKind::DuplicateDocId;
    err.file = std::move(file);
    err.line = line;
    err.message = std::move(message);
    err.hint = "give every section marker a distinct id; links to this document are "
               "not validated until the collision is resolved";
    err.ids = std::move(ids);
    return err;
}

auto FileError::baseline_corruption(std::string file, std::string message) -> FileError {
    FileError err;
    err.kind = FileErrorKind::BaselineCorruption;
    err.file = std::move(file);
    err.message = std::move(message);
    err.hint = "restore the file from version control or regenerate it with "
               "`docsguard baseline`";
    return err;
}

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Info:
        return "info";
    case Severity::Warning:
        return "warning";
    case Severity::Error:
        return "error";
    }
    return "unknown";
}

auto parse_severity(std::string_view name) -> std::optional<Severity> {
    if (name == "info")
        return Severity::Info;
    if (name == "warning" || name == "warn")
        return Severity::Warning;
    if (name == "error")
        return Severity::Error;
    return std::nullopt;
}

auto kind_name(FindingKind kind) -> const char* {
    switch (kind) {
    case FindingKind::LinkVerified:
        return "LinkVerified";
    case FindingKind::LinkMissing:
        return "LinkMissing";
    case FindingKind::GhostArgument:
        return "GhostArgument";
    case FindingKind::MissingArgument:
        return "MissingArgument";
    case FindingKind::TypeMismatch:
        return "TypeMismatch";
    case FindingKind::OrphanSection:
        return "OrphanSection";
    }
    return "Unknown";
}

auto parse_finding_kind(std::string_view name) -> std::optional<FindingKind> {
    static constexpr FindingKind ALL[] = {
        FindingKind::LinkVerified,    FindingKind::LinkMissing,  FindingKind::GhostArgument,
        FindingKind::MissingArgument, FindingKind::TypeMismatch, FindingKind::OrphanSection,
    };
    for (auto kind : ALL) {
        if (name == kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

auto file_error_kind_name(FileErrorKind kind) -> const char* {
    switch (kind) {
    case FileErrorKind::ParseFailure:
        return "ParseFailure";
    case FileErrorKind::DuplicateDocId:
        return "DuplicateDocId";
    case FileErrorKind::BaselineCorruption:
        return "BaselineCorruption";
    }
    return "Unknown";
}

auto portable_path(std::string_view path) -> std::string {
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

} // namespace docsguard::model
