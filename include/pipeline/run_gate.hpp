//! # Run Gate
//!
//! Discard-stale execution for watch mode. A pass is accepted only if none
//! of the watched files changed while it ran:
//!
//! ```text
//! stamp ──> pass ──> stamp ──> equal? ──yes──> accept
//!                                 └──no───> discard, start over
//! ```
//!
//! A stamp is the modification time and size of every watched file, plus
//! whether it exists.

#ifndef DOCSGUARD_PIPELINE_RUN_GATE_HPP
#define DOCSGUARD_PIPELINE_RUN_GATE_HPP

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace docsguard::pipeline {

struct FileStamp {
    std::filesystem::path path;
    bool exists = false;
    std::filesystem::file_time_type mtime{};
    std::uintmax_t size = 0;

    auto operator==(const FileStamp& other) const -> bool = default;
};

using StampSet = std::vector<FileStamp>;

[[nodiscard]] auto take_stamps(const std::vector<std::filesystem::path>& files) -> StampSet;

class RunGate {
public:
    using FileLister = std::function<std::vector<std::filesystem::path>()>;

    explicit RunGate(FileLister lister, size_t max_attempts = 5);

    /// Runs `pass` until one attempt completes over unchanged files.
    ///
    /// Returns false when every attempt was invalidated; the caller must then
    /// ignore whatever the last attempt produced.
    auto run(const std::function<void()>& pass) -> bool;

    /// True if the watched files differ from the stamps of the last accepted
    /// pass.
    [[nodiscard]] auto changed() const -> bool;

    [[nodiscard]] auto attempts() const -> size_t {
        return attempts_;
    }

private:
    FileLister lister_;
    size_t max_attempts_;
    size_t attempts_ = 0;
    StampSet last_;
};

} // namespace docsguard::pipeline

#endif // DOCSGUARD_PIPELINE_RUN_GATE_HPP
