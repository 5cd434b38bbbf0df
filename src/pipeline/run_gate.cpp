#include "pipeline/run_gate.hpp"

#include "log/log.hpp"

#include <system_error>

namespace docsguard::pipeline {

auto take_stamps(const std::vector<std::filesystem::path>& files) -> StampSet {
    StampSet stamps;
    stamps.reserve(files.size());
    for (const auto& path : files) {
        FileStamp stamp;
        stamp.path = path;
        std::error_code ec;
        stamp.exists = std::filesystem::exists(path, ec) && !ec;
        if (stamp.exists) {
            stamp.mtime = std::filesystem::last_write_time(path, ec);
            if (ec) {
                stamp.mtime = {};
            }
            stamp.size = std::filesystem::file_size(path, ec);
            if (ec) {
                stamp.size = 0;
            }
        }
        stamps.push_back(std::move(stamp));
    }
    return stamps;
}

RunGate::RunGate(FileLister lister, size_t max_attempts)
    : lister_(std::move(lister)), max_attempts_(max_attempts == 0 ? 1 : max_attempts) {}

auto RunGate::run(const std::function<void()>& pass) -> bool {
    attempts_ = 0;
    while (attempts_ < max_attempts_) {
        ++attempts_;
        auto before = take_stamps(lister_());
        pass();
        auto after = take_stamps(lister_());
        if (before == after) {
            last_ = std::move(after);
            return true;
        }
        DOCSGUARD_LOG_INFO("watch", "files changed during pass " << attempts_
                                                                 << ", discarding result");
    }
    last_ = take_stamps(lister_());
    return false;
}

auto RunGate::changed() const -> bool {
    return take_stamps(lister_()) != last_;
}

} // namespace docsguard::pipeline
