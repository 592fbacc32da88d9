#pragma once

#include <filesystem>
#include <string>

namespace stackstop {

// Keeps two shutdown runs from working on the same bench at once.
// An exclusive flock(2) on a per-bench lock file; the kernel drops it when
// the holder exits, so a crashed run never leaves the bench locked.
class RunLock {
public:
    explicit RunLock(const std::filesystem::path& bench_dir);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    // Never blocks. False only when another run holds the lock; a lock
    // file that cannot be opened leaves the run unguarded.
    bool try_acquire();

    [[nodiscard]] bool held() const { return fd_ >= 0; }
    [[nodiscard]] const std::string& lock_path() const { return lock_path_; }

    static std::string get_lock_path(const std::filesystem::path& bench_dir);

private:
    int fd_ = -1;
    std::string lock_path_;
};

} // namespace stackstop
