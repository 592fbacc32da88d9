#include "run_lock.hpp"

#include <sys/file.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <format>
#include <functional>

namespace stackstop {

RunLock::RunLock(const std::filesystem::path& bench_dir) : lock_path_(get_lock_path(bench_dir)) {}

RunLock::~RunLock() {
    // The file stays; removing it would let a waiting run lock a different inode
    if (fd_ >= 0) {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
}

std::string RunLock::get_lock_path(const std::filesystem::path& bench_dir) {
    const size_t bench_hash = std::hash<std::string>{}(bench_dir.string());
    if (const char* runtime_dir = std::getenv("XDG_RUNTIME_DIR")) {
        return std::format("{}/stackstop-{:016x}.lock", runtime_dir, bench_hash);
    }
    return std::format("/tmp/stackstop-{}-{:016x}.lock", getuid(), bench_hash);
}

bool RunLock::try_acquire() {
    if (fd_ >= 0) {
        return true;
    }

    const int fd = open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return true;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int err = errno;
        close(fd);
        return err != EWOULDBLOCK;
    }

    fd_ = fd;
    return true;
}

} // namespace stackstop
