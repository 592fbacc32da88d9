#include "linux_process_killer.hpp"
#include <format>
#include <csignal>
#include <cerrno>
#include <cstring>

namespace stackstop {

LinuxProcessKiller::LinuxProcessKiller(ProcfsReader reader) : reader_(std::move(reader)) {}

std::string LinuxProcessKiller::get_kill_error_message(int err) {
    switch (err) {
        case EPERM:
            return "Permission denied. You may need root privileges or CAP_KILL capability to signal this process.";
        case ESRCH:
            return "Process not found. It may have already terminated.";
        case EINVAL:
            return "Invalid signal.";
        default:
            return std::format("Failed to send signal: {} (errno {})", strerror(err), err);
    }
}

SignalStatus LinuxProcessKiller::status_from_errno(int err) {
    switch (err) {
        case EPERM:
            return SignalStatus::permission_denied;
        case ESRCH:
            return SignalStatus::target_vanished;
        default:
            return SignalStatus::failed;
    }
}

bool LinuxProcessKiller::is_running(int pid) {
    if (pid <= 0) {
        return false;
    }

    // EPERM means the pid exists but belongs to someone else
    if (kill(pid, 0) == -1 && errno != EPERM) {
        return false;
    }

    // A zombie still answers the probe but has already exited
    if (const auto info = reader_.get_process_info(pid); info && info->state_char == 'Z') {
        return false;
    }
    return true;
}

KillResult LinuxProcessKiller::kill_process(int pid, bool force) {
    KillResult result;

    if (pid <= 0) {
        result.status = SignalStatus::failed;
        result.error_message = "Invalid PID";
        return result;
    }

    const int signal = force ? SIGKILL : SIGTERM;
    if (kill(pid, signal) == -1) {
        const int err = errno;
        result.status = status_from_errno(err);
        result.error_message = get_kill_error_message(err);
        return result;
    }

    result.status = SignalStatus::delivered;
    return result;
}

} // namespace stackstop
