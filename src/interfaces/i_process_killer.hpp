#pragma once

#include <string>

namespace stackstop {

enum class SignalStatus {
    delivered,
    permission_denied,   // EPERM
    target_vanished,     // ESRCH
    failed,              // anything else
};

struct KillResult {
    SignalStatus status = SignalStatus::failed;
    std::string error_message;

    [[nodiscard]] bool delivered() const { return status == SignalStatus::delivered; }
};

class IProcessKiller {
public:
    virtual ~IProcessKiller() = default;

    // Zero-signal probe. Must not affect the target.
    virtual bool is_running(int pid) = 0;

    // SIGTERM when force is false, SIGKILL otherwise
    virtual KillResult kill_process(int pid, bool force) = 0;
};

} // namespace stackstop
