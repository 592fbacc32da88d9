#pragma once

#include "../interfaces/i_process_killer.hpp"
#include "../procfs_reader.hpp"

namespace stackstop {

class LinuxProcessKiller : public IProcessKiller {
public:
    explicit LinuxProcessKiller(ProcfsReader reader = ProcfsReader());
    ~LinuxProcessKiller() override = default;

    bool is_running(int pid) override;
    KillResult kill_process(int pid, bool force) override;

private:
    static std::string get_kill_error_message(int err);
    static SignalStatus status_from_errno(int err);

    ProcfsReader reader_;
};

} // namespace stackstop
