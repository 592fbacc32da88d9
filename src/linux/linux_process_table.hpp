#pragma once

#include "../interfaces/i_process_table.hpp"
#include "../procfs_reader.hpp"

namespace stackstop {

class LinuxProcessTable : public IProcessTable {
public:
    explicit LinuxProcessTable(ProcfsReader reader = ProcfsReader());
    ~LinuxProcessTable() override = default;

    std::vector<ProcessInfo> get_all_processes() override;

private:
    ProcfsReader reader_;
};

} // namespace stackstop
