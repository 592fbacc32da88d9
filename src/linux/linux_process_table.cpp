#include "linux_process_table.hpp"

namespace stackstop {

LinuxProcessTable::LinuxProcessTable(ProcfsReader reader) : reader_(std::move(reader)) {}

std::vector<ProcessInfo> LinuxProcessTable::get_all_processes() {
    return reader_.get_all_processes();
}

} // namespace stackstop
