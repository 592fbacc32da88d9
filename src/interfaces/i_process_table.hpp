#pragma once

#include "../process_info.hpp"
#include <vector>

namespace stackstop {

class IProcessTable {
public:
    virtual ~IProcessTable() = default;

    // Snapshot of the processes currently running, in no particular order
    virtual std::vector<ProcessInfo> get_all_processes() = 0;
};

} // namespace stackstop
