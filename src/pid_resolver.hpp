#pragma once

#include "interfaces/i_port_lookup.hpp"
#include "interfaces/i_process_killer.hpp"
#include "interfaces/i_process_table.hpp"
#include "reporter.hpp"
#include "role.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace stackstop {

enum class ResolutionStrategy {
    pid_file,
    port,
    pattern,
};

std::string_view to_string(ResolutionStrategy strategy);

struct Resolution {
    int pid = 0;
    ResolutionStrategy strategy = ResolutionStrategy::pid_file;
};

// Finds the live process behind a role. Never touches files or processes;
// every lookup is fresh.
class PidResolver {
public:
    // Does not own its collaborators
    PidResolver(IProcessTable* table, IPortLookup* ports, IProcessKiller* killer,
                Reporter* reporter, int self_pid = -1);

    std::optional<Resolution> resolve(const Role& role);

    std::optional<int> resolve_from_pid_file(const Role& role);
    std::optional<int> resolve_from_port(const Role& role);
    std::optional<int> resolve_from_pattern(const Role& role);

    // Lowest pid whose command line contains pattern, skipping exclude_pid
    static std::optional<int> select_by_pattern(const std::vector<ProcessInfo>& processes,
                                                std::string_view pattern, int exclude_pid);

private:
    IProcessTable* table_;
    IPortLookup* ports_;
    IProcessKiller* killer_;
    Reporter* reporter_;
    int self_pid_;
};

} // namespace stackstop
