#include "pid_resolver.hpp"
#include <format>
#include <unistd.h>

namespace stackstop {

std::string_view to_string(ResolutionStrategy strategy) {
    switch (strategy) {
        case ResolutionStrategy::pid_file: return "pid file";
        case ResolutionStrategy::port: return "port";
        case ResolutionStrategy::pattern: return "command line";
    }
    return "unknown";
}

PidResolver::PidResolver(IProcessTable* table, IPortLookup* ports, IProcessKiller* killer,
                         Reporter* reporter, int self_pid)
    : table_(table), ports_(ports), killer_(killer), reporter_(reporter),
      self_pid_(self_pid > 0 ? self_pid : static_cast<int>(getpid())) {}

std::optional<Resolution> PidResolver::resolve(const Role& role) {
    if (auto pid = resolve_from_pid_file(role)) {
        return Resolution{*pid, ResolutionStrategy::pid_file};
    }
    if (auto pid = resolve_from_port(role)) {
        return Resolution{*pid, ResolutionStrategy::port};
    }
    if (auto pid = resolve_from_pattern(role)) {
        return Resolution{*pid, ResolutionStrategy::pattern};
    }
    return std::nullopt;
}

std::optional<int> PidResolver::resolve_from_pid_file(const Role& role) {
    if (!role.pid_file) {
        return std::nullopt;
    }

    const auto pid = read_pid_file(*role.pid_file);
    if (!pid) {
        reporter_->debug(std::format("{}: no usable pid in {}", role.name, role.pid_file->string()));
        return std::nullopt;
    }

    // A pid file outlives its process; only trust it if the pid is alive
    if (!killer_->is_running(*pid)) {
        reporter_->debug(std::format("{}: stale pid file {} (PID: {})", role.name, role.pid_file->string(), *pid));
        return std::nullopt;
    }
    return pid;
}

std::optional<int> PidResolver::resolve_from_port(const Role& role) {
    if (!role.port_source) {
        return std::nullopt;
    }

    const auto port = read_port(*role.port_source);
    if (!port) {
        reporter_->debug(std::format("{}: no port configured in {}", role.name, describe(*role.port_source)));
        return std::nullopt;
    }

    if (!ports_->available()) {
        reporter_->debug(std::format("{}: no port lookup mechanism available for port {}", role.name, *port));
        return std::nullopt;
    }

    const auto pid = ports_->find_listener(*port);
    if (!pid || *pid <= 0) {
        reporter_->debug(std::format("{}: nothing listening on port {}", role.name, *port));
        return std::nullopt;
    }
    if (!killer_->is_running(*pid)) {
        return std::nullopt;
    }

    reporter_->debug(std::format("{}: port {} is held by PID {}", role.name, *port, *pid));
    return pid;
}

std::optional<int> PidResolver::resolve_from_pattern(const Role& role) {
    if (!role.command_pattern || role.command_pattern->empty()) {
        return std::nullopt;
    }

    auto pid = select_by_pattern(table_->get_all_processes(), *role.command_pattern, self_pid_);
    if (!pid) {
        reporter_->debug(std::format("{}: no process matches \"{}\"", role.name, *role.command_pattern));
    }
    return pid;
}

std::optional<int> PidResolver::select_by_pattern(const std::vector<ProcessInfo>& processes,
                                                  std::string_view pattern, int exclude_pid) {
    if (pattern.empty()) {
        return std::nullopt;
    }

    std::optional<int> best;
    for (const auto& process : processes) {
        if (process.pid <= 0 || process.pid == exclude_pid) continue;
        if (process.command_line.find(pattern) == std::string::npos) continue;
        if (!best || process.pid < *best) {
            best = process.pid;
        }
    }
    return best;
}

} // namespace stackstop
