#pragma once

#include "config_readers.hpp"
#include "run_context.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stackstop {

constexpr std::chrono::seconds kAppGraceTimeout{10};
constexpr std::chrono::seconds kAuxGraceTimeout{5};

// A logical process of the stack. Hints are tried in order:
// pid_file, port_source, command_pattern.
struct Role {
    std::string name;
    std::optional<std::filesystem::path> pid_file;
    std::optional<PortSource> port_source;
    std::optional<std::string> command_pattern;
    std::chrono::seconds grace_timeout = kAppGraceTimeout;
};

// Roles of a bench in shutdown order (reverse of startup dependencies)
std::vector<Role> default_roles(const RunContext& context);

} // namespace stackstop
