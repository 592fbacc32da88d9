#include "procfs_port_lookup.hpp"
#include <algorithm>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace stackstop {

ProcfsPortLookup::ProcfsPortLookup(ProcfsReader reader) : reader_(std::move(reader)) {}

bool ProcfsPortLookup::available() const {
    std::error_code ec;
    return fs::exists(reader_.proc_root() + "/net/tcp", ec);
}

std::optional<int> ProcfsPortLookup::find_listener(const int port) {
    std::set<unsigned long> wanted;
    for (const auto& socket : reader_.get_listening_sockets()) {
        if (socket.port == port) {
            wanted.insert(socket.inode);
        }
    }
    if (wanted.empty()) {
        return std::nullopt;
    }

    // list_pids() is sorted, so the first owner found is the lowest pid
    for (const int pid : reader_.list_pids()) {
        const auto held = reader_.get_socket_inodes(pid);
        if (std::ranges::any_of(held, [&](unsigned long inode) { return wanted.contains(inode); })) {
            return pid;
        }
    }

    // Socket exists but its owner is not visible to us
    return std::nullopt;
}

} // namespace stackstop
