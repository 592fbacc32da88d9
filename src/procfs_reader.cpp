#include "procfs_reader.hpp"
#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stackstop {

namespace {

constexpr int kTcpListenState = 0x0A;

} // namespace

ProcfsReader::ProcfsReader(std::string proc_root) : proc_root_(std::move(proc_root)) {}

std::string ProcfsReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) return {};
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string ProcfsReader::read_symlink(const std::string& path) {
    char buf[4096];
    const ssize_t len = readlink(path.c_str(), buf, sizeof(buf) - 1);
    if (len == -1) return {};
    buf[len] = '\0';
    return buf;
}

std::vector<int> ProcfsReader::list_pids() const {
    std::vector<int> pids;

    std::error_code ec;
    for (fs::directory_iterator it(proc_root_, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        int pid = 0;
        if (auto [ptr, parse_ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
            parse_ec != std::errc{} || ptr != name.data() + name.size() || pid <= 0) {
            continue;
        }
        pids.push_back(pid);
    }

    std::ranges::sort(pids);
    return pids;
}

std::optional<ProcessInfo> ProcfsReader::parse_stat(const int pid, const std::string& stat_content) {
    // Format: pid (comm) state ppid ...
    // comm can contain spaces and parentheses, so find the last ')'
    const size_t comm_start = stat_content.find('(');
    const size_t comm_end = stat_content.rfind(')');
    if (comm_start == std::string::npos || comm_end == std::string::npos || comm_end <= comm_start) {
        return std::nullopt;
    }
    if (comm_end + 2 >= stat_content.size()) {
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = pid;
    info.name = stat_content.substr(comm_start + 1, comm_end - comm_start - 1);

    std::istringstream iss(stat_content.substr(comm_end + 2));
    std::string state;
    int ppid = 0;
    iss >> state >> ppid;
    if (state.empty()) {
        return std::nullopt;
    }

    info.state_char = state[0];
    info.parent_pid = ppid;
    return info;
}

std::string ProcfsReader::parse_cmdline(std::string raw) {
    // Arguments are NUL separated with a trailing NUL
    while (!raw.empty() && raw.back() == '\0') {
        raw.pop_back();
    }
    std::ranges::replace(raw, '\0', ' ');
    return raw;
}

std::optional<ProcessInfo> ProcfsReader::get_process_info(const int pid) const {
    const std::string proc_path = proc_root_ + "/" + std::to_string(pid);

    const std::string stat_content = read_file(proc_path + "/stat");
    if (stat_content.empty()) return std::nullopt;

    auto info = parse_stat(pid, stat_content);
    if (!info) return std::nullopt;

    // Kernel threads have an empty cmdline
    info->command_line = parse_cmdline(read_file(proc_path + "/cmdline"));
    return info;
}

std::vector<ProcessInfo> ProcfsReader::get_all_processes() const {
    std::vector<ProcessInfo> processes;
    for (const int pid : list_pids()) {
        // Process may disappear between listing and reading
        if (auto info = get_process_info(pid)) {
            processes.push_back(std::move(*info));
        }
    }
    return processes;
}

std::set<unsigned long> ProcfsReader::get_socket_inodes(const int pid) const {
    std::set<unsigned long> socket_inodes;
    const std::string fd_path = proc_root_ + "/" + std::to_string(pid) + "/fd";

    // Other users' fd directories are not readable; that is not an error
    std::error_code ec;
    for (fs::directory_iterator it(fd_path, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string link = read_symlink(it->path().string());
        if (!link.starts_with("socket:[") || link.back() != ']') continue;

        unsigned long inode = 0;
        const auto start = link.data() + 8;
        const auto stop = link.data() + link.size() - 1;
        if (auto [ptr, parse_ec] = std::from_chars(start, stop, inode); parse_ec == std::errc{} && inode > 0) {
            socket_inodes.insert(inode);
        }
    }
    return socket_inodes;
}

std::vector<ListeningSocket> ProcfsReader::parse_listening_sockets(std::istream& in, const std::string& protocol) {
    std::vector<ListeningSocket> sockets;

    std::string line;
    std::getline(in, line); // Skip header

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string sl_str;  // "0:" format
        std::string local_addr, remote_addr;
        std::string state_hex;
        std::string tx_rx, tr_tm, retrnsmt;
        int uid = 0;
        int timeout = 0;
        unsigned long inode = 0;

        iss >> sl_str >> local_addr >> remote_addr >> state_hex
            >> tx_rx >> tr_tm >> retrnsmt >> uid >> timeout >> inode;
        if (iss.fail() || inode == 0) continue;

        int state = 0;
        std::from_chars(state_hex.data(), state_hex.data() + state_hex.size(), state, 16);
        if (state != kTcpListenState) continue;

        const size_t colon_pos = local_addr.rfind(':');
        if (colon_pos == std::string::npos) continue;

        int port = 0;
        const auto port_begin = local_addr.data() + colon_pos + 1;
        const auto port_end = local_addr.data() + local_addr.size();
        if (auto [ptr, ec] = std::from_chars(port_begin, port_end, port, 16); ec != std::errc{} || ptr != port_end) {
            continue;
        }

        sockets.push_back({protocol, port, inode});
    }

    return sockets;
}

std::vector<ListeningSocket> ProcfsReader::get_listening_sockets() const {
    std::vector<ListeningSocket> sockets;
    for (const auto* protocol : {"tcp", "tcp6"}) {
        std::ifstream file(proc_root_ + "/net/" + protocol);
        if (!file) continue;
        auto parsed = parse_listening_sockets(file, protocol);
        sockets.insert(sockets.end(), parsed.begin(), parsed.end());
    }
    return sockets;
}

} // namespace stackstop
