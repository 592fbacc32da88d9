#pragma once

#include "process_info.hpp"
#include <istream>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stackstop {

class ProcfsReader {
public:
    explicit ProcfsReader(std::string proc_root = "/proc");

    std::vector<ProcessInfo> get_all_processes() const;
    std::optional<ProcessInfo> get_process_info(int pid) const;

    // Numeric entries of the proc root
    std::vector<int> list_pids() const;

    // Inodes of the sockets held open by pid (from fd/ symlinks)
    std::set<unsigned long> get_socket_inodes(int pid) const;

    // LISTEN entries of net/tcp and net/tcp6
    std::vector<ListeningSocket> get_listening_sockets() const;

    [[nodiscard]] const std::string& proc_root() const { return proc_root_; }

    // Parsers, exposed for tests
    static std::vector<ListeningSocket> parse_listening_sockets(std::istream& in, const std::string& protocol);
    static std::optional<ProcessInfo> parse_stat(int pid, const std::string& stat_content);
    static std::string parse_cmdline(std::string raw);

private:
    static std::string read_file(const std::string& path);
    static std::string read_symlink(const std::string& path);

    std::string proc_root_;
};

} // namespace stackstop
