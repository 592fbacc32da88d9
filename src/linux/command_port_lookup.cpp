#include "command_port_lookup.hpp"
#include "../config_readers.hpp"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace stackstop {

namespace {

std::string_view tool_program(CommandPortLookup::Tool tool) {
    switch (tool) {
        case CommandPortLookup::Tool::lsof: return "lsof";
        case CommandPortLookup::Tool::ss: return "ss";
        case CommandPortLookup::Tool::netstat: return "netstat";
    }
    return "";
}

std::vector<std::string> split_fields(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(std::move(field));
    }
    return fields;
}

// "127.0.0.1:13000", "[::]:13000", "*:13000", "0.0.0.0%lo:13000"
bool endpoint_has_port(std::string_view endpoint, int port) {
    const size_t colon_pos = endpoint.rfind(':');
    if (colon_pos == std::string_view::npos) return false;
    return endpoint.substr(colon_pos + 1) == std::to_string(port);
}

} // namespace

CommandPortLookup::CommandPortLookup(Tool tool)
    : CommandPortLookup(tool, [] {
          const char* path = std::getenv("PATH");
          return std::string_view(path ? path : "/usr/sbin:/usr/bin:/sbin:/bin");
      }()) {}

CommandPortLookup::CommandPortLookup(Tool tool, std::string_view search_path)
    : tool_(tool), executable_(find_executable(tool_program(tool), search_path)) {}

std::string CommandPortLookup::name() const {
    return std::string(tool_program(tool_));
}

std::string CommandPortLookup::find_executable(std::string_view program, std::string_view search_path) {
    size_t start = 0;
    while (start <= search_path.size()) {
        size_t end = search_path.find(':', start);
        if (end == std::string_view::npos) end = search_path.size();

        std::string_view dir = search_path.substr(start, end - start);
        if (dir.empty()) dir = ".";

        const fs::path candidate = fs::path(dir) / program;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
        start = end + 1;
    }
    return {};
}

std::string CommandPortLookup::build_command(int port) const {
    switch (tool_) {
        case Tool::lsof:
            return std::format("'{}' -nP -t -iTCP:{} -sTCP:LISTEN 2>/dev/null", executable_, port);
        case Tool::ss:
            return std::format("'{}' -ltnp 2>/dev/null", executable_);
        case Tool::netstat:
            return std::format("'{}' -ltnp 2>/dev/null", executable_);
    }
    return {};
}

std::optional<std::string> CommandPortLookup::run_command(const std::string& command) {
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return std::nullopt;
    }

    std::string output;
    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }

    // lsof exits 1 when nothing matches, so the status is not a failure signal
    pclose(pipe);
    return output;
}

std::vector<int> CommandPortLookup::parse_lsof_output(std::string_view output) {
    // -t prints one pid per line
    std::vector<int> pids;
    std::istringstream iss{std::string(output)};
    std::string line;
    while (std::getline(iss, line)) {
        const auto fields = split_fields(line);
        if (fields.size() != 1) continue;
        if (auto pid = parse_pid(fields[0])) {
            pids.push_back(*pid);
        }
    }
    return pids;
}

std::vector<int> CommandPortLookup::parse_ss_output(std::string_view output, int port) {
    // State Recv-Q Send-Q Local:Port Peer:Port Process
    // LISTEN 0 511 127.0.0.1:13000 0.0.0.0:* users:(("redis-server",pid=1234,fd=6))
    std::vector<int> pids;
    std::istringstream iss{std::string(output)};
    std::string line;
    while (std::getline(iss, line)) {
        const auto fields = split_fields(line);
        if (fields.size() < 6 || fields[0] != "LISTEN") continue;
        if (!endpoint_has_port(fields[3], port)) continue;

        std::string_view users = line;
        size_t pos = 0;
        while ((pos = users.find("pid=", pos)) != std::string_view::npos) {
            pos += 4;
            const size_t end = users.find_first_not_of("0123456789", pos);
            const auto digits = users.substr(pos, end == std::string_view::npos ? users.size() - pos : end - pos);
            if (auto pid = parse_pid(digits)) {
                pids.push_back(*pid);
            }
        }
    }
    return pids;
}

std::vector<int> CommandPortLookup::parse_netstat_output(std::string_view output, int port) {
    // Proto Recv-Q Send-Q Local Foreign State PID/Program
    // tcp 0 0 127.0.0.1:13000 0.0.0.0:* LISTEN 1234/redis-server
    std::vector<int> pids;
    std::istringstream iss{std::string(output)};
    std::string line;
    while (std::getline(iss, line)) {
        const auto fields = split_fields(line);
        if (fields.size() < 7 || !fields[0].starts_with("tcp") || fields[5] != "LISTEN") continue;
        if (!endpoint_has_port(fields[3], port)) continue;

        // "-" when the owner is not visible to us
        const std::string& owner = fields[6];
        if (auto pid = parse_pid(std::string_view(owner).substr(0, owner.find('/')))) {
            pids.push_back(*pid);
        }
    }
    return pids;
}

std::optional<int> CommandPortLookup::find_listener(int port) {
    if (!available() || port <= 0) {
        return std::nullopt;
    }

    const auto output = run_command(build_command(port));
    if (!output) {
        return std::nullopt;
    }

    std::vector<int> pids;
    switch (tool_) {
        case Tool::lsof: pids = parse_lsof_output(*output); break;
        case Tool::ss: pids = parse_ss_output(*output, port); break;
        case Tool::netstat: pids = parse_netstat_output(*output, port); break;
    }

    if (pids.empty()) {
        return std::nullopt;
    }
    return *std::ranges::min_element(pids);
}

} // namespace stackstop
