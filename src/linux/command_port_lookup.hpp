#pragma once

#include "../interfaces/i_port_lookup.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace stackstop {

// Fallback lookups that shell out to the usual socket inspection tools.
class CommandPortLookup : public IPortLookup {
public:
    enum class Tool { lsof, ss, netstat };

    explicit CommandPortLookup(Tool tool);
    CommandPortLookup(Tool tool, std::string_view search_path);
    ~CommandPortLookup() override = default;

    [[nodiscard]] std::string name() const override;
    [[nodiscard]] bool available() const override { return !executable_.empty(); }
    std::optional<int> find_listener(int port) override;

    // Output parsers, each returns every pid found (unsorted)
    static std::vector<int> parse_lsof_output(std::string_view output);
    static std::vector<int> parse_ss_output(std::string_view output, int port);
    static std::vector<int> parse_netstat_output(std::string_view output, int port);

    // Equivalent of `command -v`; empty when not found
    static std::string find_executable(std::string_view program, std::string_view search_path);

private:
    [[nodiscard]] std::string build_command(int port) const;
    static std::optional<std::string> run_command(const std::string& command);

    Tool tool_;
    std::string executable_;
};

} // namespace stackstop
