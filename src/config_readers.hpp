#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace stackstop {

// Where a role's listening port is configured
struct PortSource {
    enum class Format {
        redis_conf,  // "port <n>" directive
        json_key,    // "<key>": <n> or "<key>": "scheme://host:<n>"
    };

    Format format = Format::redis_conf;
    std::filesystem::path file;
    std::string key;
};

// All readers are read-only and return nullopt for a missing file,
// a missing value, or a value that is not a usable pid/port.
std::optional<int> read_pid_file(const std::filesystem::path& path);
std::optional<int> read_redis_port(const std::filesystem::path& path);
std::optional<int> read_json_port(const std::filesystem::path& path, std::string_view key);
std::optional<int> read_port(const PortSource& source);

std::optional<int> parse_pid(std::string_view text);
std::optional<int> parse_redis_port(std::string_view text);
// A top-level key wins over the same key inside nested objects
std::optional<int> parse_json_port(std::string_view text, std::string_view key);

std::string describe(const PortSource& source);

} // namespace stackstop
