#include "config_readers.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <deque>
#include <format>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace stackstop {

namespace {

constexpr int kMaxPort = 65535;

std::optional<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) return std::nullopt;
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string_view trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::optional<int> parse_number(std::string_view text) {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> valid_port(std::optional<int> port) {
    if (!port || *port <= 0 || *port > kMaxPort) return std::nullopt;
    return port;
}

bool iequals(std::string_view a, std::string_view b) {
    return std::ranges::equal(a, b, [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

// Port out of "redis://localhost:13000", "127.0.0.1:13000/0" or plain "13000"
std::optional<int> port_from_string_value(std::string_view value) {
    value = trim(value);
    if (const auto plain = parse_number(value)) {
        return valid_port(plain);
    }

    const size_t colon_pos = value.rfind(':');
    if (colon_pos == std::string_view::npos) return std::nullopt;

    std::string_view rest = value.substr(colon_pos + 1);
    const size_t digits_end = rest.find_first_not_of("0123456789");
    if (digits_end != std::string_view::npos) {
        if (rest[digits_end] != '/') return std::nullopt;
        rest = rest.substr(0, digits_end);
    }
    return valid_port(parse_number(rest));
}

// Top level first, then one nesting level at a time
const nlohmann::json* find_key(const nlohmann::json& document, const std::string& key) {
    std::deque<const nlohmann::json*> pending{&document};
    while (!pending.empty()) {
        const auto* node = pending.front();
        pending.pop_front();

        if (node->is_object()) {
            if (const auto it = node->find(key); it != node->end()) {
                return &*it;
            }
        }
        if (node->is_structured()) {
            for (const auto& child : *node) {
                if (child.is_structured()) pending.push_back(&child);
            }
        }
    }
    return nullptr;
}

std::optional<int> port_from_json_value(const nlohmann::json& value) {
    if (value.is_string()) {
        return port_from_string_value(value.get_ref<const std::string&>());
    }
    if (value.is_number_integer()) {
        const auto number = value.get<long long>();
        if (number <= 0 || number > kMaxPort) return std::nullopt;
        return static_cast<int>(number);
    }
    if (value.is_number_float()) {
        // 8000.0 is still port 8000
        const double number = value.get<double>();
        if (number != std::floor(number) || number <= 0 || number > kMaxPort) return std::nullopt;
        return static_cast<int>(number);
    }
    return std::nullopt;
}

} // namespace

std::optional<int> parse_pid(std::string_view text) {
    auto pid = parse_number(trim(text));
    if (!pid || *pid <= 0) return std::nullopt;
    return pid;
}

std::optional<int> parse_redis_port(std::string_view text) {
    std::optional<int> port;
    std::istringstream iss{std::string(text)};
    std::string line;

    // Redis applies directives in order, so the last one wins
    while (std::getline(iss, line)) {
        std::istringstream fields(line);
        std::string keyword, value;
        if (!(fields >> keyword >> value)) continue;
        if (keyword.starts_with('#') || !iequals(keyword, "port")) continue;

        if (const auto parsed = parse_number(value)) {
            port = *parsed;
        }
    }

    // port 0 disables the TCP listener
    return valid_port(port);
}

std::optional<int> parse_json_port(std::string_view text, std::string_view key) {
    if (key.empty()) return std::nullopt;

    const auto document = nlohmann::json::parse(text, nullptr, false);
    if (document.is_discarded()) return std::nullopt;

    const auto* value = find_key(document, std::string(key));
    if (value == nullptr) return std::nullopt;
    return port_from_json_value(*value);
}

std::optional<int> read_pid_file(const std::filesystem::path& path) {
    const auto content = read_file(path);
    if (!content) return std::nullopt;
    return parse_pid(*content);
}

std::optional<int> read_redis_port(const std::filesystem::path& path) {
    const auto content = read_file(path);
    if (!content) return std::nullopt;
    return parse_redis_port(*content);
}

std::optional<int> read_json_port(const std::filesystem::path& path, std::string_view key) {
    const auto content = read_file(path);
    if (!content) return std::nullopt;
    return parse_json_port(*content, key);
}

std::optional<int> read_port(const PortSource& source) {
    switch (source.format) {
        case PortSource::Format::redis_conf:
            return read_redis_port(source.file);
        case PortSource::Format::json_key:
            return read_json_port(source.file, source.key);
    }
    return std::nullopt;
}

std::string describe(const PortSource& source) {
    if (source.format == PortSource::Format::json_key) {
        return std::format("{} [{}]", source.file.filename().string(), source.key);
    }
    return source.file.filename().string();
}

} // namespace stackstop
