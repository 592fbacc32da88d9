#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace stackstop {

// Everything a run needs to know about the bench it is stopping.
// Built once in main and passed down explicitly.
struct RunContext {
    std::filesystem::path bench_dir;
    std::filesystem::path config_dir;   // <bench>/config
    std::filesystem::path pids_dir;     // <bench>/config/pids
    std::filesystem::path sites_dir;    // <bench>/sites
    std::filesystem::path procfile;     // <bench>/Procfile

    bool verbose = false;
    bool color = true;

    static RunContext from_bench_dir(const std::filesystem::path& dir);

    [[nodiscard]] std::filesystem::path common_site_config() const;

    // Reason the directory does not look like a bench root, if any
    [[nodiscard]] std::optional<std::string> validate() const;
};

} // namespace stackstop
