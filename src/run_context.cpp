#include "run_context.hpp"
#include <format>

namespace fs = std::filesystem;

namespace stackstop {

RunContext RunContext::from_bench_dir(const fs::path& dir) {
    RunContext context;

    std::error_code ec;
    context.bench_dir = fs::weakly_canonical(fs::absolute(dir), ec);
    if (ec) {
        context.bench_dir = fs::absolute(dir);
    }

    context.config_dir = context.bench_dir / "config";
    context.pids_dir = context.config_dir / "pids";
    context.sites_dir = context.bench_dir / "sites";
    context.procfile = context.bench_dir / "Procfile";
    return context;
}

fs::path RunContext::common_site_config() const {
    return sites_dir / "common_site_config.json";
}

std::optional<std::string> RunContext::validate() const {
    std::error_code ec;
    if (!fs::is_regular_file(procfile, ec)) {
        return std::format("{} not found", procfile.string());
    }
    if (!fs::is_directory(config_dir, ec)) {
        return std::format("{} is not a directory", config_dir.string());
    }
    if (!fs::is_directory(sites_dir, ec)) {
        return std::format("{} is not a directory", sites_dir.string());
    }
    return std::nullopt;
}

} // namespace stackstop
