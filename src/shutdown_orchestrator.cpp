#include "shutdown_orchestrator.hpp"
#include <algorithm>
#include <format>

namespace stackstop {

size_t RunSummary::count(Outcome outcome) const {
    return static_cast<size_t>(std::ranges::count(results, outcome, &RoleResult::outcome));
}

bool RunSummary::success() const {
    return environment_valid && count(Outcome::kill_failed) == 0;
}

int RunSummary::exit_code() const {
    if (!environment_valid) {
        return kExitEnvironmentInvalid;
    }
    return success() ? kExitSuccess : kExitKillFailed;
}

ShutdownOrchestrator::ShutdownOrchestrator(const RunContext* context, PidResolver* resolver,
                                           TerminationController* controller, Reporter* reporter)
    : context_(context), resolver_(resolver), controller_(controller), reporter_(reporter) {}

RunSummary ShutdownOrchestrator::run(const std::vector<Role>& roles) {
    RunSummary summary;

    reporter_->info("=== Stopping Frappe Bench ===");
    reporter_->info(std::format("Bench directory: {}", context_->bench_dir.string()));
    reporter_->blank_line();

    // Nothing is resolved or signaled outside a bench directory
    if (auto reason = context_->validate()) {
        reporter_->error("This command must be run from the frappe-bench directory");
        reporter_->error(*reason);
        summary.environment_valid = false;
        summary.environment_error = std::move(*reason);
        return summary;
    }

    summary.results.reserve(roles.size());
    for (const auto& role : roles) {
        summary.results.push_back(stop_role(role));
    }

    report_summary(summary);
    return summary;
}

RoleResult ShutdownOrchestrator::stop_role(const Role& role) {
    RoleResult result;
    result.role = role.name;

    result.resolution = resolver_->resolve(role);
    if (!result.resolution) {
        reporter_->warn(std::format("{}: Not running", role.name));
        result.outcome = Outcome::not_running;
        result.error = ErrorKind::resolution_empty;
        return result;
    }

    reporter_->debug(std::format("{}: resolved PID {} by {}", role.name, result.resolution->pid,
                                 to_string(result.resolution->strategy)));

    auto report = controller_->terminate(result.resolution->pid, role.name, role.grace_timeout);
    result.outcome = report.outcome;
    result.error = report.error;
    result.detail = std::move(report.detail);
    return result;
}

void ShutdownOrchestrator::report_summary(const RunSummary& summary) {
    reporter_->blank_line();
    reporter_->info(std::format("{} stopped, {} force killed, {} not running, {} failed",
                                summary.count(Outcome::stopped_gracefully),
                                summary.count(Outcome::force_killed),
                                summary.count(Outcome::not_running),
                                summary.count(Outcome::kill_failed)));

    if (summary.success()) {
        reporter_->info("=== All bench processes stopped ===");
        return;
    }

    for (const auto& result : summary.results) {
        if (result.outcome != Outcome::kill_failed) continue;
        const auto pid = result.resolution ? result.resolution->pid : 0;
        reporter_->error(std::format("{} (PID: {}) needs manual attention: {}", result.role, pid,
                                     result.error ? to_string(*result.error) : "kill failed"));
    }
    reporter_->error("=== Bench shutdown incomplete ===");
}

} // namespace stackstop
