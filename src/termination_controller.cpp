#include "termination_controller.hpp"
#include <format>

namespace stackstop {

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::not_running: return "not running";
        case Outcome::stopped_gracefully: return "stopped";
        case Outcome::force_killed: return "force killed";
        case Outcome::kill_failed: return "kill failed";
    }
    return "unknown";
}

TerminationController::TerminationController(IProcessKiller* killer, IClock* clock, Reporter* reporter)
    : killer_(killer), clock_(clock), reporter_(reporter) {}

TerminationReport TerminationController::signal_failure(const KillResult& result) {
    TerminationReport report;
    report.outcome = Outcome::kill_failed;
    report.error = result.status == SignalStatus::permission_denied ? ErrorKind::signal_permission_denied
                                                                      : ErrorKind::signal_failed;
    report.detail = result.error_message;
    return report;
}

TerminationReport TerminationController::terminate(int pid, std::string_view role_name, std::chrono::seconds timeout) {
    TerminationReport report;

    // Re-probe right before signaling; the pid may have been freed since resolution
    if (pid <= 0 || !killer_->is_running(pid)) {
        reporter_->warn(std::format("{}: Process not running (PID: {})", role_name, pid));
        report.outcome = Outcome::not_running;
        return report;
    }

    reporter_->info(std::format("{}: Stopping gracefully (PID: {})...", role_name, pid));

    const KillResult term = killer_->kill_process(pid, false);
    if (!term.delivered()) {
        if (term.status == SignalStatus::target_vanished) {
            reporter_->warn(std::format("{}: Exited before SIGTERM was delivered (PID: {})", role_name, pid));
            report.outcome = Outcome::not_running;
            report.error = ErrorKind::signal_target_vanished;
            report.detail = term.error_message;
            return report;
        }
        reporter_->error(std::format("{}: Could not send SIGTERM (PID: {}): {}", role_name, pid, term.error_message));
        return signal_failure(term);
    }

    int polls = 0;
    while (polls < timeout.count() && killer_->is_running(pid)) {
        clock_->sleep_for(kPollInterval);
        ++polls;
        reporter_->progress_tick();
    }
    reporter_->progress_done();

    if (killer_->is_running(pid)) {
        return escalate(pid, role_name, timeout, polls);
    }

    reporter_->info(std::format("{}: Stopped successfully", role_name));
    report.outcome = Outcome::stopped_gracefully;
    report.polls = polls;
    return report;
}

TerminationReport TerminationController::escalate(int pid, std::string_view role_name,
                                                  std::chrono::seconds timeout, int polls) {
    reporter_->warn(std::format("{}: Still running after {}s, forcing shutdown...", role_name, timeout.count()));

    // Exactly one SIGKILL, whatever happens next
    const KillResult kill = killer_->kill_process(pid, true);

    TerminationReport report;
    if (!kill.delivered()) {
        if (kill.status == SignalStatus::target_vanished) {
            // Exited on its own right at the deadline
            reporter_->info(std::format("{}: Stopped successfully", role_name));
            report.outcome = Outcome::stopped_gracefully;
            report.error = ErrorKind::signal_target_vanished;
            report.detail = kill.error_message;
        } else {
            reporter_->error(std::format("{}: Failed to kill process (PID: {}): {}", role_name, pid, kill.error_message));
            report = signal_failure(kill);
        }
        report.polls = polls;
        report.forced = true;
        return report;
    }

    clock_->sleep_for(kKillGrace);

    report.polls = polls;
    report.forced = true;
    if (killer_->is_running(pid)) {
        reporter_->error(std::format("{}: Failed to kill process (PID: {})", role_name, pid));
        report.outcome = Outcome::kill_failed;
        report.error = ErrorKind::escalation_exhausted;
        report.detail = "process survived SIGKILL";
        return report;
    }

    reporter_->info(std::format("{}: Force killed", role_name));
    report.outcome = Outcome::force_killed;
    return report;
}

} // namespace stackstop
