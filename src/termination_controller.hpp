#pragma once

#include "errors.hpp"
#include "interfaces/i_clock.hpp"
#include "interfaces/i_process_killer.hpp"
#include "reporter.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace stackstop {

enum class Outcome {
    not_running,
    stopped_gracefully,
    force_killed,
    kill_failed,
};

std::string_view to_string(Outcome outcome);

struct TerminationReport {
    Outcome outcome = Outcome::not_running;
    std::optional<ErrorKind> error;
    std::string detail;
    int polls = 0;            // liveness polls spent waiting after SIGTERM
    bool forced = false;      // SIGKILL was sent

    [[nodiscard]] bool failed() const { return outcome == Outcome::kill_failed; }
};

// SIGTERM, wait up to the timeout polling once per interval, then one
// SIGKILL and a final check.
class TerminationController {
public:
    static constexpr std::chrono::milliseconds kPollInterval{1000};
    static constexpr std::chrono::milliseconds kKillGrace{1000};

    // Does not own its collaborators
    TerminationController(IProcessKiller* killer, IClock* clock, Reporter* reporter);

    TerminationReport terminate(int pid, std::string_view role_name, std::chrono::seconds timeout);

private:
    TerminationReport escalate(int pid, std::string_view role_name, std::chrono::seconds timeout, int polls);
    static TerminationReport signal_failure(const KillResult& result);

    IProcessKiller* killer_;
    IClock* clock_;
    Reporter* reporter_;
};

} // namespace stackstop
