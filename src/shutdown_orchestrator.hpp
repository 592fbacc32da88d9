#pragma once

#include "pid_resolver.hpp"
#include "reporter.hpp"
#include "role.hpp"
#include "run_context.hpp"
#include "termination_controller.hpp"
#include <optional>
#include <string>
#include <vector>

namespace stackstop {

constexpr int kExitSuccess = 0;
constexpr int kExitKillFailed = 1;
constexpr int kExitEnvironmentInvalid = 2;
constexpr int kExitError = 3;

struct RoleResult {
    std::string role;
    std::optional<Resolution> resolution;
    Outcome outcome = Outcome::not_running;
    std::optional<ErrorKind> error;
    std::string detail;
};

struct RunSummary {
    bool environment_valid = true;
    std::string environment_error;
    std::vector<RoleResult> results;    // in the order roles were attempted

    [[nodiscard]] size_t count(Outcome outcome) const;
    [[nodiscard]] bool success() const;
    [[nodiscard]] int exit_code() const;
};

// Stops every role in order. A role's failure is recorded and the next
// role is still attempted; only an invalid bench directory aborts the run.
class ShutdownOrchestrator {
public:
    // Does not own its collaborators
    ShutdownOrchestrator(const RunContext* context, PidResolver* resolver,
                         TerminationController* controller, Reporter* reporter);

    RunSummary run(const std::vector<Role>& roles);

private:
    RoleResult stop_role(const Role& role);
    void report_summary(const RunSummary& summary);

    const RunContext* context_;
    PidResolver* resolver_;
    TerminationController* controller_;
    Reporter* reporter_;
};

} // namespace stackstop
