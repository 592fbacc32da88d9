#pragma once

#include <string_view>

namespace stackstop {

// Classification of everything that can go wrong while stopping the stack.
// Only environment_invalid aborts a run; the rest are recorded per role.
enum class ErrorKind {
    environment_invalid,
    resolution_empty,
    signal_permission_denied,
    signal_target_vanished,
    signal_failed,
    escalation_exhausted,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::environment_invalid: return "environment invalid";
        case ErrorKind::resolution_empty: return "no process found";
        case ErrorKind::signal_permission_denied: return "permission denied";
        case ErrorKind::signal_target_vanished: return "process vanished";
        case ErrorKind::signal_failed: return "signal delivery failed";
        case ErrorKind::escalation_exhausted: return "process survived SIGKILL";
    }
    return "unknown";
}

} // namespace stackstop
