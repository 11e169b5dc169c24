#include "dump_types.hpp"

std::string to_string(DumpState s) {
    switch (s) {
        case DumpState::Idle:       return "idle";
        case DumpState::Starting:   return "starting";
        case DumpState::Extracting: return "extracting";
        case DumpState::Verifying:  return "verifying";
        case DumpState::Completed:  return "completed";
        case DumpState::Failed:     return "failed";
        case DumpState::Timeout:    return "timeout";
    }
    return "unknown";
}

std::string to_string(DumpMode m) {
    return m == DumpMode::Headless ? "headless" : "interactive";
}

std::string to_string(DumpTrigger t) {
    switch (t) {
        case DumpTrigger::Manual:       return "manual";
        case DumpTrigger::CrashMonitor: return "crash_monitor";
        case DumpTrigger::HealthCheck:  return "health_check";
    }
    return "manual";
}

std::string to_string(DumpErrorKind k) {
    switch (k) {
        case DumpErrorKind::None:         return "none";
        case DumpErrorKind::Setup:        return "setup";
        case DumpErrorKind::Process:      return "process";
        case DumpErrorKind::Timeout:      return "timeout";
        case DumpErrorKind::Verification: return "verification";
        case DumpErrorKind::Cancelled:    return "cancelled";
    }
    return "none";
}

std::optional<DumpMode> parse_dump_mode(const std::string& s) {
    if (s == "headless") return DumpMode::Headless;
    if (s == "interactive" || s == "dialog") return DumpMode::Interactive;
    return std::nullopt;
}

std::optional<DumpTrigger> parse_dump_trigger(const std::string& s) {
    if (s == "manual") return DumpTrigger::Manual;
    if (s == "crash_monitor") return DumpTrigger::CrashMonitor;
    // "qs_failed" is the name older manifests use for health-check failures
    if (s == "health_check" || s == "qs_failed") return DumpTrigger::HealthCheck;
    return std::nullopt;
}

std::optional<DumpErrorKind> parse_error_kind(const std::string& s) {
    for (auto k : {DumpErrorKind::None, DumpErrorKind::Setup, DumpErrorKind::Process,
                   DumpErrorKind::Timeout, DumpErrorKind::Verification,
                   DumpErrorKind::Cancelled}) {
        if (to_string(k) == s) return k;
    }
    return std::nullopt;
}

bool is_automated(DumpTrigger t) {
    return t == DumpTrigger::CrashMonitor || t == DumpTrigger::HealthCheck;
}

bool is_terminal(DumpState s) {
    return s == DumpState::Completed || s == DumpState::Failed || s == DumpState::Timeout;
}

bool can_transition(DumpState from, DumpState to) {
    switch (from) {
        case DumpState::Idle:
            return to == DumpState::Starting;
        case DumpState::Starting:
            return to == DumpState::Extracting || to == DumpState::Failed;
        case DumpState::Extracting:
            // Idle is the cancelled exit: no terminal state is recorded
            return to == DumpState::Verifying || to == DumpState::Failed ||
                   to == DumpState::Idle;
        case DumpState::Verifying:
            return to == DumpState::Completed || to == DumpState::Failed;
        case DumpState::Completed:
        case DumpState::Failed:
        case DumpState::Timeout:
            return to == DumpState::Idle;
    }
    return false;
}
