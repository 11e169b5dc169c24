#pragma once

#include <string>
#include <optional>
#include <filesystem>

// ── Dump vocabulary ─────────────────────────────────────────

enum class DumpState {
    Idle,
    Starting,
    Extracting,
    Verifying,
    Completed,
    Failed,
    Timeout,        // reported by older tooling; deadline expiry lands in Failed
};

enum class DumpMode { Interactive, Headless };

enum class DumpTrigger { Manual, CrashMonitor, HealthCheck };

// Why a job ended where it did. None means success.
enum class DumpErrorKind {
    None,
    Setup,          // working dir / script missing, nothing launched
    Process,        // non-zero exit, crash, pipe error
    Timeout,        // deadline exceeded, process killed
    Verification,   // clean exit but no usable archive
    Cancelled,      // user cancelled; not counted as a failure
};

std::string to_string(DumpState s);
std::string to_string(DumpMode m);
std::string to_string(DumpTrigger t);
std::string to_string(DumpErrorKind k);

std::optional<DumpMode> parse_dump_mode(const std::string& s);
std::optional<DumpTrigger> parse_dump_trigger(const std::string& s);
std::optional<DumpErrorKind> parse_error_kind(const std::string& s);

// Crash monitor and health-check triggers run unattended.
bool is_automated(DumpTrigger t);

bool is_terminal(DumpState s);

// Edges of the job state machine. Terminal states only lead back to Idle.
bool can_transition(DumpState from, DumpState to);

// Terminal report a DumpJob hands to whoever started it.
struct DumpOutcome {
    std::string device_id;
    DumpTrigger trigger = DumpTrigger::Manual;
    DumpState final_state = DumpState::Failed;
    DumpErrorKind error = DumpErrorKind::Setup;
    std::string detail;
    std::filesystem::path dump_path;
    int archive_count = 0;

    bool success() const { return error == DumpErrorKind::None; }
    bool cancelled() const { return error == DumpErrorKind::Cancelled; }
};
