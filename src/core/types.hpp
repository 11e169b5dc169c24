#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <filesystem>
#include <cstdint>
#include "constants.hpp"
#include "dump_types.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Outcome of a device shell command.
//   Ok          - command ran and exited 0 (output may legitimately be empty)
//   Failed      - command ran but exited non-zero
//   Unavailable - the transport itself could not run the command
enum class ShellStatus { Ok, Failed, Unavailable };

struct ShellResult {
    ShellStatus status = ShellStatus::Unavailable;
    int exit_code = -1;
    std::string output;
    std::string error;

    static ShellResult ok(std::string out) {
        return {ShellStatus::Ok, 0, std::move(out), ""};
    }

    static ShellResult failed(int code, std::string out, std::string err = "") {
        return {ShellStatus::Failed, code, std::move(out), std::move(err)};
    }

    static ShellResult unavailable(std::string err) {
        return {ShellStatus::Unavailable, -1, "", std::move(err)};
    }

    bool success() const { return status == ShellStatus::Ok; }
    bool unavailable() const { return status == ShellStatus::Unavailable; }
};

// Reply from the artifact store
struct UploadResult {
    bool success = false;
    std::string message;
    std::map<std::string, std::string> data;
};

// Configuration structures
struct DumpTimeouts {
    int headless_secs = HEADLESS_DUMP_TIMEOUT_SECS;
    int interactive_secs = INTERACTIVE_DUMP_TIMEOUT_SECS;
    int cancel_grace_secs = CANCEL_GRACE_SECS;
};

// Everything the coordinator needs to plan and run a fleet request
struct FleetSettings {
    std::filesystem::path log_directory;         // root of all dump layouts
    std::filesystem::path script_path;           // device-side extraction script
    int max_concurrency = DEFAULT_MAX_CONCURRENCY;
    std::string path_strategy = DEFAULT_PATH_STRATEGY;
    std::string directory_prefix = DEFAULT_ISSUE_PREFIX;
    DumpMode manual_mode = DumpMode::Interactive;
    DumpMode automated_mode = DumpMode::Headless;
    DumpTimeouts timeouts;
    bool upload_enabled = true;                  // default when a request does not say
    std::string upload_prefix = DEFAULT_ISSUE_PREFIX;
};

struct ArtifactStoreConfig {
    std::string server_url = DEFAULT_JFROG_URL;
    std::string repository = DEFAULT_JFROG_REPO;
    std::string server_id = DEFAULT_JFROG_SERVER;
    int timeout_secs = UPLOAD_TIMEOUT_SECS;
};

struct CrashMonitorConfig {
    bool enabled = false;
    int interval_ms = CRASH_MONITOR_INTERVAL_MS;
};

