#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    std::filesystem::path working_dir;           // empty = inherit
    std::map<std::string, std::string> env;      // added to the inherited environment
    bool capture_output = true;                  // merge stdout+stderr into a pipe
};

// Opaque handle to a spawned child process. Killing and reaping on
// destruction keeps a dropped handle from leaving a zombie behind.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True while the child has not been reaped. Reaps it if it just exited.
    bool running();

    // Wait for the process to exit. Returns exit code, -1 on timeout or signal.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // SIGTERM, no waiting.
    void terminate();

    // SIGKILL, no waiting.
    void kill();

    // Drain whatever the child has written so far (non-blocking).
    std::string read_available();

    bool exited() const { return exited_; }
    bool signaled() const { return signaled_; }
    int exit_code() const { return exit_code_; }
    bool read_failed() const { return read_failed_; }

    int native_handle() const { return pid_; }

private:
    void reap(int status);
    void close_output();

    int pid_ = -1;
    int out_fd_ = -1;
    bool exited_ = false;
    bool signaled_ = false;
    bool read_failed_ = false;
    int exit_code_ = -1;

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn a child process. Fails if fork or exec fails (exec errors are
// reported through a close-on-exec pipe rather than as exit code 127).
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = {});

struct CaptureResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string output;
    std::string error;
};

// Run to completion and collect merged output. Kills the child after
// timeout_secs (0 = no limit).
CaptureResult run_capture(const std::string& program,
                          const std::vector<std::string>& args,
                          int timeout_secs = 0);

} // namespace platform
