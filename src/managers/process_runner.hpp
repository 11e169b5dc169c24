#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <filesystem>
#include <core/types.hpp>
#include <platform/process.hpp>

enum class ProcessState { NotRunning, Starting, Running };

enum class ExitStatus { Normal, Crashed };

enum class ProcessError { FailedToStart, Crashed, TimedOut, WriteError, ReadError, Unknown };

// User-facing text for a process error kind.
std::string describe(ProcessError e);

// Notification raised by an external process since the last poll.
struct ProcessEvent {
    enum class Kind { Started, Output, Finished, Error };

    Kind kind = Kind::Output;
    std::string output;                          // Output
    int exit_code = -1;                          // Finished
    ExitStatus exit_status = ExitStatus::Normal; // Finished
    ProcessError error = ProcessError::Unknown;  // Error
};

// A running extraction script. Owned by exactly one DumpJob.
class ExternalProcess {
public:
    virtual ~ExternalProcess() = default;

    virtual ProcessState state() const = 0;
    virtual int pid() const = 0;
    virtual int exit_code() const = 0;

    // Graceful stop request (SIGTERM).
    virtual void terminate() = 0;

    // Forced stop (SIGKILL).
    virtual void kill() = 0;

    // Drain pending notifications without blocking. Finished is always the
    // last event a process ever reports.
    virtual std::vector<ProcessEvent> poll() = 0;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual Result<std::unique_ptr<ExternalProcess>> start(
        const std::filesystem::path& program,
        const std::filesystem::path& working_dir,
        const std::map<std::string, std::string>& env) = 0;
};

// Runs scripts as local child processes through an interpreter.
class ScriptProcessRunner : public ProcessRunner {
public:
    explicit ScriptProcessRunner(std::string interpreter = "/bin/bash");

    Result<std::unique_ptr<ExternalProcess>> start(
        const std::filesystem::path& program,
        const std::filesystem::path& working_dir,
        const std::map<std::string, std::string>& env) override;

private:
    std::string interpreter_;
};
