#include "process_runner.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

std::string describe(ProcessError e) {
    switch (e) {
        case ProcessError::FailedToStart: return "Failed to start process";
        case ProcessError::Crashed:       return "Process crashed";
        case ProcessError::TimedOut:      return "Process timed out";
        case ProcessError::WriteError:    return "Write error";
        case ProcessError::ReadError:     return "Read error";
        case ProcessError::Unknown:       return "Unknown error";
    }
    return "Unknown error";
}

// ── ScriptProcess ───────────────────────────────────────────

namespace {

class ScriptProcess : public ExternalProcess {
public:
    explicit ScriptProcess(platform::ProcessHandle handle)
        : handle_(std::move(handle)) {
        ProcessEvent started;
        started.kind = ProcessEvent::Kind::Started;
        pending_.push_back(started);
    }

    ProcessState state() const override {
        return finished_ ? ProcessState::NotRunning : ProcessState::Running;
    }

    int pid() const override { return handle_.native_handle(); }
    int exit_code() const override { return handle_.exit_code(); }

    void terminate() override { handle_.terminate(); }
    void kill() override { handle_.kill(); }

    std::vector<ProcessEvent> poll() override {
        std::vector<ProcessEvent> events;
        events.swap(pending_);
        if (finished_) return events;

        bool alive = handle_.running();
        drain(events);

        if (handle_.read_failed() && !read_error_reported_) {
            read_error_reported_ = true;
            ProcessEvent err;
            err.kind = ProcessEvent::Kind::Error;
            err.error = ProcessError::ReadError;
            events.push_back(err);
        }

        if (!alive) {
            finished_ = true;
            ProcessEvent done;
            done.kind = ProcessEvent::Kind::Finished;
            done.exit_code = handle_.exit_code();
            done.exit_status = handle_.signaled() ? ExitStatus::Crashed : ExitStatus::Normal;
            events.push_back(done);
        }
        return events;
    }

private:
    void drain(std::vector<ProcessEvent>& events) {
        std::string chunk = handle_.read_available();
        if (chunk.empty()) return;
        ProcessEvent out;
        out.kind = ProcessEvent::Kind::Output;
        out.output = std::move(chunk);
        events.push_back(std::move(out));
    }

    platform::ProcessHandle handle_;
    std::vector<ProcessEvent> pending_;
    bool finished_ = false;
    bool read_error_reported_ = false;
};

} // namespace

// ── ScriptProcessRunner ─────────────────────────────────────

ScriptProcessRunner::ScriptProcessRunner(std::string interpreter)
    : interpreter_(std::move(interpreter)) {}

Result<std::unique_ptr<ExternalProcess>> ScriptProcessRunner::start(
    const std::filesystem::path& program,
    const std::filesystem::path& working_dir,
    const std::map<std::string, std::string>& env) {
    platform::SpawnOptions options;
    options.working_dir = working_dir;
    options.env = env;

    auto spawned = platform::spawn(interpreter_, {program.string()}, options);
    if (spawned.is_err()) {
        dumpfleet_log(fmt::format("process: failed to start {}: {}",
                                  program.string(), spawned.error));
        return Result<std::unique_ptr<ExternalProcess>>::Err(spawned.error);
    }

    std::unique_ptr<ExternalProcess> proc =
        std::make_unique<ScriptProcess>(std::move(spawned.value));
    dumpfleet_log(fmt::format("process: started {} (pid {}) in {}",
                              program.string(), proc->pid(), working_dir.string()));
    return Result<std::unique_ptr<ExternalProcess>>::Ok(std::move(proc));
}
