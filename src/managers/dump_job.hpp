#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <condition_variable>
#include <filesystem>
#include <core/types.hpp>
#include <core/deadline.hpp>
#include <device/device_transport.hpp>
#include "dump_events.hpp"
#include "dump_prompter.hpp"
#include "process_runner.hpp"

struct DumpJobTiming {
    std::chrono::milliseconds headless_timeout{HEADLESS_DUMP_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds interactive_timeout{INTERACTIVE_DUMP_TIMEOUT_SECS * 1000};
    std::chrono::milliseconds cancel_grace{CANCEL_GRACE_SECS * 1000};
    std::chrono::milliseconds tick{EXTRACT_TICK_MS};
    std::chrono::milliseconds poll{JOB_POLL_MS};

    static DumpJobTiming from(const DumpTimeouts& t);
};

// Extraction lifecycle of one device:
//
//   IDLE -> STARTING -> EXTRACTING -> VERIFYING -> COMPLETED
//              |            |             |
//              +------------+-------------+-> FAILED
//
// A confirmed cancel leaves EXTRACTING straight back to IDLE with a
// cancelled outcome. Terminal states return to IDLE once the outcome has
// been handed to the sink. The job never retries on its own.
class DumpJob {
public:
    DumpJob(std::string device_id,
            ProcessRunner& runner,
            DeviceTransport& transport,
            DumpPrompter* prompter,
            DumpEventSink sink,
            DumpJobTiming timing = {});
    ~DumpJob();

    DumpJob(const DumpJob&) = delete;
    DumpJob& operator=(const DumpJob&) = delete;

    // IDLE -> STARTING, then the worker takes over. Returns false (and does
    // nothing) unless the job is idle. After true, exactly one Finished
    // event follows.
    bool start(DumpTrigger trigger, DumpMode mode,
               const std::filesystem::path& working_dir,
               const std::filesystem::path& script_path);

    // Apply a decision the operator already confirmed. Returns false for
    // headless jobs and for jobs that are not extracting.
    bool cancel(const CancelDecision& decision);

    // Kill the process and stop the worker without reporting an outcome.
    void stop();

    // Block until the worker thread has finished.
    void wait();

    DumpState state() const;
    DumpMode mode() const;
    DumpTrigger trigger() const;
    bool cancellation_requested() const;
    std::filesystem::path working_dir() const;
    const std::string& device_id() const { return device_id_; }

private:
    struct Failure {
        DumpErrorKind kind;
        std::string detail;
    };

    void run();
    std::optional<Failure> launch();
    void supervise();
    DumpOutcome conclude();
    DumpOutcome verify();
    void cleanup_device();

    void transition(DumpState to);
    void progress(const std::string& msg);
    DumpOutcome make_outcome(DumpState final_state, DumpErrorKind kind,
                             const std::string& detail) const;

    std::string device_id_;
    ProcessRunner& runner_;
    DeviceTransport& transport_;
    DumpPrompter* prompter_;
    DumpEventSink sink_;
    DumpJobTiming timing_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    DumpState state_ = DumpState::Idle;
    DumpTrigger trigger_ = DumpTrigger::Manual;
    DumpMode mode_ = DumpMode::Interactive;
    std::filesystem::path working_dir_;
    std::filesystem::path script_path_;
    bool cancellation_requested_ = false;
    std::optional<CancelDecision> pending_cancel_;

    // Worker-only state
    std::unique_ptr<ExternalProcess> process_;
    Deadline deadline_;
    Deadline kill_deadline_;
    std::optional<Failure> failure_;
    bool cleanup_requested_ = false;
    bool cleanup_done_ = false;
    bool exited_ = false;
    int exit_code_ = -1;
    ExitStatus exit_status_ = ExitStatus::Normal;

    std::atomic<bool> stop_{false};
    std::thread worker_;
};
