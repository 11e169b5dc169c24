#pragma once

#include <string>
#include <vector>
#include <deque>
#include <set>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <atomic>
#include <chrono>
#include <optional>
#include <functional>
#include <condition_variable>
#include <filesystem>
#include <core/types.hpp>
#include <core/blocking_queue.hpp>
#include <device/device_transport.hpp>
#include "dump_job.hpp"
#include "dump_prompter.hpp"
#include "manifest_store.hpp"
#include "path_strategy.hpp"
#include "process_runner.hpp"
#include "upload_pipeline.hpp"

namespace fs = std::filesystem;

struct DumpRequestOptions {
    std::optional<std::string> timestamp;        // issue id; local time when unset
    std::optional<bool> upload_enabled;          // unset = settings default
    std::optional<DumpMode> mode;                // unset = mode for the trigger class
    std::string request_device_id;               // device that raised the trigger
};

struct FleetSummary {
    std::string issue_id;
    int success_count = 0;
    int fail_count = 0;
    int cancelled_count = 0;
    fs::path issue_root;
};

// All callbacks run on the coordinator's control thread.
struct FleetCallbacks {
    std::function<void(const DumpEvent&)> on_device_event;
    std::function<void(const std::string& issue_id, int completed, int total)> on_progress;
    std::function<void(const FleetSummary&)> on_completed;
    std::function<void(const std::string& message)> on_error;
    std::function<void(const std::string& issue_id, const UploadRecord&)> on_upload;
};

struct DeviceStatus {
    DumpState state = DumpState::Idle;
    DumpMode mode = DumpMode::Interactive;
    std::string last_message;
};

// Copy of the fleet state published after every message, for readers on
// other threads.
struct FleetStatus {
    bool active = false;
    std::string issue_id;
    fs::path issue_root;
    DumpTrigger trigger = DumpTrigger::Manual;
    int inflight = 0;
    std::vector<std::string> pending;
    int completed = 0;
    int total = 0;
    int success_count = 0;
    int fail_count = 0;
    int cancelled_count = 0;
    int uploads_pending = 0;
    std::map<std::string, DeviceStatus> devices;
};

// Fans one dump request out to a set of devices.
//
// All fleet state (the request, the job map, the inflight counter and the
// pending queue) belongs to a single control loop fed by one inbox. Public
// methods only post messages; jobs and the upload worker report back
// through the same inbox. Either call start() to run the loop on its own
// thread, or drive it by calling pump() from one thread.
class FleetDumpCoordinator {
public:
    FleetDumpCoordinator(FleetSettings settings,
                         ProcessRunner& runner,
                         DeviceTransport& transport,
                         UploadPipeline* uploader,
                         DumpPrompter* prompter,
                         FleetCallbacks callbacks = {});
    ~FleetDumpCoordinator();

    FleetDumpCoordinator(const FleetDumpCoordinator&) = delete;
    FleetDumpCoordinator& operator=(const FleetDumpCoordinator&) = delete;

    void start();
    void stop();

    // Ask for one dump per target. Dropped (with an error callback) while
    // another request is active.
    void request(DumpTrigger trigger,
                 std::vector<std::string> targets,
                 DumpRequestOptions options = {});

    // Two-stage operator confirmation on the caller's thread, then hands
    // the decision to the job. Returns true if a cancel was sent.
    bool cancel_device(const std::string& device_id);

    // Takes effect for the next request; a higher concurrency limit also
    // admits queued devices of the current one.
    void update_settings(const FleetSettings& settings);

    // Override job timing (tests use millisecond timeouts).
    void set_job_timing(const DumpJobTiming& timing);

    // Inbox endpoint the jobs write to.
    void post_event(const DumpEvent& event);

    // Process at most one inbox message. Returns false if none arrived
    // within the timeout.
    bool pump(std::chrono::milliseconds timeout = std::chrono::milliseconds(COORDINATOR_WAIT_MS));

    FleetStatus status() const;
    bool is_active() const { return active_flag_; }

    // Wait until no request is active and no upload is outstanding.
    bool wait_until_idle(std::chrono::milliseconds timeout);

private:
    struct FleetRequest {
        std::string issue_id;
        DumpTrigger trigger = DumpTrigger::Manual;
        DumpMode mode = DumpMode::Interactive;
        std::string request_device_id;
        std::string path_strategy;
        std::vector<std::string> targets;
        std::set<std::string> target_set;
        std::set<std::string> completed;
        std::map<std::string, DeviceResult> results;
        int success_count = 0;
        int fail_count = 0;
        int cancelled_count = 0;
        fs::path issue_root;
        std::optional<bool> upload_enabled;
    };

    struct UploadTask {
        std::string issue_id;
        fs::path issue_root;
        std::string remote_path;
        bool confirm = false;
    };

    struct Message {
        enum class Kind { Request, Job, Cancel, Reconfigure, Timing, UploadDone, Stop };

        Kind kind = Kind::Stop;
        DumpTrigger trigger = DumpTrigger::Manual;        // Request
        std::vector<std::string> targets;                 // Request
        DumpRequestOptions options;                       // Request
        DumpEvent event;                                  // Job
        std::string device_id;                            // Cancel
        CancelDecision decision;                          // Cancel
        FleetSettings settings;                           // Reconfigure
        DumpJobTiming timing;                             // Timing
        std::string issue_id;                             // UploadDone
        fs::path issue_root;                              // UploadDone
        UploadRecord upload;                              // UploadDone
        bool upload_declined = false;                     // UploadDone
    };

    void run_loop();
    void handle(Message& msg);
    void handle_request(Message& msg);
    void handle_job_event(const DumpEvent& ev);
    void handle_cancel(const std::string& device_id, const CancelDecision& decision);
    void handle_reconfigure(const FleetSettings& settings);
    void handle_upload_done(const Message& msg);

    void launch_pending();
    void advance();
    bool record_outcome(const DumpOutcome& outcome);
    void finish_request();
    void dispatch_upload();
    void persist(bool fresh = false);
    Manifest to_manifest() const;
    void emit_error(const std::string& message);
    void publish_status();
    void shutdown_jobs();

    void upload_loop();

    FleetSettings settings_;
    ProcessRunner& runner_;
    DeviceTransport& transport_;
    UploadPipeline* uploader_;
    DumpPrompter* prompter_;
    FleetCallbacks callbacks_;
    DumpJobTiming timing_;
    std::unique_ptr<PathNamingStrategy> strategy_;
    bool strategy_stale_ = false;

    BlockingQueue<Message> inbox_;

    // Control-loop state
    bool active_ = false;
    FleetRequest request_;
    std::map<std::string, std::unique_ptr<DumpJob>> jobs_;
    std::deque<std::string> pending_;
    int inflight_ = 0;
    int uploads_pending_ = 0;
    std::map<std::string, DeviceStatus> devices_;

    std::atomic<bool> active_flag_{false};
    std::atomic<bool> running_{false};
    std::thread loop_thread_;

    BlockingQueue<UploadTask> upload_queue_;
    std::thread upload_thread_;

    mutable std::mutex status_mutex_;
    std::condition_variable status_cv_;
    FleetStatus status_;
};
