#include "fleet_coordinator.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>

// ── Construction / Destruction ──────────────────────────────

FleetDumpCoordinator::FleetDumpCoordinator(FleetSettings settings,
                                           ProcessRunner& runner,
                                           DeviceTransport& transport,
                                           UploadPipeline* uploader,
                                           DumpPrompter* prompter,
                                           FleetCallbacks callbacks)
    : settings_(std::move(settings)),
      runner_(runner),
      transport_(transport),
      uploader_(uploader),
      prompter_(prompter),
      callbacks_(std::move(callbacks)),
      timing_(DumpJobTiming::from(settings_.timeouts)) {
    if (settings_.max_concurrency < 1) settings_.max_concurrency = 1;
    strategy_ = make_path_strategy(settings_.path_strategy, settings_.log_directory,
                                   settings_.directory_prefix);
    if (uploader_) {
        upload_thread_ = std::thread(&FleetDumpCoordinator::upload_loop, this);
    }
}

FleetDumpCoordinator::~FleetDumpCoordinator() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

void FleetDumpCoordinator::start() {
    if (running_) return;
    running_ = true;
    loop_thread_ = std::thread(&FleetDumpCoordinator::run_loop, this);
    dumpfleet_log("coordinator: started");
}

void FleetDumpCoordinator::stop() {
    if (loop_thread_.joinable()) {
        Message msg;
        msg.kind = Message::Kind::Stop;
        inbox_.push(std::move(msg));
        loop_thread_.join();
    }
    running_ = false;

    // Loop thread is gone (or never ran); fleet state is ours to tear down
    shutdown_jobs();
    upload_queue_.close();
    if (upload_thread_.joinable()) upload_thread_.join();
    inbox_.close();
}

void FleetDumpCoordinator::run_loop() {
    while (running_) {
        pump();
    }
    dumpfleet_log("coordinator: stopped");
}

void FleetDumpCoordinator::shutdown_jobs() {
    if (jobs_.empty()) return;
    dumpfleet_log(fmt::format("coordinator: stopping {} job(s)", jobs_.size()));
    jobs_.clear();
    active_ = false;
    active_flag_ = false;
    pending_.clear();
    inflight_ = 0;
    publish_status();
}

// ── Public API (any thread) ─────────────────────────────────

void FleetDumpCoordinator::request(DumpTrigger trigger,
                                   std::vector<std::string> targets,
                                   DumpRequestOptions options) {
    Message msg;
    msg.kind = Message::Kind::Request;
    msg.trigger = trigger;
    msg.targets = std::move(targets);
    msg.options = std::move(options);
    inbox_.push(std::move(msg));
}

bool FleetDumpCoordinator::cancel_device(const std::string& device_id) {
    auto snapshot = status();
    auto it = snapshot.devices.find(device_id);
    if (!snapshot.active || it == snapshot.devices.end() ||
        it->second.state != DumpState::Extracting) {
        dumpfleet_log("coordinator: nothing to cancel on " + device_id);
        return false;
    }
    if (it->second.mode != DumpMode::Interactive) {
        dumpfleet_log("coordinator: " + device_id + " runs headless, cancel refused");
        return false;
    }

    CancelDecision decision{true, false};
    if (prompter_) decision = prompter_->confirm_cancel(device_id);
    if (!decision.confirmed) return false;

    Message msg;
    msg.kind = Message::Kind::Cancel;
    msg.device_id = device_id;
    msg.decision = decision;
    inbox_.push(std::move(msg));
    return true;
}

void FleetDumpCoordinator::update_settings(const FleetSettings& settings) {
    Message msg;
    msg.kind = Message::Kind::Reconfigure;
    msg.settings = settings;
    inbox_.push(std::move(msg));
}

void FleetDumpCoordinator::set_job_timing(const DumpJobTiming& timing) {
    Message msg;
    msg.kind = Message::Kind::Timing;
    msg.timing = timing;
    inbox_.push(std::move(msg));
}

void FleetDumpCoordinator::post_event(const DumpEvent& event) {
    Message msg;
    msg.kind = Message::Kind::Job;
    msg.event = event;
    inbox_.push(std::move(msg));
}

bool FleetDumpCoordinator::pump(std::chrono::milliseconds timeout) {
    auto msg = inbox_.pop_for(timeout);
    if (!msg) return false;
    handle(*msg);
    publish_status();
    return true;
}

FleetStatus FleetDumpCoordinator::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

bool FleetDumpCoordinator::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(status_mutex_);
    return status_cv_.wait_for(lock, timeout, [this] {
        return !status_.active && status_.uploads_pending == 0;
    });
}

// ── Message dispatch (control loop) ─────────────────────────

void FleetDumpCoordinator::handle(Message& msg) {
    switch (msg.kind) {
        case Message::Kind::Request:     handle_request(msg); break;
        case Message::Kind::Job:         handle_job_event(msg.event); break;
        case Message::Kind::Cancel:      handle_cancel(msg.device_id, msg.decision); break;
        case Message::Kind::Reconfigure: handle_reconfigure(msg.settings); break;
        case Message::Kind::Timing:      timing_ = msg.timing; break;
        case Message::Kind::UploadDone:  handle_upload_done(msg); break;
        case Message::Kind::Stop:        running_ = false; break;
    }
}

void FleetDumpCoordinator::handle_request(Message& msg) {
    if (active_) {
        dumpfleet_log(fmt::format("coordinator: request ({}) ignored, {} still in progress",
                                  to_string(msg.trigger), request_.issue_id));
        emit_error(fmt::format("Dump request ignored: issue {} is still in progress",
                               request_.issue_id));
        return;
    }

    // Keep first occurrence order, drop duplicates and blanks
    std::vector<std::string> targets;
    std::set<std::string> seen;
    for (auto& t : msg.targets) {
        if (!t.empty() && seen.insert(t).second) targets.push_back(t);
    }
    if (targets.empty()) {
        dumpfleet_log("coordinator: request with no target devices");
        emit_error("No target devices for dump request");
        return;
    }

    if (strategy_stale_) {
        strategy_ = make_path_strategy(settings_.path_strategy, settings_.log_directory,
                                       settings_.directory_prefix);
        strategy_stale_ = false;
    }

    std::string issue_id = msg.options.timestamp ? *msg.options.timestamp : issue_timestamp();
    fs::path issue_root =
        strategy_->dump_directory(targets.front(), issue_id, msg.trigger).parent_path();

    std::error_code ec;
    fs::create_directories(issue_root, ec);
    if (ec) {
        dumpfleet_log(fmt::format("coordinator: cannot create {}: {}",
                                  issue_root.string(), ec.message()));
        emit_error(fmt::format("Cannot create issue directory {}: {}",
                               issue_root.string(), ec.message()));
        return;
    }

    request_ = FleetRequest{};
    request_.issue_id = issue_id;
    request_.trigger = msg.trigger;
    request_.mode = msg.options.mode ? *msg.options.mode
                  : is_automated(msg.trigger) ? settings_.automated_mode
                                              : settings_.manual_mode;
    request_.request_device_id = msg.options.request_device_id;
    request_.path_strategy = strategy_->name();
    request_.targets = targets;
    request_.target_set = std::set<std::string>(targets.begin(), targets.end());
    request_.issue_root = issue_root;
    request_.upload_enabled = msg.options.upload_enabled;

    active_ = true;
    active_flag_ = true;
    devices_.clear();
    for (const auto& t : targets) devices_[t] = DeviceStatus{DumpState::Idle, request_.mode, ""};
    pending_.assign(targets.begin(), targets.end());
    inflight_ = 0;

    dumpfleet_log(fmt::format("coordinator: issue {} trigger={} mode={} targets=[{}] root={}",
                              issue_id, to_string(msg.trigger), to_string(request_.mode),
                              join(targets, ","), issue_root.string()));
    persist(true);
    advance();
}

void FleetDumpCoordinator::handle_job_event(const DumpEvent& ev) {
    switch (ev.kind) {
        case DumpEvent::Kind::StatusChanged: {
            auto it = devices_.find(ev.device_id);
            if (active_ && it != devices_.end()) it->second.state = ev.new_state;
            break;
        }
        case DumpEvent::Kind::Progress: {
            auto it = devices_.find(ev.device_id);
            if (active_ && it != devices_.end()) it->second.last_message = ev.message;
            break;
        }
        case DumpEvent::Kind::Finished:
            if (record_outcome(ev.outcome)) {
                --inflight_;
                advance();
            }
            break;
    }
    if (callbacks_.on_device_event) callbacks_.on_device_event(ev);
}

void FleetDumpCoordinator::handle_cancel(const std::string& device_id,
                                         const CancelDecision& decision) {
    auto it = jobs_.find(device_id);
    if (it == jobs_.end()) {
        dumpfleet_log("coordinator: cancel for unknown job " + device_id);
        return;
    }
    if (!it->second->cancel(decision)) {
        dumpfleet_log("coordinator: " + device_id + " no longer cancellable");
    }
}

void FleetDumpCoordinator::handle_reconfigure(const FleetSettings& settings) {
    settings_ = settings;
    if (settings_.max_concurrency < 1) settings_.max_concurrency = 1;
    timing_ = DumpJobTiming::from(settings_.timeouts);
    strategy_stale_ = true;
    dumpfleet_log(fmt::format("coordinator: settings updated (max_concurrency={}, strategy={})",
                              settings_.max_concurrency, settings_.path_strategy));
    if (active_) advance();
}

void FleetDumpCoordinator::handle_upload_done(const Message& msg) {
    if (uploads_pending_ > 0) --uploads_pending_;
    if (msg.upload_declined) {
        dumpfleet_log("coordinator: upload of " + msg.issue_id + " declined");
        return;
    }

    ManifestStore store(msg.issue_root);
    auto written = store.record_upload(msg.upload);
    if (written.is_err()) {
        dumpfleet_log("coordinator: manifest upload record failed: " + written.error);
    }
    if (callbacks_.on_upload) callbacks_.on_upload(msg.issue_id, msg.upload);
}

// ── Admission and aggregation ───────────────────────────────

void FleetDumpCoordinator::launch_pending() {
    while (active_ && !pending_.empty() && inflight_ < settings_.max_concurrency) {
        std::string device = pending_.front();
        pending_.pop_front();

        fs::path dir = strategy_->dump_directory(device, request_.issue_id, request_.trigger);
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            DumpOutcome outcome;
            outcome.device_id = device;
            outcome.trigger = request_.trigger;
            outcome.error = DumpErrorKind::Setup;
            outcome.detail = fmt::format("Failed to create dump directory {}: {}",
                                         dir.string(), ec.message());
            outcome.dump_path = dir;
            record_outcome(outcome);
            continue;
        }

        auto job = std::make_unique<DumpJob>(
            device, runner_, transport_, prompter_,
            [this](const DumpEvent& ev) { post_event(ev); },
            timing_);
        DumpJob* raw = job.get();
        jobs_[device] = std::move(job);
        ++inflight_;

        if (!raw->start(request_.trigger, request_.mode, dir, settings_.script_path)) {
            --inflight_;
            DumpOutcome outcome;
            outcome.device_id = device;
            outcome.trigger = request_.trigger;
            outcome.error = DumpErrorKind::Setup;
            outcome.detail = "Dump job could not be started";
            outcome.dump_path = dir;
            record_outcome(outcome);
        }
    }
}

void FleetDumpCoordinator::advance() {
    launch_pending();
    if (active_ && request_.completed.size() == request_.target_set.size()) {
        finish_request();
    }
}

// Returns false for reports that do not belong to the active request or
// repeat one already recorded.
bool FleetDumpCoordinator::record_outcome(const DumpOutcome& outcome) {
    if (!active_ || !request_.target_set.count(outcome.device_id)) {
        dumpfleet_log("coordinator: stray outcome for " + outcome.device_id + " ignored");
        return false;
    }
    if (request_.completed.count(outcome.device_id)) {
        dumpfleet_log("coordinator: duplicate outcome for " + outcome.device_id + " ignored");
        return false;
    }

    request_.completed.insert(outcome.device_id);

    DeviceResult result;
    result.success = outcome.success();
    result.error = outcome.error;
    result.detail = outcome.detail;
    result.dump_path = outcome.dump_path.string();
    request_.results[outcome.device_id] = result;

    if (outcome.success()) {
        ++request_.success_count;
    } else if (outcome.cancelled()) {
        ++request_.cancelled_count;
    } else {
        ++request_.fail_count;
    }

    auto dev = devices_.find(outcome.device_id);
    if (dev != devices_.end()) dev->second.last_message = outcome.detail;

    int completed = static_cast<int>(request_.completed.size());
    int total = static_cast<int>(request_.target_set.size());
    dumpfleet_log(fmt::format("coordinator: {} -> {} ({}/{})", outcome.device_id,
                              to_string(outcome.error), completed, total));

    persist();
    if (callbacks_.on_progress) callbacks_.on_progress(request_.issue_id, completed, total);
    return true;
}

void FleetDumpCoordinator::finish_request() {
    FleetSummary summary;
    summary.issue_id = request_.issue_id;
    summary.success_count = request_.success_count;
    summary.fail_count = request_.fail_count;
    summary.cancelled_count = request_.cancelled_count;
    summary.issue_root = request_.issue_root;

    dumpfleet_log(fmt::format("coordinator: issue {} complete: {} ok, {} failed, {} cancelled",
                              summary.issue_id, summary.success_count, summary.fail_count,
                              summary.cancelled_count));
    if (callbacks_.on_completed) callbacks_.on_completed(summary);

    bool upload = request_.upload_enabled.value_or(settings_.upload_enabled);
    if (!upload) {
        dumpfleet_log("coordinator: upload disabled for " + request_.issue_id);
    } else if (request_.success_count == 0) {
        dumpfleet_log("coordinator: no successful dumps in " + request_.issue_id + ", skipping upload");
    } else if (!uploader_) {
        dumpfleet_log("coordinator: no upload pipeline configured");
    } else {
        dispatch_upload();
    }

    // Jobs have all reported; joining them only waits for their reset
    jobs_.clear();
    pending_.clear();
    inflight_ = 0;
    active_ = false;
    active_flag_ = false;
    request_ = FleetRequest{};
}

void FleetDumpCoordinator::dispatch_upload() {
    UploadTask task;
    task.issue_id = request_.issue_id;
    task.issue_root = request_.issue_root;
    task.remote_path = fmt::format("{}/{}", settings_.upload_prefix, request_.issue_id);
    task.confirm = !is_automated(request_.trigger);

    ++uploads_pending_;
    dumpfleet_log(fmt::format("coordinator: upload queued {} -> {}{}",
                              task.issue_root.string(), task.remote_path,
                              task.confirm ? " (awaiting confirmation)" : ""));
    upload_queue_.push(std::move(task));
}

// ── Upload worker ───────────────────────────────────────────

void FleetDumpCoordinator::upload_loop() {
    while (auto task = upload_queue_.pop()) {
        Message done;
        done.kind = Message::Kind::UploadDone;
        done.issue_id = task->issue_id;
        done.issue_root = task->issue_root;

        if (task->confirm && prompter_ &&
            !prompter_->confirm_upload(task->issue_root, task->remote_path)) {
            done.upload_declined = true;
            inbox_.push(std::move(done));
            continue;
        }

        UploadRecord record;
        auto setup = uploader_->verify_setup();
        if (setup.is_err()) {
            record.success = false;
            record.message = "Upload setup check failed: " + setup.error;
        } else {
            auto result = uploader_->upload_directory(task->issue_root, task->remote_path);
            record.success = result.success;
            record.message = result.message;
            record.upload_info = result.data;
            if (result.success) record.uploaded_files = list_files_recursive(task->issue_root);
        }
        record.timestamp = now_iso();
        dumpfleet_log(fmt::format("upload: {} {}", task->issue_id, record.message));

        done.upload = std::move(record);
        inbox_.push(std::move(done));
    }
}

// ── Persistence and status ──────────────────────────────────

Manifest FleetDumpCoordinator::to_manifest() const {
    Manifest m;
    m.issue_id = request_.issue_id;
    m.triggered_by = request_.trigger;
    m.path_strategy = request_.path_strategy;
    m.request_device_id = request_.request_device_id;
    m.targets = request_.targets;
    m.results = request_.results;
    m.success_count = request_.success_count;
    m.fail_count = request_.fail_count;
    m.cancelled_count = request_.cancelled_count;
    m.issue_dir = request_.issue_root.string();
    m.upload_enabled = request_.upload_enabled;
    return m;
}

// Failure leaves the in-memory request authoritative; every later event
// rewrites the whole file, which retries the write. A new request replaces
// whatever an earlier one left in a shared issue root.
void FleetDumpCoordinator::persist(bool fresh) {
    ManifestStore store(request_.issue_root);
    auto r = fresh ? store.save(to_manifest()) : store.update(to_manifest());
    if (r.is_err()) {
        dumpfleet_log("coordinator: manifest write failed: " + r.error);
    }
}

void FleetDumpCoordinator::emit_error(const std::string& message) {
    if (callbacks_.on_error) callbacks_.on_error(message);
}

void FleetDumpCoordinator::publish_status() {
    FleetStatus s;
    s.active = active_;
    s.issue_id = request_.issue_id;
    s.issue_root = request_.issue_root;
    s.trigger = request_.trigger;
    s.inflight = inflight_;
    s.pending.assign(pending_.begin(), pending_.end());
    s.completed = static_cast<int>(request_.completed.size());
    s.total = static_cast<int>(request_.target_set.size());
    s.success_count = request_.success_count;
    s.fail_count = request_.fail_count;
    s.cancelled_count = request_.cancelled_count;
    s.uploads_pending = uploads_pending_;
    if (active_) s.devices = devices_;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = std::move(s);
    }
    status_cv_.notify_all();
}
