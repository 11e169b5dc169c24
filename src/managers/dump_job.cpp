#include "dump_job.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

// Items the extraction script normally leaves next to the archive. Missing
// ones are worth a warning, not a failure.
static const char* const EXPECTED_ITEMS[] = {"sw_version.txt", "coredump"};

DumpJobTiming DumpJobTiming::from(const DumpTimeouts& t) {
    DumpJobTiming timing;
    timing.headless_timeout = std::chrono::seconds(t.headless_secs);
    timing.interactive_timeout = std::chrono::seconds(t.interactive_secs);
    timing.cancel_grace = std::chrono::seconds(t.cancel_grace_secs);
    return timing;
}

// ── Construction / Destruction ──────────────────────────────

DumpJob::DumpJob(std::string device_id,
                 ProcessRunner& runner,
                 DeviceTransport& transport,
                 DumpPrompter* prompter,
                 DumpEventSink sink,
                 DumpJobTiming timing)
    : device_id_(std::move(device_id)),
      runner_(runner),
      transport_(transport),
      prompter_(prompter),
      sink_(std::move(sink)),
      timing_(timing) {}

DumpJob::~DumpJob() {
    stop();
}

// ── Public API ──────────────────────────────────────────────

bool DumpJob::start(DumpTrigger trigger, DumpMode mode,
                    const fs::path& working_dir,
                    const fs::path& script_path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DumpState::Idle) {
            dumpfleet_log(fmt::format("dump[{}]: start rejected, job is {}",
                                      device_id_, to_string(state_)));
            return false;
        }
        trigger_ = trigger;
        mode_ = mode;
        working_dir_ = working_dir;
        script_path_ = script_path;
        cancellation_requested_ = false;
        pending_cancel_.reset();
    }

    // Previous run has already reset to IDLE; reap its thread
    if (worker_.joinable()) worker_.join();

    stop_ = false;
    failure_.reset();
    cleanup_requested_ = false;
    cleanup_done_ = false;
    exited_ = false;
    exit_code_ = -1;
    exit_status_ = ExitStatus::Normal;

    dumpfleet_log(fmt::format("dump[{}]: start trigger={} mode={} dir={}",
                              device_id_, to_string(trigger), to_string(mode),
                              working_dir.string()));
    transition(DumpState::Starting);
    worker_ = std::thread(&DumpJob::run, this);
    return true;
}

bool DumpJob::cancel(const CancelDecision& decision) {
    if (!decision.confirmed) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != DumpState::Extracting || mode_ != DumpMode::Interactive ||
            cancellation_requested_ || pending_cancel_) {
            return false;
        }
        pending_cancel_ = decision;
    }
    wake_.notify_all();
    return true;
}

void DumpJob::stop() {
    stop_ = true;
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void DumpJob::wait() {
    if (worker_.joinable()) worker_.join();
}

DumpState DumpJob::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

DumpMode DumpJob::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

DumpTrigger DumpJob::trigger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return trigger_;
}

bool DumpJob::cancellation_requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancellation_requested_;
}

fs::path DumpJob::working_dir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return working_dir_;
}

// ── Worker ──────────────────────────────────────────────────

void DumpJob::run() {
    DumpOutcome outcome;

    if (stop_) {
        transition(DumpState::Failed);
        transition(DumpState::Idle);
        return;
    }

    auto setup_failure = launch();
    if (setup_failure) {
        transition(DumpState::Failed);
        outcome = make_outcome(DumpState::Failed, setup_failure->kind, setup_failure->detail);
    } else {
        supervise();
        if (stop_) {
            // Shutdown: the process is dead, nobody is waiting for a report
            process_.reset();
            transition(DumpState::Idle);
            dumpfleet_log(fmt::format("dump[{}]: stopped", device_id_));
            return;
        }
        outcome = conclude();
    }

    process_.reset();
    dumpfleet_log(fmt::format("dump[{}]: outcome {} ({})", device_id_,
                              to_string(outcome.error), outcome.detail));
    progress(outcome.detail);

    DumpEvent ev;
    ev.kind = DumpEvent::Kind::Finished;
    ev.device_id = device_id_;
    ev.trigger = outcome.trigger;
    ev.outcome = outcome;
    sink_(ev);

    if (mode() == DumpMode::Interactive && prompter_) {
        prompter_->show_completion(outcome);
    }

    if (is_terminal(state())) transition(DumpState::Idle);
}

std::optional<DumpJob::Failure> DumpJob::launch() {
    fs::path dir = working_dir();
    fs::path script;
    DumpMode mode;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        script = script_path_;
        mode = mode_;
    }

    progress("Starting coredump extraction...");

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        return Failure{DumpErrorKind::Setup,
                       fmt::format("Failed to create working directory {}: {}",
                                   dir.string(), ec ? ec.message() : "not a directory")};
    }

    if (!fs::exists(script, ec)) {
        return Failure{DumpErrorKind::Setup,
                       fmt::format("Dump script not found: {}", script.string())};
    }

    auto started = runner_.start(script, dir, {{DEVICE_SERIAL_ENV, device_id_}});
    if (started.is_err()) {
        dumpfleet_log(fmt::format("dump[{}]: {}", device_id_, started.error));
        return Failure{DumpErrorKind::Process, describe(ProcessError::FailedToStart)};
    }
    process_ = std::move(started.value);

    transition(DumpState::Extracting);
    deadline_.arm(mode == DumpMode::Headless ? timing_.headless_timeout
                                             : timing_.interactive_timeout);
    progress(fmt::format("Extracting coredump... (PID: {})", process_->pid()));
    return std::nullopt;
}

void DumpJob::supervise() {
    using Clock = Deadline::Clock;
    const auto started_at = Clock::now();
    auto next_tick = started_at + timing_.tick;
    const bool headless = mode() == DumpMode::Headless;
    const fs::path dir = working_dir();

    while (true) {
        for (auto& ev : process_->poll()) {
            switch (ev.kind) {
                case ProcessEvent::Kind::Started:
                    break;
                case ProcessEvent::Kind::Output:
                    append_extraction_log(dir, ev.output);
                    break;
                case ProcessEvent::Kind::Error:
                    dumpfleet_log(fmt::format("dump[{}]: process error: {}",
                                              device_id_, describe(ev.error)));
                    if (!failure_ && !cancellation_requested()) {
                        failure_ = Failure{DumpErrorKind::Process, describe(ev.error)};
                        process_->kill();
                    }
                    break;
                case ProcessEvent::Kind::Finished:
                    exited_ = true;
                    exit_code_ = ev.exit_code;
                    exit_status_ = ev.exit_status;
                    break;
            }
        }
        if (exited_) break;

        if (stop_) {
            process_->kill();
            std::unique_lock<std::mutex> lock(mutex_);
            wake_.wait_for(lock, timing_.poll);
            continue;
        }

        std::optional<CancelDecision> decision;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            decision.swap(pending_cancel_);
            if (decision) cancellation_requested_ = true;
        }
        if (decision) {
            cleanup_requested_ = decision->cleanup;
            deadline_.disarm();
            process_->terminate();
            kill_deadline_.arm(timing_.cancel_grace);
            dumpfleet_log(fmt::format("dump[{}]: cancel confirmed (cleanup={}), SIGTERM sent",
                                      device_id_, cleanup_requested_));
            progress("Cancelling dump extraction...");
        }

        auto now = Clock::now();
        if (deadline_.expired(now)) {
            deadline_.disarm();
            failure_ = Failure{DumpErrorKind::Timeout, "Dump extraction timed out"};
            dumpfleet_log(fmt::format("dump[{}]: deadline exceeded, killing pid {}",
                                      device_id_, process_->pid()));
            process_->kill();
        }
        if (kill_deadline_.expired(now)) {
            kill_deadline_.disarm();
            if (process_->state() == ProcessState::Running) {
                dumpfleet_log(fmt::format("dump[{}]: still running after grace period, killing",
                                          device_id_));
                process_->kill();
            }
        }

        if (headless && !failure_ && now >= next_tick) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - started_at);
            progress(fmt::format("Extracting coredump... ({}s)", elapsed.count()));
            next_tick += timing_.tick;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, timing_.poll, [this] {
            return stop_.load() || pending_cancel_.has_value();
        });
    }

    deadline_.disarm();
    kill_deadline_.disarm();
}

DumpOutcome DumpJob::conclude() {
    if (cancellation_requested()) {
        if (cleanup_requested_) cleanup_device();
        transition(DumpState::Idle);
        return make_outcome(DumpState::Idle, DumpErrorKind::Cancelled,
                            "Dump extraction cancelled by user");
    }
    if (failure_) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, failure_->kind, failure_->detail);
    }
    if (exit_status_ == ExitStatus::Crashed) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, DumpErrorKind::Process,
                            describe(ProcessError::Crashed));
    }
    if (exit_code_ != 0) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, DumpErrorKind::Process,
                            fmt::format("Process failed with exit_code: {}", exit_code_));
    }

    transition(DumpState::Verifying);
    progress("Verifying dump files...");
    return verify();
}

DumpOutcome DumpJob::verify() {
    const fs::path dir = working_dir();
    std::error_code ec;
    int found = 0;
    int valid = 0;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.path().extension() != ".zip") continue;
        if (!entry.is_regular_file(entry_ec)) continue;
        ++found;
        auto size = entry.file_size(entry_ec);
        if (entry_ec || size == 0) continue;
        std::ifstream zip(entry.path(), std::ios::binary);
        if (!zip) continue;
        ++valid;
    }
    if (ec) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, DumpErrorKind::Verification,
                            fmt::format("Cannot read dump directory: {}", ec.message()));
    }

    if (found == 0) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, DumpErrorKind::Verification,
                            "No zip files found");
    }
    if (valid == 0) {
        transition(DumpState::Failed);
        return make_outcome(DumpState::Failed, DumpErrorKind::Verification,
                            "No valid zip files found");
    }

    for (const char* item : EXPECTED_ITEMS) {
        if (!fs::exists(dir / item, ec)) {
            dumpfleet_log(fmt::format("dump[{}]: warning: expected item missing: {}",
                                      device_id_, item));
        }
    }

    transition(DumpState::Completed);
    auto outcome = make_outcome(DumpState::Completed, DumpErrorKind::None,
                                fmt::format("Dump completed successfully - {} zip files created",
                                            valid));
    outcome.archive_count = valid;
    return outcome;
}

void DumpJob::cleanup_device() {
    if (cleanup_done_) return;
    cleanup_done_ = true;

    auto r = transport_.execute(device_id_, DEVICE_CLEANUP_CMD);
    if (r.unavailable()) {
        dumpfleet_log(fmt::format("dump[{}]: device cleanup failed, transport unavailable: {}",
                                  device_id_, r.error));
    } else if (!r.success()) {
        dumpfleet_log(fmt::format("dump[{}]: device cleanup exited {}", device_id_, r.exit_code));
    } else {
        dumpfleet_log(fmt::format("dump[{}]: device crash artifacts removed", device_id_));
    }
}

// ── Helpers ─────────────────────────────────────────────────

void DumpJob::transition(DumpState to) {
    DumpEvent ev;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!can_transition(state_, to)) {
            dumpfleet_log(fmt::format("dump[{}]: illegal transition {} -> {} ignored",
                                      device_id_, to_string(state_), to_string(to)));
            return;
        }
        ev.old_state = state_;
        ev.trigger = trigger_;
        state_ = to;
    }
    ev.kind = DumpEvent::Kind::StatusChanged;
    ev.device_id = device_id_;
    ev.new_state = to;
    dumpfleet_log(fmt::format("dump[{}]: {} -> {}", device_id_,
                              to_string(ev.old_state), to_string(to)));
    sink_(ev);
}

void DumpJob::progress(const std::string& msg) {
    DumpEvent ev;
    ev.kind = DumpEvent::Kind::Progress;
    ev.device_id = device_id_;
    ev.trigger = trigger();
    ev.message = msg;
    sink_(ev);
}

DumpOutcome DumpJob::make_outcome(DumpState final_state, DumpErrorKind kind,
                                  const std::string& detail) const {
    DumpOutcome outcome;
    outcome.device_id = device_id_;
    outcome.trigger = trigger();
    outcome.final_state = final_state;
    outcome.error = kind;
    outcome.detail = detail;
    outcome.dump_path = working_dir();
    return outcome;
}
