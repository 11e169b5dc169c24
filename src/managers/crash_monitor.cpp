#include "crash_monitor.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

// ── Construction / Destruction ──────────────────────────────

CrashMonitor::CrashMonitor(DeviceTransport& transport, CrashMonitorConfig config,
                           TriggerCallback on_crash, BusyPredicate busy)
    : transport_(transport),
      config_(config),
      on_crash_(std::move(on_crash)),
      busy_(std::move(busy)) {
    if (config_.interval_ms < 100) config_.interval_ms = 100;
}

CrashMonitor::~CrashMonitor() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

bool CrashMonitor::start() {
    if (running_) return true;
    running_ = true;
    thread_ = std::thread(&CrashMonitor::monitor_loop, this);
    dumpfleet_log(fmt::format("crash_monitor: started, interval {}ms", config_.interval_ms));
    return true;
}

void CrashMonitor::stop() {
    if (!running_) return;

    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    dumpfleet_log("crash_monitor: stopped");
}

void CrashMonitor::update_devices(std::vector<std::string> devices) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_ = std::move(devices);
}

// ── Scanning ────────────────────────────────────────────────

std::vector<std::string> CrashMonitor::parse_listing(const std::string& output) {
    std::vector<std::string> names;
    for (auto line : split_lines(output)) {
        trim(line);
        if (line.empty() || line.rfind("ls:", 0) == 0) continue;
        if (line.find("core") == std::string::npos) continue;
        names.push_back(line);
    }
    return names;
}

bool CrashMonitor::poll_once() {
    if (busy_ && busy_()) return false;

    std::vector<std::string> devices;
    {
        std::lock_guard<std::mutex> lock(devices_mutex_);
        devices = devices_;
    }

    for (const auto& device : devices) {
        auto r = transport_.execute(device, COREDUMP_LIST_CMD);
        if (r.unavailable()) {
            dumpfleet_log(fmt::format("crash_monitor: {} unreachable: {}", device, r.error));
            continue;
        }
        // An empty directory makes ls exit 0 with no output; a missing one
        // exits non-zero. Neither holds a coredump.
        auto names = r.success() ? parse_listing(r.output) : std::vector<std::string>{};

        // Only names absent from the previous listing count; the extraction
        // script deletes what it pulled, so the set stays small
        auto& seen = seen_[device];
        std::vector<std::string> fresh;
        for (const auto& name : names) {
            if (!seen.count(name)) fresh.push_back(name);
        }
        seen = std::set<std::string>(names.begin(), names.end());
        if (fresh.empty()) continue;

        dumpfleet_log(fmt::format("crash_monitor: {} new coredump(s) on {}: {}",
                                  fresh.size(), device, join(fresh, ", ")));
        if (on_crash_) on_crash_(device, fresh);

        // One request covers the whole fleet; remaining devices are picked
        // up on the next scan
        return true;
    }
    return false;
}

void CrashMonitor::monitor_loop() {
    while (running_) {
        poll_once();

        // Sleep in 100ms increments for responsive shutdown
        for (int waited = 0; waited < config_.interval_ms && running_; waited += 100) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}
