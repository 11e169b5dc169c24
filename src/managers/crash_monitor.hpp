#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <device/device_transport.hpp>

// Watches the devices' coredump directories and raises a crash_monitor
// dump request when a new coredump shows up.
class CrashMonitor {
public:
    // device that produced the new coredump, and the new file names
    using TriggerCallback = std::function<void(const std::string& device_id,
                                               const std::vector<std::string>& coredumps)>;
    using BusyPredicate = std::function<bool()>;

    CrashMonitor(DeviceTransport& transport, CrashMonitorConfig config,
                 TriggerCallback on_crash, BusyPredicate busy = {});
    ~CrashMonitor();

    bool start();
    void stop();
    bool running() const { return running_; }

    void update_devices(std::vector<std::string> devices);

    // One scan over all devices. Returns true if a request was triggered.
    bool poll_once();

    // Coredump names in the output of the device-side ls.
    static std::vector<std::string> parse_listing(const std::string& output);

private:
    void monitor_loop();

    DeviceTransport& transport_;
    CrashMonitorConfig config_;
    TriggerCallback on_crash_;
    BusyPredicate busy_;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex devices_mutex_;
    std::vector<std::string> devices_;

    // Poll-thread state
    std::map<std::string, std::set<std::string>> seen_;
};
