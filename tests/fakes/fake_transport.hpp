#pragma once

#include <device/device_transport.hpp>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Records every command and answers from a per-command script.
class FakeTransport : public DeviceTransport {
public:
    ShellResult execute(const std::string& device_id,
                        const std::string& shell_command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.emplace_back(device_id, shell_command);

        auto per_device = responses_.find(device_id + "|" + shell_command);
        if (per_device != responses_.end()) return per_device->second;
        auto any = responses_.find(shell_command);
        if (any != responses_.end()) return any->second;
        return fallback_;
    }

    void respond(const std::string& command, ShellResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[command] = std::move(result);
    }

    void respond(const std::string& device, const std::string& command, ShellResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[device + "|" + command] = std::move(result);
    }

    void set_fallback(ShellResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_ = std::move(result);
    }

    int count(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& c : calls_) {
            if (c.second == command) ++n;
        }
        return n;
    }

    std::vector<std::pair<std::string, std::string>> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    std::mutex mutex_;
    std::map<std::string, ShellResult> responses_;
    ShellResult fallback_ = ShellResult::ok("");
    std::vector<std::pair<std::string, std::string>> calls_;
};
