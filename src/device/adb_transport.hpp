#pragma once

#include <string>
#include "device_transport.hpp"

// DeviceTransport over `adb -s <serial> shell <cmd>`.
class AdbTransport : public DeviceTransport {
public:
    explicit AdbTransport(std::string adb_path = "adb",
                          int timeout_secs = DEVICE_CMD_TIMEOUT_SECS);

    ShellResult execute(const std::string& device_id,
                        const std::string& shell_command) override;

private:
    std::string adb_path_;
    int timeout_secs_;
};
