#pragma once

#include <string>
#include <core/types.hpp>

// Shell access to one attached device, addressed by serial.
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    // Run a shell command on the device. Unavailable means the command
    // never reached the device, which is different from empty output.
    virtual ShellResult execute(const std::string& device_id,
                                const std::string& shell_command) = 0;
};
