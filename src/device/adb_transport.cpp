#include "adb_transport.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

AdbTransport::AdbTransport(std::string adb_path, int timeout_secs)
    : adb_path_(std::move(adb_path)), timeout_secs_(timeout_secs) {}

ShellResult AdbTransport::execute(const std::string& device_id,
                                  const std::string& shell_command) {
    auto r = platform::run_capture(adb_path_, {"-s", device_id, "shell", shell_command},
                                   timeout_secs_);
    ShellResult result;
    if (!r.started) {
        result = ShellResult::unavailable(r.error);
    } else if (r.timed_out) {
        result = ShellResult::unavailable(r.error);
    } else if (r.exit_code == 0) {
        result = ShellResult::ok(r.output);
    } else if (r.output.find("device '" + device_id + "' not found") != std::string::npos ||
               r.output.find("no devices/emulators found") != std::string::npos ||
               r.output.find("device offline") != std::string::npos) {
        // adb itself failed to reach the device
        result = ShellResult::unavailable(r.output);
    } else {
        result = ShellResult::failed(r.exit_code, r.output);
    }

    dumpfleet_log_shell(fmt::format("adb[{}]", device_id), shell_command, result);
    return result;
}
