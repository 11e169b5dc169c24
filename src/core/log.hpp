#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <core/types.hpp>
#include <core/utils.hpp>
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string dumpfleet_log_path() {
    static std::string path = (platform::temp_dir() / "dumpfleet_debug.log").string();
    return path;
}

// Extraction output log kept beside the dump: {working_dir}/extraction.log
inline std::filesystem::path extraction_log_path(const std::filesystem::path& working_dir) {
    return working_dir / EXTRACTION_LOG_NAME;
}

// Append a timestamped chunk of script output to the device's extraction log.
inline void append_extraction_log(const std::filesystem::path& working_dir,
                                  const std::string& msg) {
    std::ofstream f(extraction_log_path(working_dir), std::ios::app);
    if (f) {
        f << "[" << now_iso() << "] " << msg;
        if (msg.empty() || msg.back() != '\n') f << "\n";
    }
}

inline void dumpfleet_log(const std::string& msg) {
    std::ofstream out(dumpfleet_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << "[" << ts << "] " << msg << "\n";
}

inline void dumpfleet_log_shell(const std::string& label, const std::string& cmd,
                                const ShellResult& r) {
    dumpfleet_log(fmt::format("{} CMD: {}", label, cmd));
    if (r.unavailable()) {
        dumpfleet_log(fmt::format("{} unavailable: {}", label, r.error));
        return;
    }
    dumpfleet_log(fmt::format("{} exit={} output({})={}", label, r.exit_code,
                              r.output.size(), r.output.substr(0, 500)));
}
