#include "dump_helpers.hpp"
#include "../theme.hpp"
#include <core/constants.hpp>
#include <iostream>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

Result<DumpArgs> parse_dump_args(const std::vector<std::string>& args) {
    DumpArgs out;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "--headless") {
            out.headless = true;
        } else if (a == "--upload") {
            out.upload = true;
        } else if (a == "--no-upload") {
            out.upload = false;
        } else if (a == "--strategy") {
            if (i + 1 >= args.size()) {
                return Result<DumpArgs>::Err("--strategy needs a value (unified, individual, hybrid)");
            }
            out.strategy = args[++i];
            if (out.strategy != "unified" && out.strategy != "individual" &&
                out.strategy != "hybrid") {
                return Result<DumpArgs>::Err("Unknown path strategy: " + out.strategy);
            }
        } else if (a.rfind("--", 0) == 0) {
            return Result<DumpArgs>::Err("Unknown option: " + a);
        } else {
            out.devices.push_back(a);
        }
    }
    return Result<DumpArgs>::Ok(out);
}

std::vector<std::string> split_args(const std::string& arg) {
    std::vector<std::string> parts;
    std::istringstream iss(arg);
    std::string word;
    while (iss >> word) parts.push_back(word);
    return parts;
}

std::optional<fs::path> find_issue_root(const fs::path& path) {
    std::error_code ec;
    if (path.filename() == MANIFEST_FILENAME && fs::is_regular_file(path, ec)) {
        return path.parent_path();
    }
    if (fs::is_regular_file(path / MANIFEST_FILENAME, ec)) {
        return path;
    }
    // Device directory under a unified issue
    if (fs::is_regular_file(path.parent_path() / MANIFEST_FILENAME, ec)) {
        return path.parent_path();
    }
    return std::nullopt;
}

void print_manifest(const Manifest& m) {
    std::cout << theme::section("Issue " + m.issue_id);
    std::cout << theme::kv("Trigger", to_string(m.triggered_by));
    if (!m.request_device_id.empty()) {
        std::cout << theme::kv("Raised by", m.request_device_id);
    }
    std::cout << theme::kv("Strategy", m.path_strategy);
    std::cout << theme::kv("Directory", m.issue_dir);
    std::cout << theme::kv("Result", fmt::format("{} ok, {} failed, {} cancelled of {}",
                                                 m.success_count, m.fail_count,
                                                 m.cancelled_count, m.targets.size()));
    std::cout << "\n";

    for (const auto& device : m.targets) {
        auto it = m.results.find(device);
        if (it == m.results.end()) {
            std::cout << theme::info(device + ": " + theme::dim("pending"));
            continue;
        }
        const auto& r = it->second;
        if (r.success) {
            std::cout << theme::ok(device + ": " + r.detail);
        } else if (r.error == DumpErrorKind::Cancelled) {
            std::cout << theme::info(device + ": " + r.detail);
        } else {
            std::cout << theme::fail(fmt::format("{}: {} ({})", device, r.detail,
                                                 to_string(r.error)));
        }
    }

    if (m.upload_result) {
        const auto& u = *m.upload_result;
        std::cout << theme::section("Upload");
        std::cout << (u.success ? theme::ok(u.message) : theme::fail(u.message));
        auto url = u.upload_info.find("url");
        if (url != u.upload_info.end()) std::cout << theme::kv("URL", url->second);
        std::cout << theme::kv("Files", std::to_string(u.uploaded_files.size()));
        std::cout << theme::kv("At", u.timestamp);
    } else if (m.upload_enabled.has_value() && !*m.upload_enabled) {
        std::cout << "\n" << theme::dim("    Upload disabled for this issue.") << "\n";
    }
    std::cout << "\n";
}
