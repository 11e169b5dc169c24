#include "upload_pipeline.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

std::vector<std::string> list_files_recursive(const fs::path& root) {
    std::vector<std::string> files;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec)) {
            files.push_back(fs::relative(it->path(), root, entry_ec).generic_string());
        }
    }
    if (ec) {
        dumpfleet_log(fmt::format("upload: listing {} stopped early: {}", root.string(), ec.message()));
    }
    std::sort(files.begin(), files.end());
    return files;
}

JFrogUploader::JFrogUploader(ArtifactStoreConfig config, std::string jf_path)
    : config_(std::move(config)), jf_path_(std::move(jf_path)) {}

Result<void> JFrogUploader::verify_setup() {
    auto version = platform::run_capture(jf_path_, {"--version"}, UPLOAD_VERIFY_TIMEOUT_SECS);
    if (!version.started || version.exit_code != 0) {
        return Result<void>::Err("JFrog CLI (jf) is not installed or not runnable");
    }

    std::vector<std::string> ping_args = {"rt", "ping"};
    if (!config_.server_id.empty()) ping_args.push_back("--server-id=" + config_.server_id);
    auto ping = platform::run_capture(jf_path_, ping_args, UPLOAD_VERIFY_TIMEOUT_SECS);
    if (ping.timed_out) {
        return Result<void>::Err("Artifactory ping timed out");
    }
    if (ping.exit_code != 0) {
        std::string out = ping.output;
        trim(out);
        return Result<void>::Err(fmt::format("Artifactory not reachable: {}",
                                             out.empty() ? "jf rt ping failed" : out));
    }
    return Result<void>::Ok();
}

UploadResult JFrogUploader::upload_directory(const fs::path& local_path,
                                             const std::string& remote_path) {
    UploadResult result;
    std::error_code ec;
    if (!fs::is_directory(local_path, ec)) {
        result.message = "Upload source is not a directory: " + local_path.string();
        return result;
    }

    auto files = list_files_recursive(local_path);
    if (files.empty()) {
        result.message = "Nothing to upload in " + local_path.string();
        return result;
    }

    std::string target_base = fmt::format("{}/{}", config_.repository, remote_path);
    int uploaded = 0;
    int failed = 0;
    uintmax_t total_size = 0;
    std::string last_error;

    for (const auto& rel : files) {
        fs::path file = local_path / rel;
        std::vector<std::string> args = {"rt", "upload", "--flat=true"};
        if (!config_.server_id.empty()) args.push_back("--server-id=" + config_.server_id);
        args.push_back(file.string());
        args.push_back(target_base + "/" + rel);

        auto r = platform::run_capture(jf_path_, args, config_.timeout_secs);
        if (r.started && !r.timed_out && r.exit_code == 0) {
            ++uploaded;
            auto size = fs::file_size(file, ec);
            if (!ec) total_size += size;
        } else {
            ++failed;
            last_error = r.timed_out ? r.error : r.output;
            trim(last_error);
            dumpfleet_log(fmt::format("upload: {} failed: {}", rel, last_error));
        }
    }

    result.success = failed == 0 && uploaded > 0;
    result.data["upload_target"] = target_base;
    result.data["url"] = fmt::format("{}/{}", config_.server_url, target_base);
    result.data["total_uploaded"] = std::to_string(uploaded);
    result.data["total_failed"] = std::to_string(failed);
    result.data["total_size"] = std::to_string(total_size);
    result.message = result.success
        ? fmt::format("Uploaded {} files to {}", uploaded, target_base)
        : fmt::format("{} of {} files failed to upload: {}", failed, files.size(), last_error);

    dumpfleet_log("upload: " + result.message);
    return result;
}
