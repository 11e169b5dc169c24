#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct DeviceResult {
    bool success = false;
    DumpErrorKind error = DumpErrorKind::None;
    std::string detail;
    std::string dump_path;
};

struct UploadRecord {
    bool success = false;
    std::string message;
    std::map<std::string, std::string> upload_info;
    std::vector<std::string> uploaded_files;     // relative to the issue dir
    std::string timestamp;                       // ISO, when the upload reported
};

// On-disk projection of one fleet request: {issue_root}/manifest.json
struct Manifest {
    std::string issue_id;
    DumpTrigger triggered_by = DumpTrigger::Manual;
    std::string path_strategy;
    std::string request_device_id;               // device that raised the trigger, if any
    std::vector<std::string> targets;
    std::map<std::string, DeviceResult> results;
    int success_count = 0;
    int fail_count = 0;
    int cancelled_count = 0;
    std::string issue_dir;
    std::optional<bool> upload_enabled;          // unset = global default applied
    std::optional<UploadRecord> upload_result;
};

class ManifestStore {
public:
    explicit ManifestStore(const fs::path& issue_root);

    Result<Manifest> load() const;

    // Rewrite the file wholesale from `manifest`.
    Result<void> save(const Manifest& manifest) const;

    // Read-modify-write: overlay `manifest` on whatever the file holds.
    // Keys this version does not know about are carried over, and an
    // upload_result already on disk survives an update that has none.
    Result<void> update(const Manifest& manifest) const;

    // Attach the upload outcome without touching any other field.
    Result<void> record_upload(const UploadRecord& record) const;

    bool exists() const;
    const fs::path& path() const { return manifest_path_; }

private:
    fs::path manifest_path_;
};
