#include "manifest_store.hpp"
#include <core/constants.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <system_error>

using json = nlohmann::json;

// ── JSON mapping ────────────────────────────────────────────

static json device_result_to_json(const DeviceResult& r) {
    json j;
    j["success"] = r.success;
    j["error"] = to_string(r.error);
    j["detail"] = r.detail;
    j["dump_path"] = r.dump_path;
    return j;
}

static DeviceResult device_result_from_json(const json& j) {
    DeviceResult r;
    r.success = j.value("success", false);
    r.error = parse_error_kind(j.value("error", std::string("none")))
                  .value_or(r.success ? DumpErrorKind::None : DumpErrorKind::Process);
    r.detail = j.value("detail", std::string());
    r.dump_path = j.value("dump_path", std::string());
    return r;
}

static json upload_to_json(const UploadRecord& u) {
    json j;
    j["success"] = u.success;
    j["message"] = u.message;
    j["upload_info"] = u.upload_info;
    j["uploaded_files"] = u.uploaded_files;
    j["timestamp"] = u.timestamp;
    return j;
}

static UploadRecord upload_from_json(const json& j) {
    UploadRecord u;
    u.success = j.value("success", false);
    u.message = j.value("message", std::string());
    if (j.contains("upload_info") && j["upload_info"].is_object()) {
        for (const auto& [key, value] : j["upload_info"].items()) {
            u.upload_info[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    u.uploaded_files = j.value("uploaded_files", std::vector<std::string>{});
    u.timestamp = j.value("timestamp", std::string());
    return u;
}

// Writes every field the struct owns into `j`, leaving other keys alone.
static void overlay(json& j, const Manifest& m) {
    j["issue_id"] = m.issue_id;
    j["triggered_by"] = to_string(m.triggered_by);
    j["path_strategy"] = m.path_strategy;
    j["request_device_id"] = m.request_device_id;
    j["targets"] = m.targets;

    json results = j.contains("results") && j["results"].is_object() ? j["results"]
                                                                      : json::object();
    for (const auto& [device, result] : m.results) {
        results[device] = device_result_to_json(result);
    }
    j["results"] = results;

    j["success_count"] = m.success_count;
    j["fail_count"] = m.fail_count;
    j["cancelled_count"] = m.cancelled_count;
    j["issue_dir"] = m.issue_dir;
    j["upload_enabled"] = m.upload_enabled ? json(*m.upload_enabled) : json(nullptr);
    if (m.upload_result) {
        j["upload_result"] = upload_to_json(*m.upload_result);
    }
}

static Manifest manifest_from_json(const json& j) {
    Manifest m;
    m.issue_id = j.value("issue_id", std::string());
    m.triggered_by = parse_dump_trigger(j.value("triggered_by", std::string("manual")))
                         .value_or(DumpTrigger::Manual);
    m.path_strategy = j.value("path_strategy", std::string());
    m.request_device_id = j.value("request_device_id", std::string());
    m.targets = j.value("targets", std::vector<std::string>{});
    if (j.contains("results") && j["results"].is_object()) {
        for (const auto& [device, r] : j["results"].items()) {
            m.results[device] = device_result_from_json(r);
        }
    }
    m.success_count = j.value("success_count", 0);
    m.fail_count = j.value("fail_count", 0);
    m.cancelled_count = j.value("cancelled_count", 0);
    m.issue_dir = j.value("issue_dir", std::string());
    if (j.contains("upload_enabled") && j["upload_enabled"].is_boolean()) {
        m.upload_enabled = j["upload_enabled"].get<bool>();
    }
    if (j.contains("upload_result") && j["upload_result"].is_object()) {
        m.upload_result = upload_from_json(j["upload_result"]);
    }
    return m;
}

// ── File access ─────────────────────────────────────────────

static Result<json> read_json(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<json>::Err("Cannot open " + path.string());
    }
    try {
        json j = json::parse(in);
        if (!j.is_object()) {
            return Result<json>::Err(path.string() + ": manifest is not a JSON object");
        }
        return Result<json>::Ok(j);
    } catch (const json::exception& e) {
        return Result<json>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }
}

// Write beside the target and rename, so a reader never sees half a file.
static Result<void> write_json(const fs::path& path, const json& j) {
    std::string text;
    try {
        // Script and jf output may carry bytes that are not UTF-8
        text = j.dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        return Result<void>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }

    fs::path tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err("Cannot write " + tmp.string());
        }
        out << text << "\n";
        out.flush();
        if (!out) {
            return Result<void>::Err("Short write to " + tmp.string());
        }
    }
    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("Cannot replace {}: {}", path.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// ── ManifestStore ───────────────────────────────────────────

ManifestStore::ManifestStore(const fs::path& issue_root)
    : manifest_path_(issue_root / MANIFEST_FILENAME) {}

bool ManifestStore::exists() const {
    std::error_code ec;
    return fs::exists(manifest_path_, ec);
}

Result<Manifest> ManifestStore::load() const {
    auto j = read_json(manifest_path_);
    if (j.is_err()) {
        return Result<Manifest>::Err(j.error);
    }
    try {
        return Result<Manifest>::Ok(manifest_from_json(j.value));
    } catch (const json::exception& e) {
        return Result<Manifest>::Err(fmt::format("{}: {}", manifest_path_.string(), e.what()));
    }
}

Result<void> ManifestStore::save(const Manifest& manifest) const {
    json j = json::object();
    overlay(j, manifest);
    return write_json(manifest_path_, j);
}

Result<void> ManifestStore::update(const Manifest& manifest) const {
    json j = json::object();
    if (exists()) {
        auto current = read_json(manifest_path_);
        // A corrupt file is replaced by the in-memory view
        if (current.is_ok()) j = current.value;
    }
    overlay(j, manifest);
    return write_json(manifest_path_, j);
}

Result<void> ManifestStore::record_upload(const UploadRecord& record) const {
    auto current = read_json(manifest_path_);
    if (current.is_err()) {
        return Result<void>::Err("Cannot record upload: " + current.error);
    }
    json j = current.value;
    j["upload_result"] = upload_to_json(record);
    return write_json(manifest_path_, j);
}
