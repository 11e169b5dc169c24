#include "config.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".dumpfleet";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

fs::path default_script_path() {
    return get_config_dir() / "coredump_extraction.sh";
}

Config::Config() {
    fleet_.log_directory = expand_user(DEFAULT_LOG_DIRECTORY);
    fleet_.script_path = default_script_path();
}

DumpMode Config::mode_for(DumpTrigger trigger) const {
    return is_automated(trigger) ? fleet_.automated_mode : fleet_.manual_mode;
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# dumpfleet configuration

# Root directory for extracted dumps
log_directory: "~/dumpfleet/logs"

# Device-side extraction script (run with ADB_SERIAL set)
script: "~/.dumpfleet/coredump_extraction.sh"

# Devices targeted when a request names none
devices: []

dump:
  max_concurrency: 3
  path_strategy: unified           # unified | individual | hybrid
  directory_prefix: issues
  mode:
    manual: interactive
    automated: headless
  timeouts:
    headless: 300
    interactive: 600
    cancel_grace: 5

upload:
  enabled: true
  directory_prefix: issues
  server_url: "https://bart.sec.samsung.net/artifactory"
  repository: "oneos-qsymphony-issues-generic-local"
  server_id: "qsutils-server"
  timeout: 300

crash_monitor:
  enabled: false
  interval_ms: 5000
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

static DumpMode parse_mode(const YAML::Node& node, DumpMode fallback) {
    if (!node) return fallback;
    auto mode = parse_dump_mode(node.as<std::string>(""));
    if (!mode) {
        dumpfleet_log("config: unknown dump mode '" + node.as<std::string>("") +
                      "', using " + to_string(fallback));
        return fallback;
    }
    return *mode;
}

static void parse_dump_config(const YAML::Node& node, FleetSettings& fleet) {
    fleet.max_concurrency = node["max_concurrency"].as<int>(DEFAULT_MAX_CONCURRENCY);
    if (fleet.max_concurrency < 1) fleet.max_concurrency = 1;

    fleet.path_strategy = node["path_strategy"].as<std::string>(DEFAULT_PATH_STRATEGY);
    fleet.directory_prefix = node["directory_prefix"].as<std::string>(DEFAULT_ISSUE_PREFIX);

    if (node["mode"]) {
        fleet.manual_mode = parse_mode(node["mode"]["manual"], DumpMode::Interactive);
        fleet.automated_mode = parse_mode(node["mode"]["automated"], DumpMode::Headless);
    }

    if (node["timeouts"]) {
        auto t = node["timeouts"];
        fleet.timeouts.headless_secs = t["headless"].as<int>(HEADLESS_DUMP_TIMEOUT_SECS);
        fleet.timeouts.interactive_secs = t["interactive"].as<int>(INTERACTIVE_DUMP_TIMEOUT_SECS);
        fleet.timeouts.cancel_grace_secs = t["cancel_grace"].as<int>(CANCEL_GRACE_SECS);
    }
    // A deadline of zero would fail every job on entry
    if (fleet.timeouts.headless_secs < 1) fleet.timeouts.headless_secs = HEADLESS_DUMP_TIMEOUT_SECS;
    if (fleet.timeouts.interactive_secs < 1) fleet.timeouts.interactive_secs = INTERACTIVE_DUMP_TIMEOUT_SECS;
    if (fleet.timeouts.cancel_grace_secs < 0) fleet.timeouts.cancel_grace_secs = 0;
}

static void parse_upload_config(const YAML::Node& node, FleetSettings& fleet,
                                ArtifactStoreConfig& store) {
    fleet.upload_enabled = node["enabled"].as<bool>(true);
    fleet.upload_prefix = node["directory_prefix"].as<std::string>(DEFAULT_ISSUE_PREFIX);
    store.server_url = node["server_url"].as<std::string>(DEFAULT_JFROG_URL);
    store.repository = node["repository"].as<std::string>(DEFAULT_JFROG_REPO);
    store.server_id = node["server_id"].as<std::string>(DEFAULT_JFROG_SERVER);
    store.timeout_secs = node["timeout"].as<int>(UPLOAD_TIMEOUT_SECS);
    if (store.timeout_secs < 1) store.timeout_secs = UPLOAD_TIMEOUT_SECS;
}

static CrashMonitorConfig parse_monitor_config(const YAML::Node& node) {
    CrashMonitorConfig monitor;
    monitor.enabled = node["enabled"].as<bool>(false);
    monitor.interval_ms = node["interval_ms"].as<int>(CRASH_MONITOR_INTERVAL_MS);
    if (monitor.interval_ms < 100) monitor.interval_ms = 100;
    return monitor;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;

        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("config root must be a mapping");
        }

        if (root["log_directory"]) {
            config.fleet_.log_directory = expand_user(root["log_directory"].as<std::string>());
        }
        if (root["script"]) {
            config.fleet_.script_path = expand_user(root["script"].as<std::string>());
        }
        if (root["devices"] && root["devices"].IsSequence()) {
            for (const auto& d : root["devices"]) {
                config.devices_.push_back(d.as<std::string>());
            }
        }
        if (root["dump"]) {
            parse_dump_config(root["dump"], config.fleet_);
        }
        if (root["upload"]) {
            parse_upload_config(root["upload"], config.fleet_, config.store_);
        }
        if (root["crash_monitor"]) {
            config.monitor_ = parse_monitor_config(root["crash_monitor"]);
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid config: ") + e.what());
    }
}

Result<Config> Config::load_from(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config());
    }
    return load_from(get_config_path());
}
