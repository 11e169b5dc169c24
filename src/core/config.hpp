#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load ~/.dumpfleet/config.yaml. A missing file yields defaults.
    static Result<Config> load();

    // Load from an explicit path (missing file is an error here).
    static Result<Config> load_from(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml_text);

    // Accessors
    const FleetSettings& fleet() const { return fleet_; }
    const ArtifactStoreConfig& artifact_store() const { return store_; }
    const CrashMonitorConfig& crash_monitor() const { return monitor_; }
    const std::vector<std::string>& devices() const { return devices_; }

    // Session override, not written back to the file.
    void set_max_concurrency(int n) { fleet_.max_concurrency = n < 1 ? 1 : n; }

    // Dump mode the config assigns to a trigger class.
    DumpMode mode_for(DumpTrigger trigger) const;

public:
    Config();

private:
    FleetSettings fleet_;
    ArtifactStoreConfig store_;
    CrashMonitorConfig monitor_;
    std::vector<std::string> devices_;
};

// Helper to check if the config file exists
bool config_exists();

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
fs::path default_script_path();

// Write the default config unless one is already there
Result<void> create_default_config();
