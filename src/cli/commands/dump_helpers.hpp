#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <managers/manifest_store.hpp>

// Shared helpers used by dump command files (dump.cpp) and main.cpp

struct DumpArgs {
    bool headless = false;
    std::optional<bool> upload;         // --upload / --no-upload
    std::string strategy;               // --strategy, empty = configured
    std::vector<std::string> devices;   // empty = configured devices
};

// Parse `[--headless] [--upload|--no-upload] [--strategy S] [device...]`.
Result<DumpArgs> parse_dump_args(const std::vector<std::string>& args);

// Whitespace split of a REPL argument string.
std::vector<std::string> split_args(const std::string& arg);

// Pretty-print a manifest loaded from disk.
void print_manifest(const Manifest& manifest);

// Locate the manifest for a user-supplied path: the issue dir itself, the
// manifest file, or a device dir inside an issue.
std::optional<std::filesystem::path> find_issue_root(const std::filesystem::path& path);
