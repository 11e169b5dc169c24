#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Compact local timestamp used as an issue id, e.g. "261019-142501".
std::string issue_timestamp();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~/" to the user's home directory.
std::filesystem::path expand_user(const std::string& path);

// Split text into lines, dropping the trailing '\r' of CRLF output.
std::vector<std::string> split_lines(const std::string& text);

// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
