#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Directory holding the running executable (empty if it cannot be resolved).
std::filesystem::path executable_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

} // namespace platform
