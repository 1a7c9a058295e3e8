#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Expands a leading "~/" to the home directory.
std::filesystem::path expand_user(const std::string& path);

// Sleep for the given number of milliseconds. Non-positive values return immediately.
void sleep_ms(int ms);

} // namespace platform
