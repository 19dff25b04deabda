#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// True when the host is macOS, where Time Machine is the backup mechanism.
bool is_macos();

} // namespace platform
