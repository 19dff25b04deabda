#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split on runs of spaces and tabs. Empty input gives an empty vector.
std::vector<std::string> split_whitespace(const std::string& line);

// Replace a leading "~" or "~/" with the home directory.
std::filesystem::path expand_home(const std::string& path);

// Lexically normal form with any trailing separator removed, so that
// "a/b/" and "a/./b" compare equal to "a/b".
std::filesystem::path normalize_path(const std::filesystem::path& p);

// Absolute, lexically normal form of a walk root. Rule paths and the
// walkers both resolve a relative root through this against the cwd.
std::filesystem::path normalize_root(const std::filesystem::path& root);

// True if `path` equals `base` or lies beneath it (component-wise, no I/O).
bool is_within(const std::filesystem::path& path, const std::filesystem::path& base);
