#pragma once

#include <string>
#include <filesystem>

// Debug log at <temp>/depsweep_debug.log unless redirected with
// set_log_path(). Safe to call from walker threads.
std::string depsweep_log_path();

// Redirect the debug log. An empty path restores the default.
void set_log_path(const std::filesystem::path& path);

// Append "[HH:MM:SS.mmm] msg" to the debug log. Failures to open the
// log are ignored: logging never changes the outcome of a run.
void depsweep_log(const std::string& msg);
