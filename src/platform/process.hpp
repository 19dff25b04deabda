#pragma once

#include <string>
#include <vector>

namespace platform {

// Outcome of a finished child process.
struct CommandResult {
    int exit_code = -1;          // -1 if the process could not be started or was signalled
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Run `program` (looked up on PATH) with `args`, wait for it and capture
// both output streams. stdin is closed in the child. Arguments are passed
// directly to execvp, never through a shell.
CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args);

} // namespace platform
