#include "process.hpp"

#include <unistd.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace platform {

static void close_pipe(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

CommandResult run_command(const std::string& program,
                          const std::vector<std::string>& args) {
    CommandResult result;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.stderr_data = std::string("pipe failed: ") + std::strerror(errno);
        close_pipe(out_pipe);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.stderr_data = std::string("fork failed: ") + std::strerror(errno);
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close_pipe(out_pipe);
        close_pipe(err_pipe);

        // Build argv array
        std::vector<const char*> argv;
        argv.push_back(program.c_str());
        for (const auto& a : args) argv.push_back(a.c_str());
        argv.push_back(nullptr);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(127);  // exec failed
    }

    // Parent: drain both pipes until the child closes them
    close(out_pipe[1]);
    close(err_pipe[1]);

    struct pollfd fds[2] = {
        {out_pipe[0], POLLIN, 0},
        {err_pipe[0], POLLIN, 0},
    };
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        if (poll(fds, 2, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_fds--;
            }
        }
    }
    for (auto& f : fds) {
        if (f.fd >= 0) close(f.fd);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return result;
    }
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace platform
