#pragma once

#include <core/types.hpp>

namespace platform {

// True if stdout is attached to a terminal (controls ANSI colors).
bool stdout_is_terminal();

// RAII guard that routes SIGINT to a cancel token for its lifetime.
// The first Ctrl-C raises the token; the previous handler is restored
// on destruction, so a second Ctrl-C after the walk kills as usual.
class InterruptGuard {
public:
    explicit InterruptGuard(CancelToken& token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

} // namespace platform
