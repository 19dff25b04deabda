#include "terminal.hpp"

#include <unistd.h>
#include <signal.h>

namespace platform {

bool stdout_is_terminal() {
    return isatty(STDOUT_FILENO) == 1;
}

// ── SIGINT routing ───────────────────────────────────────────

static CancelToken* g_cancel_token = nullptr;

static void sigint_handler(int) {
    if (g_cancel_token) {
        g_cancel_token->store(true);
    }
}

struct InterruptGuard::Impl {
    struct sigaction old_sa;
    CancelToken* previous_token;
};

InterruptGuard::InterruptGuard(CancelToken& token) : impl_(new Impl) {
    impl_->previous_token = g_cancel_token;
    g_cancel_token = &token;

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &impl_->old_sa);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_sa, nullptr);
    g_cancel_token = impl_->previous_token;
    delete impl_;
}

} // namespace platform
