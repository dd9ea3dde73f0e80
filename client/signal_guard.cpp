#include "signal_guard.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <utility>

namespace {

std::atomic<RunState*> g_stop_target{nullptr};

const char kShutdownNotice[] = "\n\nShutting down, please wait for threads to complete...\n";

void handle_stop_signal(int /*signum*/)
{
    int saved_errno = errno;
    RunState* state = g_stop_target.load();
    if (state != nullptr && state->RequestStop()) {
        // Only the first signal prints; a failed write has no recovery path inside a handler.
        ssize_t rc = ::write(STDOUT_FILENO, kShutdownNotice, sizeof(kShutdownNotice) - 1);
        (void)rc;
    }
    errno = saved_errno;
}

void install(int signum, struct sigaction* previous)
{
    struct sigaction sa{};
    sa.sa_handler = handle_stop_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(signum, &sa, previous) != 0) {
        throw std::runtime_error(std::string("sigaction failed: ") + std::strerror(errno));
    }
}

} // namespace

SignalStopGuard::SignalStopGuard(std::shared_ptr<RunState> state)
    : state_(std::move(state))
{
    if (!state_) {
        throw std::invalid_argument("SignalStopGuard requires a run state");
    }

    RunState* expected = nullptr;
    if (!g_stop_target.compare_exchange_strong(expected, state_.get())) {
        throw std::logic_error("Another SignalStopGuard is already active");
    }

    try {
        install(SIGINT, &old_int_);
    } catch (const std::exception&) {
        g_stop_target.store(nullptr);
        throw;
    }
    try {
        install(SIGTERM, &old_term_);
    } catch (const std::exception&) {
        ::sigaction(SIGINT, &old_int_, nullptr);
        g_stop_target.store(nullptr);
        throw;
    }
}

SignalStopGuard::~SignalStopGuard()
{
    ::sigaction(SIGINT, &old_int_, nullptr);
    ::sigaction(SIGTERM, &old_term_, nullptr);
    g_stop_target.store(nullptr);
}
