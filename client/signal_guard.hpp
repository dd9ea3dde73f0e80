#pragma once

#include "run_state.hpp"

#include <signal.h>
#include <memory>

/**
 * @brief Routes SIGINT and SIGTERM to RunState::RequestStop() for its lifetime.
 *
 * The handler clears the running flag and, on the first signal only, writes
 * a shutdown notice with write(2). Everything else (joining, printing the
 * summary) stays on the coordinator's thread. Previous handlers are restored
 * on destruction. Only one guard may be active at a time.
 */
class SignalStopGuard {
public:
    explicit SignalStopGuard(std::shared_ptr<RunState> state);
    ~SignalStopGuard();

    SignalStopGuard(const SignalStopGuard&) = delete;
    SignalStopGuard& operator=(const SignalStopGuard&) = delete;

private:
    std::shared_ptr<RunState> state_;
    struct sigaction old_int_{};
    struct sigaction old_term_{};
};
