#include "run_state.hpp"

void RunState::Begin()
{
    start_time_ = Clock::now();
    active_workers_.store(0);
    running_.store(true);
}

void RunState::WakeAll()
{
    {
        // Taking the lock orders the notify after any waiter's predicate check.
        std::lock_guard<std::mutex> lock(mutex_);
    }
    wake_.notify_all();
}

bool RunState::WaitFor(Clock::duration timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, timeout, [this]() { return !running_.load(); });
    return running_.load();
}
