#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief Lifecycle state shared by the coordinator, the reporter and every worker.
 *
 * The running flag is a lock-free atomic so it can be cleared from a signal
 * handler. The condition variable only exists to cut the reporter's sleep
 * short; it is never touched from a handler.
 */
class RunState {
public:
    using Clock = std::chrono::steady_clock;

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "running flag must be lock-free to be cleared from a signal handler");

    RunState() = default;

    RunState(const RunState&) = delete;
    RunState& operator=(const RunState&) = delete;

    /**
     * @brief Marks the run as started: running = true, start time = now.
     */
    void Begin();

    bool IsRunning() const noexcept { return running_.load(); }

    /**
     * @brief Clears the running flag.
     *
     * Async-signal-safe: a single atomic exchange and nothing else.
     * @return true only for the call that actually flipped the flag.
     */
    bool RequestStop() noexcept { return running_.exchange(false); }

    /**
     * @brief Wakes every thread blocked in WaitFor().
     */
    void WakeAll();

    /**
     * @brief Sleeps for up to `timeout`, returning early once the run stops
     * and WakeAll() has been called.
     * @return Whether the run is still going after the wait.
     */
    bool WaitFor(Clock::duration timeout);

    Clock::time_point StartTime() const { return start_time_; }

    int ActiveWorkers() const noexcept { return active_workers_.load(); }
    void WorkerEntered() noexcept { active_workers_.fetch_add(1); }
    void WorkerExited() noexcept { active_workers_.fetch_sub(1); }

private:
    std::atomic<bool> running_{false};
    std::atomic<int> active_workers_{0};
    Clock::time_point start_time_{};

    std::mutex mutex_;
    std::condition_variable wake_;
};

/**
 * @brief Keeps RunState's live worker count in step with a worker's lifetime.
 */
class ActiveWorkerGuard {
public:
    explicit ActiveWorkerGuard(RunState& state) : state_(state) { state_.WorkerEntered(); }
    ~ActiveWorkerGuard() { state_.WorkerExited(); }

    ActiveWorkerGuard(const ActiveWorkerGuard&) = delete;
    ActiveWorkerGuard& operator=(const ActiveWorkerGuard&) = delete;

private:
    RunState& state_;
};
