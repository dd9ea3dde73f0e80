#pragma once

#include <cstdint>
#include <mutex> // For std::mutex and std::lock_guard

/**
 * @brief A point-in-time copy of the request counters.
 */
struct CounterSnapshot {
    uint64_t total = 0;
    uint64_t success = 0;
    uint64_t fail = 0;
};

/**
 * @brief Aggregate request counters shared by every worker of a run.
 *
 * All three values live behind a single mutex so that a snapshot always
 * satisfies total == success + fail. Every public method is thread-safe.
 */
class Counters {
public:
    Counters() = default;

    Counters(const Counters&) = delete;
    Counters& operator=(const Counters&) = delete;

    /**
     * @brief Records one finished attempt.
     * @param success true for a successful response, false otherwise.
     */
    void RecordAttempt(bool success);

    /**
     * @brief Returns all three counters read under one critical section.
     */
    CounterSnapshot Snapshot() const;

    /**
     * @brief Zeroes the counters. Only called before workers are spawned.
     */
    void Reset();

private:
    uint64_t total_ = 0;
    uint64_t success_ = 0;
    uint64_t fail_ = 0;

    mutable std::mutex mutex_;
};
