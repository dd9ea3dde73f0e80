#pragma once

#include "counters.hpp"
#include "run_state.hpp"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>

/**
 * @brief Figures for one live status line.
 */
struct ReportSample {
    uint64_t total = 0;
    double instant_rate = 0.0;   // req/s since the previous tick
    double avg_rate = 0.0;       // req/s since the run started
    double success_rate = 0.0;   // percent of all attempts
    int active_workers = 0;
};

/**
 * @brief Prints a live, overwritten status line at a fixed interval.
 *
 * Remembers only the previous tick (total and time). Exits once the run
 * stops; the final summary is the coordinator's job.
 */
class Reporter {
public:
    using Clock = RunState::Clock;

    Reporter(std::shared_ptr<Counters> counters,
             std::shared_ptr<RunState> state,
             std::chrono::duration<double> interval,
             std::ostream& out);

    void Run();

    /**
     * @brief Snapshots the counters and computes a sample as of `now`,
     * then remembers this tick as the previous one.
     */
    ReportSample Tick(Clock::time_point now);

    static void Render(std::ostream& out, const ReportSample& sample);

private:
    std::shared_ptr<Counters> counters_;
    std::shared_ptr<RunState> state_;
    Clock::duration interval_;
    std::ostream& out_;

    uint64_t last_total_ = 0;
    Clock::time_point last_time_;
};
