#include "reporter.hpp"

#include <iomanip> // For std::setprecision
#include <ostream>
#include <stdexcept>
#include <utility>

Reporter::Reporter(std::shared_ptr<Counters> counters,
                   std::shared_ptr<RunState> state,
                   std::chrono::duration<double> interval,
                   std::ostream& out)
    : counters_(std::move(counters)),
      state_(std::move(state)),
      interval_(std::chrono::duration_cast<Clock::duration>(interval)),
      out_(out)
{
    if (interval_ <= Clock::duration::zero()) {
        throw std::invalid_argument("Report interval must be positive");
    }
    last_time_ = state_->StartTime();
}

void Reporter::Run()
{
    while (state_->IsRunning()) {
        if (!state_->WaitFor(interval_)) {
            break;
        }
        Render(out_, Tick(Clock::now()));
    }
}

ReportSample Reporter::Tick(Clock::time_point now)
{
    CounterSnapshot snap = counters_->Snapshot();

    double elapsed = std::chrono::duration<double>(now - last_time_).count();
    double total_elapsed = std::chrono::duration<double>(now - state_->StartTime()).count();
    uint64_t delta = snap.total - last_total_;

    ReportSample sample;
    sample.total = snap.total;
    sample.instant_rate = elapsed > 0 ? static_cast<double>(delta) / elapsed : 0.0;
    sample.avg_rate = total_elapsed > 0 ? static_cast<double>(snap.total) / total_elapsed : 0.0;
    sample.success_rate = snap.total > 0
        ? static_cast<double>(snap.success) / static_cast<double>(snap.total) * 100.0
        : 0.0;
    sample.active_workers = state_->ActiveWorkers();

    last_total_ = snap.total;
    last_time_ = now;
    return sample;
}

void Reporter::Render(std::ostream& out, const ReportSample& sample)
{
    std::ios_base::fmtflags flags = out.flags();
    std::streamsize precision = out.precision();

    out << "\r[STATS] Requests: " << sample.total
        << std::fixed << std::setprecision(2)
        << " | Rate: " << sample.instant_rate << " req/s"
        << " | Avg: " << sample.avg_rate << " req/s"
        << std::setprecision(1)
        << " | Success: " << sample.success_rate << "%"
        << " | Workers: " << sample.active_workers
        << std::flush;

    out.flags(flags);
    out.precision(precision);
}
