#include "counters.hpp"

void Counters::RecordAttempt(bool success)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_;
    if (success) {
        ++success_;
    } else {
        ++fail_;
    }
}

CounterSnapshot Counters::Snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    CounterSnapshot snap;
    snap.total = total_;
    snap.success = success_;
    snap.fail = fail_;
    return snap;
}

void Counters::Reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    total_ = 0;
    success_ = 0;
    fail_ = 0;
}
