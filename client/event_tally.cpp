#include "event_tally.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

namespace {
constexpr std::chrono::milliseconds kPopTimeout{250};
}

EventTally::EventTally(std::shared_ptr<EventChannel> channel)
    : channel_(std::move(channel))
{
    if (!channel_) {
        throw std::invalid_argument("EventTally requires a channel");
    }
}

void EventTally::Run()
{
    while (true) {
        std::optional<RequestEvent> ev = channel_->Pop(kPopTimeout);
        if (ev) {
            Record(*ev);
            continue;
        }
        if (channel_->IsClosed()) {
            return;
        }
    }
}

void EventTally::Record(const RequestEvent& ev)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ++status_counts_[ev.status_code];
    ++consumed_;
}

std::map<int, uint64_t> EventTally::StatusCounts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return status_counts_;
}

uint64_t EventTally::Consumed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return consumed_;
}
