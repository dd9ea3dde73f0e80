#pragma once

#include "event_channel.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

/**
 * @brief Drains RequestEvents from the channel and counts them per status code.
 *
 * Run() returns once the channel is closed.
 */
class EventTally {
public:
    explicit EventTally(std::shared_ptr<EventChannel> channel);

    void Run();

    /**
     * @brief Counts a single event. Run() calls this for every event it pops.
     */
    void Record(const RequestEvent& ev);

    std::map<int, uint64_t> StatusCounts() const;
    uint64_t Consumed() const;

private:
    std::shared_ptr<EventChannel> channel_;

    std::map<int, uint64_t> status_counts_;
    uint64_t consumed_ = 0;
    mutable std::mutex mutex_;
};
