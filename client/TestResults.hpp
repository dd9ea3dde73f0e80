#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

struct LoadSummary {
    std::string target;
    int workers = 0;
    uint64_t total = 0;
    uint64_t success = 0;
    uint64_t fail = 0;
    double success_percent = 0.0;
    double fail_percent = 0.0;
    double elapsed_sec = 0.0;
    double avg_rate = 0.0;             // requests per second over the whole run
    // Detailed mode only
    bool detailed = false;
    std::map<int, uint64_t> status_counts;
    uint64_t dropped_events = 0;
    // Workers still in flight when the join timeout expired
    size_t abandoned_workers = 0;
};
