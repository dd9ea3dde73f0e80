#pragma once

#include "TestResults.hpp"
#include "counters.hpp"
#include <iosfwd>
#include <string>

// Fills the counts, percentages and average rate. A zero total or a
// non-positive elapsed time yields 0 rather than NaN.
void fill_summary(LoadSummary& summary, const CounterSnapshot& snap, double elapsed_sec);

void print_summary(std::ostream& out, const LoadSummary& summary);

void append_result_to_file(const LoadSummary& r, const std::string& path);
