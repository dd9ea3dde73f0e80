#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

// --- Defaults ---
constexpr int DEFAULT_PORT = 80;
constexpr int DEFAULT_THREADS = 50;
constexpr double DEFAULT_TIMEOUT_SEC = 3.0;
constexpr double DEFAULT_REPORT_INTERVAL_SEC = 1.0;
constexpr size_t DEFAULT_CHANNEL_CAPACITY = 10000;
constexpr double DEFAULT_JOIN_TIMEOUT_SEC = 1.0;
// ----------------

struct LoadConfig {
    std::string host = "127.0.0.1";
    int port = DEFAULT_PORT;
    std::string path = "/";
    int threads = DEFAULT_THREADS;
    double timeout_sec = DEFAULT_TIMEOUT_SEC;
    double report_interval_sec = DEFAULT_REPORT_INTERVAL_SEC;
    bool detailed = false;
    double duration_sec = 0.0;        // 0 = until interrupted
    uint64_t requests_per_worker = 0; // 0 = unbounded
    std::string results_path;         // empty = no results file
    size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY;
    double join_timeout_sec = DEFAULT_JOIN_TIMEOUT_SEC;
    bool show_help = false;
};

/**
 * @brief Splits "host", "host:port" or "http://host:port" into the config.
 * @throws std::invalid_argument on an empty host or a bad port.
 */
void ParseTarget(const std::string& target, LoadConfig& config);

/**
 * @brief Builds a LoadConfig from the command line.
 * @throws std::invalid_argument on unknown options, missing values or bad numbers.
 */
LoadConfig ParseArgs(int argc, char* argv[]);

/**
 * @brief Rejects configurations the load test cannot run with.
 * @throws std::invalid_argument describing the first problem found.
 */
void ValidateConfig(const LoadConfig& config);

std::string TargetUrl(const LoadConfig& config);

void PrintUsage(std::ostream& out, const char* program);
