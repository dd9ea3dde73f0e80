#pragma once

#include "counters.hpp"
#include "event_channel.hpp"
#include "run_state.hpp"
#include "transport.hpp"

#include <cstdint>
#include <memory>
#include <string>

struct WorkerConfig {
    std::string path = "/";
    double timeout_sec = 3.0;
    bool detailed = false;
    uint64_t max_attempts = 0;  // 0 = until the run stops
};

/**
 * @brief One closed-loop load worker.
 *
 * Issues a GET, records the outcome in the shared counters, optionally
 * publishes a RequestEvent, and repeats until the run stops. There is no
 * backoff and no retry: every iteration is an independent attempt.
 */
class Worker {
public:
    /**
     * @param id        Worker identity, carried in RequestEvents.
     * @param config    Request path, timeout and mode.
     * @param transport This worker's private transport instance.
     * @param counters  Shared counters of the run.
     * @param state     Shared run state; the worker stops once it is no longer running.
     * @param events    Event channel, or nullptr when detailed mode is off.
     */
    Worker(int id,
           WorkerConfig config,
           std::unique_ptr<ITransport> transport,
           std::shared_ptr<Counters> counters,
           std::shared_ptr<RunState> state,
           std::shared_ptr<EventChannel> events = nullptr);

    /**
     * @brief Loops until the run stops or max_attempts is reached.
     */
    void Run();

    /**
     * @brief Performs exactly one request-and-record cycle.
     * @return Whether the attempt counted as a success.
     */
    bool RunOnce();

    int Id() const { return id_; }
    uint64_t Attempts() const { return attempts_; }

private:
    TransportResult issue_request();
    void publish_event(int status_code);

    int id_;
    WorkerConfig config_;
    std::unique_ptr<ITransport> transport_;
    std::shared_ptr<Counters> counters_;
    std::shared_ptr<RunState> state_;
    std::shared_ptr<EventChannel> events_;
    uint64_t attempts_ = 0;
};
