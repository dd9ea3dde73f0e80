#include "worker.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

Worker::Worker(int id,
               WorkerConfig config,
               std::unique_ptr<ITransport> transport,
               std::shared_ptr<Counters> counters,
               std::shared_ptr<RunState> state,
               std::shared_ptr<EventChannel> events)
    : id_(id),
      config_(std::move(config)),
      transport_(std::move(transport)),
      counters_(std::move(counters)),
      state_(std::move(state)),
      events_(std::move(events))
{
    if (!transport_ || !counters_ || !state_) {
        throw std::invalid_argument("Worker requires a transport, counters and run state");
    }
}

void Worker::Run()
{
    ActiveWorkerGuard active(*state_);

    // Closed-loop: run until the coordinator signals to stop
    while (state_->IsRunning()) {
        RunOnce();
        if (config_.max_attempts != 0 && attempts_ >= config_.max_attempts) {
            break;
        }
    }
}

bool Worker::RunOnce()
{
    TransportResult res = issue_request();
    bool success = IsSuccessfulAttempt(res);

    counters_->RecordAttempt(success);
    ++attempts_;

    if (success && config_.detailed && events_) {
        publish_event(res.status);
    }
    return success;
}

TransportResult Worker::issue_request()
{
    try {
        return transport_->Get(config_.path, config_.timeout_sec);
    } catch (const std::exception& e) {
        return TransportResult::Failed(TransportFailure::Other, e.what());
    }
}

void Worker::publish_event(int status_code)
{
    RequestEvent ev;
    ev.worker_id = id_;
    ev.status_code = status_code;
    ev.timestamp = std::chrono::system_clock::now();

    // Best effort: a full channel drops the event, never the request.
    events_->TryPush(ev);
}
