#pragma once

#include "httplib.h"
#include "../transport.hpp"

#include <chrono>
#include <ctime>
#include <memory>
#include <string>

/**
 * @brief Transport over a persistent httplib::Client.
 *
 * One instance per worker: the client keeps its connection alive across
 * requests, which plays the role of a per-thread HTTP session.
 */
class HttplibTransport : public ITransport {
    std::string host_;
    int port_;
    httplib::Client cli_;
    double applied_timeout_ = -1.0;

    void apply_timeout(double timeout_seconds) {
        if (timeout_seconds == applied_timeout_) return;
        time_t sec = static_cast<time_t>(timeout_seconds);
        time_t usec = static_cast<time_t>((timeout_seconds - static_cast<double>(sec)) * 1000000.0);
        cli_.set_connection_timeout(sec, usec);
        cli_.set_read_timeout(sec, usec);
        cli_.set_write_timeout(sec, usec);
        applied_timeout_ = timeout_seconds;
    }

public:
    /**
     * @brief Maps an httplib error onto a TransportFailure.
     *
     * httplib reports an expired read deadline as Error::Read, so a read
     * error that took at least the configured timeout is labelled Timeout.
     */
    static TransportFailure Classify(httplib::Error err, double elapsed_seconds, double timeout_seconds) {
        switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::BindIPAddress:
            return TransportFailure::ConnectionFailed;
        case httplib::Error::ConnectionTimeout:
            return TransportFailure::Timeout;
        case httplib::Error::Read:
            // Poll granularity can wake slightly before the deadline.
            if (elapsed_seconds >= timeout_seconds * 0.9) {
                return TransportFailure::Timeout;
            }
            return TransportFailure::ProtocolError;
        case httplib::Error::Write:
        case httplib::Error::ExceedRedirectCount:
            return TransportFailure::ProtocolError;
        default:
            return TransportFailure::Other;
        }
    }

    HttplibTransport(std::string host, int port)
        : host_(std::move(host)), port_(port), cli_(host_, port_) {
        cli_.set_keep_alive(true);
        cli_.set_tcp_nodelay(true);
    }

    TransportResult Get(const std::string& path, double timeout_seconds) override {
        apply_timeout(timeout_seconds);
        auto started = std::chrono::steady_clock::now();
        httplib::Result res = cli_.Get(path.c_str());
        if (!res) {
            double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            httplib::Error err = res.error();
            return TransportResult::Failed(Classify(err, elapsed, timeout_seconds), httplib::to_string(err));
        }
        return TransportResult::FromStatus(res->status);
    }

    std::unique_ptr<ITransport> clone() const override {
        return std::make_unique<HttplibTransport>(host_, port_);
    }
};
