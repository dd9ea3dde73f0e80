#pragma once

#include <memory>
#include <string>
#include <utility>

/**
 * @brief Why an attempt produced no HTTP response at all.
 */
enum class TransportFailure {
    None,
    ConnectionFailed,
    Timeout,
    ResolveFailed,
    ProtocolError,
    Other
};

const char* to_string(TransportFailure failure);

/**
 * @brief Outcome of one GET: either a status code or a transport failure.
 *
 * Tests truthiness the same way httplib::Result does: a result converts to
 * true only when a response (of any status) was received.
 */
struct TransportResult {
    int status = 0;
    TransportFailure failure = TransportFailure::None;
    std::string message;

    static TransportResult FromStatus(int status) {
        TransportResult r;
        r.status = status;
        return r;
    }

    static TransportResult Failed(TransportFailure failure, std::string message = {}) {
        TransportResult r;
        r.failure = failure;
        r.message = std::move(message);
        return r;
    }

    bool has_response() const { return failure == TransportFailure::None; }
    explicit operator bool() const { return has_response(); }
};

/**
 * @brief Status codes in [200, 400) count as a successful attempt.
 */
inline bool IsSuccessStatus(int status) { return status >= 200 && status < 400; }

/**
 * @brief Classifies an outcome for the statistics: a response with a
 * 2xx/3xx status is a success, everything else is a failure.
 */
inline bool IsSuccessfulAttempt(const TransportResult& result) {
    return result.has_response() && IsSuccessStatus(result.status);
}

/**
 * @brief Abstract port for issuing a single GET against the target.
 *
 * Each worker thread receives its own clone so that an implementation can
 * keep per-connection state (keep-alive sockets and so on) without locks.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Issues one GET request.
     * @param path            Request path, e.g. "/".
     * @param timeout_seconds Per-request timeout covering connect, send and receive.
     * @return The status code, or the reason no response was received.
     */
    virtual TransportResult Get(const std::string& path, double timeout_seconds) = 0;

    /**
     * @brief Creates an independent instance for another worker.
     */
    virtual std::unique_ptr<ITransport> clone() const = 0;
};
