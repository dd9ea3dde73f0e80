#pragma once

#include <httplib.h>

#include <atomic>
#include <string>

/**
 * @brief Trivial responder used as a load-test target.
 *
 * Answers every GET with status 200 and an HTML page describing the
 * request, and logs one line per request.
 */
class EchoServer
{
    httplib::Server server;
    std::string hostname;

    static std::atomic<long long> total_requests;

public:
    explicit EchoServer(int thread_count = 8);

    void HandleGet(const httplib::Request &req, httplib::Response &res);

    static std::string RenderPage(const std::string &client_ip,
                                  const std::string &path,
                                  const std::string &server_time,
                                  const std::string &hostname);

    static std::string CurrentTime();
    static std::string LocalHostname();
    static long long TotalRequests() { return total_requests.load(); }

    // Blocks until Stop() is called. Returns -1 if the port could not be bound.
    int Listen(const std::string &host, int port);

    // Binds an ephemeral port without serving yet; returns the port or -1.
    int BindToAnyPort(const std::string &host);
    // Serves on the port bound by BindToAnyPort(); blocks until Stop().
    bool ListenAfterBind();

    bool IsRunning() const { return server.is_running(); }
    void Stop() { server.stop(); }
};
