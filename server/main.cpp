#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "echo_server.hpp"

namespace {
volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int /*signum*/)
{
    g_stop_requested = 1;
}
}

int main(int argc, char* argv[])
{
    if (argc > 3) {
        std::cerr << "Usage: " << argv[0]
                  << " [port] [threads]\n";
        return 1;
    }

    int port = 8080;
    int num_threads = 8;
    try {
        if (argc >= 2) port = std::stoi(argv[1]);
        if (argc >= 3) num_threads = std::stoi(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        return 1;
    }
    if (port <= 0 || port > 65535 || num_threads <= 0) {
        std::cerr << "Port must be in 1..65535 and threads greater than 0\n";
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    EchoServer svr(num_threads);

    std::atomic<bool> listener_done{false};
    int listen_rc = 0;
    std::thread listener([&]() {
        listen_rc = svr.Listen("0.0.0.0", port);
        listener_done.store(true);
    });

    while (!g_stop_requested && !listener_done.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    if (g_stop_requested) {
        std::cout << "\nShutting down server..." << std::endl;
    }
    // Repeat until the listener returns: a stop issued before bind() completes is lost.
    while (!listener_done.load()) {
        svr.Stop();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    listener.join();

    if (listen_rc != 0) {
        return 1;
    }
    std::cout << "Server shutdown complete. Served " << EchoServer::TotalRequests() << " requests." << std::endl;
    return 0;
}
