#include "echo_server.hpp"

#include <ctime>
#include <iostream>
#include <sstream>
#include <unistd.h>

std::atomic<long long> EchoServer::total_requests{0};

EchoServer::EchoServer(int thread_count):
    hostname(LocalHostname())
{
    server.new_task_queue = [thread_count]{
        return new httplib::ThreadPool(thread_count);
    };

    server.set_tcp_nodelay(true);

    server.Get(".*", [this](const httplib::Request &req, httplib::Response &res) {
        HandleGet(req, res);
    });
}

void EchoServer::HandleGet(const httplib::Request &req, httplib::Response &res)
{
    std::string now = CurrentTime();
    total_requests++;

    // Built up front so concurrent handlers do not interleave within a line.
    std::ostringstream line;
    line << "[" << now << "] Received request from " << req.remote_addr
         << " - Path: " << req.path << "\n";
    std::cout << line.str() << std::flush;

    res.status = 200; // OK
    res.set_content(RenderPage(req.remote_addr, req.path, now, hostname), "text/html");
}

std::string EchoServer::RenderPage(const std::string &client_ip,
                                   const std::string &path,
                                   const std::string &server_time,
                                   const std::string &hostname)
{
    std::stringstream ss;
    ss << "<html>\n"
       << "<head>\n"
       << "    <title>Simple HTTP Server</title>\n"
       << "</head>\n"
       << "<body>\n"
       << "    <h1>Hello from the Server!</h1>\n"
       << "    <p>Your IP: " << client_ip << "</p>\n"
       << "    <p>Requested path: " << path << "</p>\n"
       << "    <p>Server time: " << server_time << "</p>\n"
       << "    <p>Server hostname: " << hostname << "</p>\n"
       << "</body>\n"
       << "</html>\n";
    return ss.str();
}

std::string EchoServer::CurrentTime()
{
    std::time_t t = std::time(nullptr);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return "unknown";
    }
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

std::string EchoServer::LocalHostname()
{
    char buf[256] = {0};
    if (gethostname(buf, sizeof(buf) - 1) != 0) {
        return "unknown";
    }
    return std::string(buf);
}

int EchoServer::Listen(const std::string &host, int port)
{
    std::cout << "Starting server on port " << port << "..." << std::endl;
    std::cout << "Server hostname: " << hostname << std::endl;
    if (!server.listen(host, port))
    {
        std::cerr << "Failed to start server on " << host << ":" << port << "!" << std::endl;
        return -1;
    }
    return 0;
}

int EchoServer::BindToAnyPort(const std::string &host)
{
    return server.bind_to_any_port(host);
}

bool EchoServer::ListenAfterBind()
{
    return server.listen_after_bind();
}
