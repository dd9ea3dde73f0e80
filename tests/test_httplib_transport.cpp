#include <catch2/catch.hpp>

#include "transports/httplib_transport.hpp"

#include <chrono>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("httplib errors map onto transport failures", "[transport]") {
    CHECK(HttplibTransport::Classify(httplib::Error::Connection, 0.01, 3.0) == TransportFailure::ConnectionFailed);
    CHECK(HttplibTransport::Classify(httplib::Error::ConnectionTimeout, 3.0, 3.0) == TransportFailure::Timeout);
    CHECK(HttplibTransport::Classify(httplib::Error::Write, 0.01, 3.0) == TransportFailure::ProtocolError);
    CHECK(HttplibTransport::Classify(httplib::Error::Canceled, 0.01, 3.0) == TransportFailure::Other);
}

TEST_CASE("A read error is a timeout only once the deadline has passed", "[transport]") {
    CHECK(HttplibTransport::Classify(httplib::Error::Read, 3.0, 3.0) == TransportFailure::Timeout);
    CHECK(HttplibTransport::Classify(httplib::Error::Read, 3.2, 3.0) == TransportFailure::Timeout);
    CHECK(HttplibTransport::Classify(httplib::Error::Read, 0.05, 3.0) == TransportFailure::ProtocolError);
}

TEST_CASE("A server slower than the timeout is reported as a timeout", "[transport][integration]") {
    httplib::Server slow;
    slow.Get("/slow", [](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(1500ms);
        res.set_content("late", "text/plain");
    });
    int port = slow.bind_to_any_port("127.0.0.1");
    REQUIRE(port > 0);

    std::thread listener([&]() { slow.listen_after_bind(); });
    for (int i = 0; i < 200 && !slow.is_running(); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(slow.is_running());

    HttplibTransport transport("127.0.0.1", port);
    TransportResult res = transport.Get("/slow", 0.3);

    slow.stop();
    listener.join();

    CHECK_FALSE(res.has_response());
    CHECK(res.failure == TransportFailure::Timeout);
    CHECK_FALSE(IsSuccessfulAttempt(res));
}
