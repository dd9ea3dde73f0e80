#include <catch2/catch.hpp>

#include "load_config.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

LoadConfig parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "httpload");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return ParseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("A bare host takes every default", "[config]") {
    LoadConfig cfg = parse({"192.168.1.10"});

    CHECK(cfg.host == "192.168.1.10");
    CHECK(cfg.port == 80);
    CHECK(cfg.path == "/");
    CHECK(cfg.threads == 50);
    CHECK(cfg.timeout_sec == Approx(3.0));
    CHECK(cfg.report_interval_sec == Approx(1.0));
    CHECK_FALSE(cfg.detailed);
    CHECK(cfg.duration_sec == 0.0);
    CHECK(cfg.requests_per_worker == 0);
    CHECK(cfg.results_path.empty());
    CHECK(cfg.channel_capacity == 10000);
    CHECK(cfg.join_timeout_sec == Approx(1.0));
    CHECK_NOTHROW(ValidateConfig(cfg));
}

TEST_CASE("Targets may carry a scheme, a port and a path", "[config]") {
    LoadConfig cfg;
    ParseTarget("http://example.local:8081/status", cfg);
    CHECK(cfg.host == "example.local");
    CHECK(cfg.port == 8081);
    CHECK(cfg.path == "/status");
    CHECK(TargetUrl(cfg) == "http://example.local:8081/status");

    LoadConfig plain;
    ParseTarget("localhost", plain);
    CHECK(TargetUrl(plain) == "http://localhost/");

    LoadConfig bad;
    CHECK_THROWS_AS(ParseTarget(":8080", bad), std::invalid_argument);
    CHECK_THROWS_AS(ParseTarget("host:http", bad), std::invalid_argument);
}

TEST_CASE("IPv6 literals are accepted only in brackets", "[config]") {
    LoadConfig cfg;
    ParseTarget("[::1]:8080/health", cfg);
    CHECK(cfg.host == "::1");
    CHECK(cfg.port == 8080);
    CHECK(cfg.path == "/health");
    CHECK(TargetUrl(cfg) == "http://[::1]:8080/health");

    LoadConfig no_port;
    ParseTarget("[fe80::2]", no_port);
    CHECK(no_port.host == "fe80::2");
    CHECK(no_port.port == 80);
    CHECK(TargetUrl(no_port) == "http://[fe80::2]/");

    LoadConfig bad;
    CHECK_THROWS_AS(ParseTarget("::1", bad), std::invalid_argument);
    CHECK_THROWS_AS(ParseTarget("fe80::2:8080", bad), std::invalid_argument);
    CHECK_THROWS_AS(ParseTarget("[::1", bad), std::invalid_argument);
    CHECK_THROWS_AS(ParseTarget("[::1]8080", bad), std::invalid_argument);
    CHECK_THROWS_AS(ParseTarget("[]:8080", bad), std::invalid_argument);
    CHECK_THROWS_AS(parse({"::1"}), std::invalid_argument);
}

TEST_CASE("Every option is understood", "[config]") {
    LoadConfig cfg = parse({"--threads", "8", "localhost:9000", "--path", "/ping", "--timeout", "0.5",
                            "--report-interval", "2", "--detailed", "--duration", "30", "--requests", "100",
                            "--results", "out.json", "--channel-capacity", "64", "--join-timeout", "0.25"});

    CHECK(cfg.host == "localhost");
    CHECK(cfg.port == 9000);
    CHECK(cfg.path == "/ping");
    CHECK(cfg.threads == 8);
    CHECK(cfg.timeout_sec == Approx(0.5));
    CHECK(cfg.report_interval_sec == Approx(2.0));
    CHECK(cfg.detailed);
    CHECK(cfg.duration_sec == Approx(30.0));
    CHECK(cfg.requests_per_worker == 100);
    CHECK(cfg.results_path == "out.json");
    CHECK(cfg.channel_capacity == 64);
    CHECK(cfg.join_timeout_sec == Approx(0.25));
}

TEST_CASE("--path wins over a path in the target", "[config]") {
    CHECK(parse({"--path", "/a", "host/b"}).path == "/a");
    CHECK(parse({"host/b", "--path", "/a"}).path == "/a");
    CHECK(parse({"host/b"}).path == "/b");
}

TEST_CASE("Help needs no target", "[config]") {
    CHECK(parse({"--help"}).show_help);
}

TEST_CASE("Malformed command lines are rejected", "[config]") {
    CHECK_THROWS_AS(parse({}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "--threads"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "--threads", "ten"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "--threads", "10x"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "--requests", "-5"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "--bogus"}), std::invalid_argument);
    CHECK_THROWS_AS(parse({"host", "other-host"}), std::invalid_argument);
}

TEST_CASE("Validation catches unusable settings", "[config]") {
    LoadConfig cfg;

    SECTION("zero threads") { cfg.threads = 0; }
    SECTION("zero timeout") { cfg.timeout_sec = 0; }
    SECTION("zero interval") { cfg.report_interval_sec = 0; }
    SECTION("negative duration") { cfg.duration_sec = -1; }
    SECTION("relative path") { cfg.path = "index.html"; }
    SECTION("port out of range") { cfg.port = 70000; }
    SECTION("detailed with no channel room") {
        cfg.detailed = true;
        cfg.channel_capacity = 0;
    }

    CHECK_THROWS_AS(ValidateConfig(cfg), std::invalid_argument);
}
