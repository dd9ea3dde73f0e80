#include "load_config.hpp"

#include <ostream>
#include <stdexcept>

namespace {

template <typename Parse>
auto parse_number(const std::string& option, const std::string& value, Parse parse)
{
    size_t consumed = 0;
    try {
        auto result = parse(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return result;
    } catch (const std::logic_error&) {
        // std::stoi/std::stod report both malformed and out-of-range input as logic_error subclasses.
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
}

int parse_int(const std::string& option, const std::string& value)
{
    return parse_number(option, value, [](const std::string& s, size_t* pos) { return std::stoi(s, pos); });
}

double parse_double(const std::string& option, const std::string& value)
{
    return parse_number(option, value, [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
}

unsigned long long parse_count(const std::string& option, const std::string& value)
{
    if (!value.empty() && value[0] == '-') {
        throw std::invalid_argument("Invalid value for " + option + ": '" + value + "'");
    }
    return parse_number(option, value, [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
}

} // namespace

void ParseTarget(const std::string& target, LoadConfig& config)
{
    std::string rest = target;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    }

    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        config.path = rest.substr(slash);
        rest = rest.substr(0, slash);
    }

    if (!rest.empty() && rest[0] == '[') {
        // [addr] or [addr]:port
        size_t close = rest.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated '[' in target: " + target);
        }
        std::string tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                throw std::invalid_argument("Unexpected characters after ']' in target: " + target);
            }
            config.port = parse_int("port", tail.substr(1));
        }
        rest = rest.substr(1, close - 1);
    } else if (rest.find(':') != rest.rfind(':')) {
        throw std::invalid_argument("IPv6 addresses must be bracketed, e.g. [::1]:8080: " + target);
    } else {
        size_t colon = rest.find(':');
        if (colon != std::string::npos) {
            config.port = parse_int("port", rest.substr(colon + 1));
            rest = rest.substr(0, colon);
        }
    }

    if (rest.empty()) {
        throw std::invalid_argument("Target host must not be empty");
    }
    config.host = rest;
}

LoadConfig ParseArgs(int argc, char* argv[])
{
    LoadConfig config;
    bool have_target = false;
    bool have_path = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_help = true;
        } else if (arg == "--path") {
            config.path = next_value();
            have_path = true;
        } else if (arg == "--threads") {
            config.threads = parse_int(arg, next_value());
        } else if (arg == "--timeout") {
            config.timeout_sec = parse_double(arg, next_value());
        } else if (arg == "--report-interval") {
            config.report_interval_sec = parse_double(arg, next_value());
        } else if (arg == "--detailed") {
            config.detailed = true;
        } else if (arg == "--duration") {
            config.duration_sec = parse_double(arg, next_value());
        } else if (arg == "--requests") {
            config.requests_per_worker = parse_count(arg, next_value());
        } else if (arg == "--results") {
            config.results_path = next_value();
        } else if (arg == "--channel-capacity") {
            config.channel_capacity = static_cast<size_t>(parse_count(arg, next_value()));
        } else if (arg == "--join-timeout") {
            config.join_timeout_sec = parse_double(arg, next_value());
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (!have_target) {
            std::string explicit_path = config.path;
            ParseTarget(arg, config);
            // --path wins over a path embedded in the target.
            if (have_path) {
                config.path = explicit_path;
            }
            have_target = true;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (!have_target && !config.show_help) {
        throw std::invalid_argument("Missing target host");
    }
    return config;
}

void ValidateConfig(const LoadConfig& config)
{
    if (config.host.empty()) {
        throw std::invalid_argument("Target host must not be empty");
    }
    if (config.port <= 0 || config.port > 65535) {
        throw std::invalid_argument("Port must be in 1..65535");
    }
    if (config.path.empty() || config.path[0] != '/') {
        throw std::invalid_argument("Path must start with '/'");
    }
    if (config.threads <= 0) {
        throw std::invalid_argument("Thread count must be greater than 0");
    }
    if (config.timeout_sec <= 0) {
        throw std::invalid_argument("Timeout must be positive");
    }
    if (config.report_interval_sec <= 0) {
        throw std::invalid_argument("Report interval must be positive");
    }
    if (config.duration_sec < 0) {
        throw std::invalid_argument("Duration must not be negative");
    }
    if (config.detailed && config.channel_capacity == 0) {
        throw std::invalid_argument("Channel capacity must be greater than 0");
    }
    if (config.join_timeout_sec < 0) {
        throw std::invalid_argument("Join timeout must not be negative");
    }
}

std::string TargetUrl(const LoadConfig& config)
{
    std::string url = "http://";
    if (config.host.find(':') != std::string::npos) {
        url += "[" + config.host + "]";
    } else {
        url += config.host;
    }
    if (config.port != DEFAULT_PORT) {
        url += ":" + std::to_string(config.port);
    }
    return url + config.path;
}

void PrintUsage(std::ostream& out, const char* program)
{
    out << "Usage: " << program << " <host[:port] | [ipv6-addr][:port]> [options]\n"
        << "Options:\n"
        << "  --path <path>              HTTP path to request (default: /)\n"
        << "  --threads <n>              Number of concurrent workers (default: " << DEFAULT_THREADS << ")\n"
        << "  --timeout <sec>            Request timeout in seconds (default: " << DEFAULT_TIMEOUT_SEC << ")\n"
        << "  --report-interval <sec>    Stats reporting interval in seconds (default: " << DEFAULT_REPORT_INTERVAL_SEC << ")\n"
        << "  --detailed                 Collect per-request events and a status-code breakdown\n"
        << "  --duration <sec>           Stop after this many seconds (default: until Ctrl+C)\n"
        << "  --requests <n>             Stop each worker after n attempts (default: unbounded)\n"
        << "  --results <file>           Append the final summary to a JSON results file\n"
        << "  --channel-capacity <n>     Event channel capacity in detailed mode (default: " << DEFAULT_CHANNEL_CAPACITY << ")\n"
        << "  --join-timeout <sec>       How long to wait for each worker at shutdown (default: " << DEFAULT_JOIN_TIMEOUT_SEC << ")\n"
        << "  -h, --help                 Show this help message\n"
        << "Example: " << program << " 192.168.1.10:8080 --threads 100 --path /index.html\n";
}
