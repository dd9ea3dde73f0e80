#include <iostream>
#include <memory>    // Required for std::unique_ptr
#include <stdexcept>
#include <string>

#include "load_config.hpp"
#include "load_test.hpp"
#include "transports/httplib_transport.hpp"

int main(int argc, char* argv[]) {
    LoadConfig config;
    try {
        config = ParseArgs(argc, argv);
        if (config.show_help) {
            PrintUsage(std::cout, argv[0]);
            return 0;
        }
        ValidateConfig(config);
    } catch (const std::exception& e) {
        std::cerr << "Error parsing arguments: " << e.what() << "\n";
        PrintUsage(std::cerr, argv[0]);
        return 1;
    }

    try {
        LoadTest test(config, std::make_unique<HttplibTransport>(config.host, config.port));
        test.Run();
    } catch (const std::exception& e) {
        std::cerr << "Load test failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
