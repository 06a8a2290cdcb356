#include "config.hpp"
#include "platform/linux/linux_service.hpp"

#include <exception>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    int port_override = -1;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 < argc) {
                try {
                    port_override = std::stoi(argv[++i]);
                } catch (const std::exception&) {
                    std::println(stderr, "Invalid port: {}", argv[i]);
                    return 2;
                }
            }
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: audio-scribe [options]");
            std::println("Options:");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -p, --port PORT     Listen port (overrides config)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 2;
        }
    }

    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }
    if (port_override >= 0) {
        config.server.port = port_override;
    }

    if (verbose) {
        std::println(stderr, "[audio-scribe] Starting (recognizer: {}, grammar model: {})",
                     config.whisper.backend, config.grammar.model);
    }

    LinuxService service(std::move(config), verbose);
    if (!service.init()) {
        std::println(stderr, "Failed to start service");
        return 1;
    }

    return service.run();
}
