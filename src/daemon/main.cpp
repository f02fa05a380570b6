#include "config.hpp"
#include "logging.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <csignal>
#include <filesystem>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: echo-dictate [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 1;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    if (!foreground) {
        if (auto res = platform::daemonize(); !res) {
            std::println(stderr, "Could not daemonize: {}", res.error());
            return 1;
        }
    }

    // Writes to a wl-copy or sherpa-onnx child that died must not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    auto log_file = config.log.file.empty()
                        ? std::filesystem::temp_directory_path() / "echo-dictate-debug.log"
                        : std::filesystem::path(config.log.file);
    logging::init(verbose, log_file);
    logging::info("Starting (engines: {})", config.engine.preference.empty()
                                                ? std::string("registration order")
                                                : config.engine.preference.front() + " first");

    LinuxEventLoop loop(std::move(config));
    if (!loop.init()) {
        logging::error("Failed to initialize event loop");
        return 1;
    }

    loop.run();
    logging::info("Stopped");
    return 0;
}
