// Tether
// Supervises the application's sidecar process and exposes its port

#include <iostream>
#include <string>
#include <filesystem>
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path = "tether.yaml"; // Default

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: tetherd [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: tether.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n\n";
            std::cerr << "Signals:\n";
            std::cerr << "  SIGINT, SIGTERM  Kill the sidecar and exit\n";
            std::cerr << "  SIGUSR1          Kill the sidecar ahead of an update\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path))
    {
        // Using cerr here as logger might not be initialized/configured
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("Tether sidecar supervisor starting...");
    LOG_INFO("Loading config: " + config_path);

    tether::runtime::RuntimeConfig config;
    std::string error;

    if (!tether::runtime::load_config(config_path, config, error))
    {
        LOG_ERROR("Failed to load config: " + error);
        return 1;
    }

    tether::logging::Logger::set_level(tether::logging::string_to_level(config.logging.level));

    // Installed before spawn so an early Ctrl+C still runs the exit hook
    tether::runtime::SignalHandler::install();

    tether::runtime::Runtime runtime(config);

    if (!runtime.initialize(error))
    {
        // Unrecoverable: the application cannot run without its sidecar
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    LOG_INFO("Runtime Ready");

    // Run main loop (blocking)
    runtime.run();

    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
