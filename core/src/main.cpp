// spaserve
// Single-page application server with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

constexpr const char *kDefaultConfigPath = "spaserve.yaml";

void print_usage() {
    std::cerr << "Usage: spaserve [OPTIONS]\n\n";
    std::cerr << "Serves a single-page application: asset paths are served as files,\n";
    std::cerr << "unknown paths get the index document.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH      Path to config file (default: " << kDefaultConfigPath << " if present)\n";
    std::cerr << "  --port=N           Listening port (default: " << spaserve::runtime::kDefaultPort << ")\n";
    std::cerr << "  --bind=ADDR        Bind address (default: 0.0.0.0)\n";
    std::cerr << "  --root=DIR         Document root (default: current directory)\n";
    std::cerr << "  --log-level=LVL    debug, info, warn, error or none (default: info)\n";
    std::cerr << "  --help, -h         Show this help\n";
}

// Accepts "--name=value" and "--name value"
bool take_option(const std::string &name, int argc, char **argv, int &i, std::string &value) {
    const std::string arg = argv[i];
    const std::string prefix = name + "=";
    if (arg.compare(0, prefix.size(), prefix) == 0) {
        value = arg.substr(prefix.size());
        return true;
    }
    if (arg == name && i + 1 < argc) {
        value = argv[++i];
        return true;
    }
    return false;
}

bool parse_port(const std::string &text, int &port) {
    try {
        size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        port = value;
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

}  // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool config_explicit = false;
    std::string port_arg;
    std::string bind_arg;
    std::string root_arg;
    std::string level_arg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (take_option("--config", argc, argv, i, value)) {
            config_path = value;
            config_explicit = true;
        } else if (take_option("--port", argc, argv, i, value)) {
            port_arg = value;
        } else if (take_option("--bind", argc, argv, i, value)) {
            bind_arg = value;
        } else if (take_option("--root", argc, argv, i, value)) {
            root_arg = value;
        } else if (take_option("--log-level", argc, argv, i, value)) {
            level_arg = value;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    // Apply the CLI log level early so config loading honors it
    if (!level_arg.empty()) {
        auto level = spaserve::logging::parse_level(level_arg);
        if (!level) {
            std::cerr << "ERROR: Invalid log level: " << level_arg << "\n";
            return 1;
        }
        spaserve::logging::Logger::set_level(*level);
    }

    spaserve::runtime::ServerConfig config;
    std::string error;

    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " << config_path);
        if (!spaserve::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    } else if (config_explicit) {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    }

    // CLI flags win over the config file
    if (!port_arg.empty() && !parse_port(port_arg, config.http.port)) {
        std::cerr << "ERROR: Invalid port: " << port_arg << "\n";
        return 1;
    }
    if (!bind_arg.empty()) {
        config.http.bind = bind_arg;
    }
    if (!root_arg.empty()) {
        config.serve.root = root_arg;
    }
    if (!level_arg.empty()) {
        config.logging.level = level_arg;
    }

    if (!spaserve::runtime::validate_config(config, error)) {
        LOG_ERROR("Invalid configuration: " << error);
        return 1;
    }

    spaserve::logging::Logger::set_level(*spaserve::logging::parse_level(config.logging.level));

    spaserve::runtime::Runtime runtime(config);

    if (!runtime.initialize(error)) {
        LOG_ERROR("Startup failed: " << error);
        return 1;
    }

    spaserve::runtime::SignalHandler::install();

    std::cout << "Serving SPA on " << runtime.get_server().url() << std::endl;

    // Run main loop (blocking)
    runtime.run();

    LOG_INFO("Shutdown complete");
    return 0;
}
