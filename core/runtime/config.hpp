#pragma once

#include <string>

namespace spaserve {
namespace runtime {

constexpr int kDefaultPort = 7777;

struct HttpConfig {
    std::string bind = "0.0.0.0";  // Bind address
    int port = kDefaultPort;       // HTTP port (0 = pick a free port)
    int thread_pool_size = 8;      // Worker thread pool size
};

struct ServeConfig {
    std::string root = ".";          // Document root
    std::string index = "index.html";  // Fallback document inside the root
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
    bool access_log = true;      // One INFO line per request
};

struct ServerConfig {
    HttpConfig http;
    ServeConfig serve;
    LoggingConfig logging;
};

// Loads configuration from a YAML file; keys absent from the file keep their defaults
bool load_config(const std::string &config_path, ServerConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServerConfig &config, std::string &error);

}  // namespace runtime
}  // namespace spaserve
