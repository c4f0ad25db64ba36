#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <vector>

#include "logging/logger.hpp"

namespace spaserve {
namespace runtime {

namespace {
void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    for (const auto &key_node : node) {
        const std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key: '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}
}  // namespace

bool validate_config(const ServerConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 0 || config.http.port > 65535) {
        error = "HTTP port must be between 0 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }

    // Validate serve settings
    if (config.serve.root.empty()) {
        error = "serve.root must not be empty";
        return false;
    }
    if (config.serve.index.empty()) {
        error = "serve.index must not be empty";
        return false;
    }
    if (config.serve.index.find('/') != std::string::npos || config.serve.index == "." ||
        config.serve.index == "..") {
        error = "serve.index must be a plain file name: " + config.serve.index;
        return false;
    }

    // Validate Logging settings
    if (!logging::parse_level(config.logging.level)) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServerConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: defaults only
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"http", "serve", "logging"});

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            warn_unknown_keys(http, "http", {"bind", "port", "thread_pool_size"});

            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
        }

        // Load serve config
        if (yaml["serve"]) {
            const auto &serve = yaml["serve"];
            warn_unknown_keys(serve, "serve", {"root", "index"});

            if (serve["root"]) {
                config.serve.root = serve["root"].as<std::string>();
            }
            if (serve["index"]) {
                config.serve.index = serve["index"].as<std::string>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            const auto &log_node = yaml["logging"];
            warn_unknown_keys(log_node, "logging", {"level", "access_log"});

            if (log_node["level"]) {
                config.logging.level = log_node["level"].as<std::string>();
            }
            if (log_node["access_log"]) {
                config.logging.access_log = log_node["access_log"].as<bool>();
            }
        }
    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::Exception &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }

    if (!validate_config(config, error)) {
        return false;
    }

    LOG_INFO("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " (" << config.http.thread_pool_size
                               << " threads)");
    LOG_INFO("[Config] Document root: " << config.serve.root << " (index: " << config.serve.index << ")");
    LOG_INFO("[Config] Log level: " << config.logging.level
                                    << ", access log: " << (config.logging.access_log ? "on" : "off"));
    return true;
}

}  // namespace runtime
}  // namespace spaserve
