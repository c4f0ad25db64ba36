#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"

namespace spaserve {
namespace runtime {

class Runtime {
public:
    explicit Runtime(const ServerConfig &config);
    ~Runtime();

    // Checks the document root and starts the HTTP server; bind failure is fatal
    bool initialize(std::string &error);

    // Main loop (blocking) until stop() or SIGINT/SIGTERM
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops the HTTP server
    void shutdown();

    http::SpaServer &get_server() { return *http_server_; }

private:
    void check_document_root() const;

    ServerConfig config_;
    std::unique_ptr<http::SpaServer> http_server_;
    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace spaserve
