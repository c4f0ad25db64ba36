#include "runtime.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace spaserve {
namespace runtime {

namespace fs = std::filesystem;

Runtime::Runtime(const ServerConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing spaserve");

    check_document_root();

    http_server_ = std::make_unique<http::SpaServer>(config_.http, config_.serve, config_.logging.access_log);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

void Runtime::check_document_root() const {
    // A missing root or index is not fatal: those requests answer 404
    std::error_code ec;
    const fs::path root(config_.serve.root);
    if (!fs::is_directory(root, ec)) {
        LOG_WARN("[Runtime] Document root is not a readable directory: " << root.string());
        return;
    }

    const fs::path index = root / config_.serve.index;
    if (!fs::is_regular_file(index, ec)) {
        LOG_WARN("[Runtime] Fallback document missing: " << index.string()
                                                         << " (client routes will answer 404)");
    }
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
            break;
        }
    }

    shutdown();
}

void Runtime::shutdown() {
    if (http_server_ && http_server_->is_running()) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
    }
}

}  // namespace runtime
}  // namespace spaserve
