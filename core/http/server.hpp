#pragma once

#include <httplib.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "http/static_files.hpp"
#include "runtime/config.hpp"

namespace spaserve {
namespace http {

/**
 * @brief HTTP front end serving a single-page application
 *
 * Every GET (and HEAD) request goes through three steps:
 * 1. the raw target is reduced to a decoded path (400 if malformed)
 * 2. the SPA router picks the effective path: assets and existing files
 *    as given, anything else rewritten to "/"
 * 3. the static file server answers for the effective path
 *
 * Other methods get 405. Error responses without a body get a JSON
 * {"status": {...}} body.
 *
 * Thread model:
 * - Listener runs in its own thread (httplib::Server::listen_after_bind)
 * - Requests execute on httplib's thread pool
 * - Handlers only read the document root, so no locking is needed
 *
 * Lifecycle:
 * - start() binds to the configured address and spawns the listener thread
 * - stop() shuts the listener down and joins it
 */
class SpaServer {
public:
    SpaServer(const runtime::HttpConfig &http_config, const runtime::ServeConfig &serve_config,
              bool access_log = true);

    ~SpaServer();

    SpaServer(const SpaServer &) = delete;
    SpaServer &operator=(const SpaServer &) = delete;

    /**
     * @brief Bind and start serving
     *
     * A configured port of 0 binds to any free port; get_port() reports it.
     *
     * @param error Populated with the bind failure on error
     * @return true if the server is listening
     */
    bool start(std::string &error);

    /**
     * @brief Stop serving
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (valid after a successful start())
    int get_port() const { return port_; }

    // "http://<bind>:<port>"
    std::string url() const;

private:
    runtime::HttpConfig config_;
    bool access_log_;
    int port_ = 0;

    StaticFileServer files_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    void setup_handlers();

    void handle_get(const httplib::Request &req, httplib::Response &res);
    void handle_method_not_allowed(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace spaserve
