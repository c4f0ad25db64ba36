#include "server.hpp"

#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "errors.hpp"
#include "logging/logger.hpp"
#include "routing/request_path.hpp"
#include "routing/spa_router.hpp"

namespace spaserve {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusInternal = 500;
constexpr const char *kAllowedMethods = "GET, HEAD";

// Raw request target; older requests built by hand may only carry the path
const std::string &raw_target(const httplib::Request &req) { return req.target.empty() ? req.path : req.target; }

void send_error(httplib::Response &res, StatusCode code, const std::string &message) {
    res.status = status_code_to_http(code);
    res.set_content(make_error_response(code, message).dump(), "application/json");
}
}  // namespace

SpaServer::SpaServer(const runtime::HttpConfig &http_config, const runtime::ServeConfig &serve_config,
                     bool access_log)
    : config_(http_config), access_log_(access_log), files_(serve_config.root, serve_config.index) {}

SpaServer::~SpaServer() { stop(); }

bool SpaServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // SO_REUSEADDR only: httplib's default SO_REUSEPORT would let a second
    // instance bind the same port instead of failing
    server_->set_socket_options([](auto sock) {
        int opt = 1;
        if (::setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
            LOG_WARN("[HTTP] setsockopt(SO_REUSEADDR) failed: " << std::strerror(errno));
        }
    });

    setup_handlers();
    setup_routes();

    // Bind first so a busy port fails start() instead of the listener thread
    errno = 0;
    bool bound = false;
    if (config_.port == 0) {
        const int port = server_->bind_to_any_port(config_.bind.c_str());
        if (port > 0) {
            port_ = port;
            bound = true;
        }
    } else {
        bound = server_->bind_to_port(config_.bind.c_str(), config_.port);
        if (bound) {
            port_ = config_.port;
        }
    }

    if (!bound) {
        const int bind_errno = errno;
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        if (bind_errno != 0) {
            error += ": " + std::string(std::strerror(bind_errno));
        }
        server_.reset();
        return false;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void SpaServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

std::string SpaServer::url() const { return "http://" + config_.bind + ":" + std::to_string(port_); }

void SpaServer::setup_handlers() {
    if (access_log_) {
        server_->set_logger([](const httplib::Request &req, const httplib::Response &res) {
            LOG_INFO("[HTTP] " << req.remote_addr << " \"" << req.method << " " << raw_target(req) << "\" "
                               << res.status);
        });
    }

    // JSON body for error statuses the handlers left empty (404 from the file
    // server, 400 from httplib's own request parsing)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        const StatusCode code = http_to_status_code(res.status);
        std::string message;
        switch (code) {
            case StatusCode::NOT_FOUND:
                message = "Not found: " + req.path;
                break;
            case StatusCode::INVALID_ARGUMENT:
                message = "Bad request";
                break;
            case StatusCode::METHOD_NOT_ALLOWED:
                message = "Method not allowed: " + req.method;
                break;
            default:
                message = "HTTP error " + std::to_string(res.status);
                break;
        }

        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception serving " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception serving " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, msg).dump(), "application/json");
    });
}

void SpaServer::setup_routes() {
    // GET (and HEAD) on any path - SPA routing over the document root
    server_->Get(R"(.*)", [this](const httplib::Request &req, httplib::Response &res) { handle_get(req, res); });

    // Everything else is refused
    auto refuse = [this](const httplib::Request &req, httplib::Response &res) { handle_method_not_allowed(req, res); };
    server_->Post(R"(.*)", refuse);
    server_->Put(R"(.*)", refuse);
    server_->Delete(R"(.*)", refuse);
    server_->Patch(R"(.*)", refuse);
    server_->Options(R"(.*)", refuse);

    LOG_INFO("[HTTP] Serving " << files_.root().string() << " (fallback: /" << files_.index() << ")");
}

void SpaServer::handle_get(const httplib::Request &req, httplib::Response &res) {
    const std::string &target = raw_target(req);

    std::string path;
    std::string error;
    if (!routing::parse_request_target(target, path, error)) {
        LOG_WARN("[HTTP] Rejected request target: " << error);
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const routing::ServePath serve_path =
        routing::resolve_serve_path(path, [this](const std::string &p) { return files_.exists(p); });

    if (serve_path.rewritten()) {
        LOG_DEBUG("[HTTP] " << path << " -> " << serve_path.path << " (client route)");
    } else {
        LOG_DEBUG("[HTTP] " << path << " (" << routing::route_kind_to_string(serve_path.kind) << ")");
    }

    files_.serve(serve_path.path, req, res);
}

void SpaServer::handle_method_not_allowed(const httplib::Request &req, httplib::Response &res) {
    res.set_header("Allow", kAllowedMethods);
    send_error(res, StatusCode::METHOD_NOT_ALLOWED, "Method not allowed: " + req.method);
}

}  // namespace http
}  // namespace spaserve
