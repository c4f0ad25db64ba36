#pragma once

#include <httplib.h>

#include <ctime>
#include <filesystem>
#include <string>

namespace spaserve {
namespace http {

/**
 * @brief Serves files from a read-only document root
 *
 * Request paths are resolved relative to the root. Directory paths map to
 * the index document: "/" and "/docs/" serve "<root>/index.html" and
 * "<root>/docs/index.html". A directory requested without its trailing
 * slash is redirected to the slash form. There is no directory listing.
 *
 * Successful responses carry the file bytes, a Content-Type chosen from the
 * extension and a Last-Modified header. A matching If-Modified-Since
 * yields 304. Failures only set the status; the server's error handler
 * writes the body.
 *
 * Holds no mutable state, so one instance is shared by all worker threads.
 */
class StaticFileServer {
public:
    StaticFileServer(std::filesystem::path root, std::string index);

    /**
     * @brief Whether anything exists at the root-relative request path
     *
     * Directories count, symlinks are followed. Used as the router's
     * existence check.
     */
    bool exists(const std::string &path) const;

    /**
     * @brief Fill @p res for @p path
     *
     * @param path Decoded request path starting with '/'
     * @param req Source of the raw target (for redirects) and conditional headers
     * @param res Response to populate
     */
    void serve(const std::string &path, const httplib::Request &req, httplib::Response &res) const;

    // Filesystem location a request path maps to (no existence check)
    std::filesystem::path resolve(const std::string &path) const;

    const std::filesystem::path &root() const { return root_; }
    const std::string &index() const { return index_; }

private:
    std::filesystem::path root_;
    std::string index_;
};

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT"
std::string format_http_date(std::time_t t);
bool parse_http_date(const std::string &value, std::time_t &t);

}  // namespace http
}  // namespace spaserve
