#include "static_files.hpp"

#include <sys/stat.h>

#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "logging/logger.hpp"
#include "mime_types.hpp"

namespace spaserve {
namespace http {

namespace fs = std::filesystem;

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusMovedPermanently = 301;
constexpr int kStatusNotModified = 304;
constexpr int kStatusNotFound = 404;

bool read_file(const fs::path &file, std::string &body) {
    std::ifstream in(file, std::ios::binary);
    if (!in.good()) {
        return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return false;
    }
    body = ss.str();
    return true;
}

// Raw (still percent-encoded) path and query of the request. A run of
// leading slashes is collapsed to one: "//host/" in a Location header is a
// protocol-relative URL and would leave this server.
std::pair<std::string, std::string> split_target(const httplib::Request &req) {
    const std::string &target = req.target.empty() ? req.path : req.target;
    const size_t q = target.find('?');
    std::string raw_path = target.substr(0, q);
    std::string query = q == std::string::npos ? "" : target.substr(q);

    const size_t first = raw_path.find_first_not_of('/');
    if (first == std::string::npos) {
        raw_path = "/";
    } else if (first > 1) {
        raw_path.erase(0, first - 1);
    } else if (first == 0) {
        raw_path.insert(0, "/");
    }
    return {raw_path, query};
}
}  // namespace

StaticFileServer::StaticFileServer(fs::path root, std::string index)
    : root_(std::move(root)), index_(std::move(index)) {}

fs::path StaticFileServer::resolve(const std::string &path) const {
    // Leading slashes would make the operand absolute and replace the root
    const size_t first = path.find_first_not_of('/');
    if (first == std::string::npos) {
        return root_ / "";
    }
    return root_ / path.substr(first);
}

bool StaticFileServer::exists(const std::string &path) const {
    std::error_code ec;
    return fs::exists(resolve(path), ec);
}

void StaticFileServer::serve(const std::string &path, const httplib::Request &req, httplib::Response &res) const {
    fs::path target = resolve(path);
    const bool trailing_slash = !path.empty() && path.back() == '/';

    std::error_code ec;
    fs::file_status st = fs::status(target, ec);
    if (ec || !fs::exists(st)) {
        LOG_DEBUG("[Static] Not found: " << target.string());
        res.status = kStatusNotFound;
        return;
    }

    if (fs::is_directory(st)) {
        if (!trailing_slash) {
            auto [raw_path, query] = split_target(req);
            const std::string location = raw_path + "/" + query;
            LOG_DEBUG("[Static] Redirecting directory " << path << " -> " << location);
            res.set_redirect(location.c_str(), kStatusMovedPermanently);
            return;
        }

        target /= index_;
        st = fs::status(target, ec);
        if (ec || !fs::is_regular_file(st)) {
            LOG_DEBUG("[Static] No index document in " << target.parent_path().string());
            res.status = kStatusNotFound;
            return;
        }
    } else if (trailing_slash || !fs::is_regular_file(st)) {
        res.status = kStatusNotFound;
        return;
    }

    struct stat info;
    std::memset(&info, 0, sizeof(info));
    if (::stat(target.c_str(), &info) != 0) {
        res.status = kStatusNotFound;
        return;
    }
    const std::string last_modified = format_http_date(info.st_mtime);

    if (req.has_header("If-Modified-Since")) {
        std::time_t since = 0;
        if (parse_http_date(req.get_header_value("If-Modified-Since"), since) && info.st_mtime <= since) {
            res.status = kStatusNotModified;
            res.set_header("Last-Modified", last_modified.c_str());
            return;
        }
    }

    std::string body;
    if (!read_file(target, body)) {
        LOG_WARN("[Static] Failed to read " << target.string());
        res.status = kStatusNotFound;
        return;
    }

    const std::string content_type = content_type_for(target.string());
    res.status = kStatusOk;
    res.set_header("Last-Modified", last_modified.c_str());
    res.set_content(std::move(body), content_type.c_str());
}

std::string format_http_date(std::time_t t) {
    std::tm tm_buf;
    gmtime_r(&t, &tm_buf);

    char buf[64];
    const size_t n = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);
    return std::string(buf, n);
}

bool parse_http_date(const std::string &value, std::time_t &t) {
    std::tm tm_buf;
    std::memset(&tm_buf, 0, sizeof(tm_buf));

    const char *end = strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm_buf);
    if (end == nullptr || *end != '\0') {
        return false;
    }

    t = timegm(&tm_buf);
    return t != static_cast<std::time_t>(-1);
}

}  // namespace http
}  // namespace spaserve
