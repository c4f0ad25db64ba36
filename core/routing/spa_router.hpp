#pragma once

#include <array>
#include <functional>
#include <string>

namespace spaserve {
namespace routing {

/**
 * @brief How a request path was classified
 *
 * - ASSET:    matched the asset prefix or a static extension, served literally
 * - ROOT:     exactly "/", served as-is without touching the filesystem
 * - EXISTING: a file or directory exists at the path, served as-is
 * - FALLBACK: nothing exists at the path, rewritten to "/"
 */
enum class RouteKind { ASSET, ROOT, EXISTING, FALLBACK };

struct ServePath {
    std::string path;  // Effective path handed to the static file server
    RouteKind kind = RouteKind::ROOT;

    bool rewritten() const { return kind == RouteKind::FALLBACK; }
};

// Answers whether anything exists at a root-relative request path
using FileExistsFn = std::function<bool(const std::string &path)>;

constexpr const char *kRootPath = "/";
constexpr const char *kAssetPrefix = "/assets/";
constexpr std::array<const char *, 6> kAssetExtensions = {".js", ".css", ".png", ".jpg", ".ico", ".svg"};

/**
 * @brief Asset test on the path string alone
 *
 * True if the path starts with the asset prefix or ends with one of the
 * static extensions. Matching is case-sensitive.
 */
bool is_asset_path(const std::string &path);

/**
 * @brief Decide which path actually gets served
 *
 * Assets and "/" are returned unchanged without calling @p file_exists.
 * Every other path calls @p file_exists exactly once: present paths are
 * served as given, absent ones are rewritten to "/" so the static file
 * server returns the index document.
 *
 * resolve_serve_path(resolve_serve_path(p).path) always yields "/" or p.
 */
ServePath resolve_serve_path(const std::string &path, const FileExistsFn &file_exists);

std::string route_kind_to_string(RouteKind kind);

}  // namespace routing
}  // namespace spaserve
