#include "spa_router.hpp"

#include <cstring>

namespace spaserve {
namespace routing {

namespace {
bool ends_with(const std::string &s, const char *suffix) {
    const size_t n = std::strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}
}  // namespace

bool is_asset_path(const std::string &path) {
    if (path.rfind(kAssetPrefix, 0) == 0) {
        return true;
    }

    for (const char *ext : kAssetExtensions) {
        if (ends_with(path, ext)) {
            return true;
        }
    }
    return false;
}

ServePath resolve_serve_path(const std::string &path, const FileExistsFn &file_exists) {
    if (is_asset_path(path)) {
        return {path, RouteKind::ASSET};
    }

    if (path == kRootPath) {
        return {path, RouteKind::ROOT};
    }

    if (file_exists && file_exists(path)) {
        return {path, RouteKind::EXISTING};
    }

    return {kRootPath, RouteKind::FALLBACK};
}

std::string route_kind_to_string(RouteKind kind) {
    switch (kind) {
        case RouteKind::ASSET:
            return "ASSET";
        case RouteKind::ROOT:
            return "ROOT";
        case RouteKind::EXISTING:
            return "EXISTING";
        case RouteKind::FALLBACK:
            return "FALLBACK";
        default:
            return "UNKNOWN";
    }
}

}  // namespace routing
}  // namespace spaserve
