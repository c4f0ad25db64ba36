#include "mime_types.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace spaserve {
namespace http {

namespace {
const std::unordered_map<std::string, std::string> &mime_table() {
    static const std::unordered_map<std::string, std::string> table = {
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".mjs", "text/javascript"},
        {".json", "application/json"},
        {".map", "application/json"},
        {".webmanifest", "application/manifest+json"},
        {".txt", "text/plain"},
        {".xml", "application/xml"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".avif", "image/avif"},
        {".svg", "image/svg+xml"},
        {".ico", "image/vnd.microsoft.icon"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".wasm", "application/wasm"},
        {".pdf", "application/pdf"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".webm", "video/webm"},
        {".mp4", "video/mp4"},
    };
    return table;
}
}  // namespace

std::string content_type_for(const std::string &path) {
    const size_t slash = path.find_last_of('/');
    const size_t dot = path.find_last_of('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return kDefaultContentType;
    }

    std::string ext = path.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });

    const auto &table = mime_table();
    auto it = table.find(ext);
    return it != table.end() ? it->second : kDefaultContentType;
}

}  // namespace http
}  // namespace spaserve
