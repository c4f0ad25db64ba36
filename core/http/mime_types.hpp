#pragma once

#include <string>

namespace spaserve {
namespace http {

constexpr const char *kDefaultContentType = "application/octet-stream";

// Content type for a file path, chosen by its extension (case-insensitive)
std::string content_type_for(const std::string &path);

}  // namespace http
}  // namespace spaserve
