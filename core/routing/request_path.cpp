#include "request_path.hpp"

#include <cstddef>

namespace spaserve {
namespace routing {

namespace {
int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}
}  // namespace

bool percent_decode(const std::string &in, std::string &out) {
    out.clear();
    out.reserve(in.size());

    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') {
            out.push_back(in[i]);
            continue;
        }

        if (i + 2 >= in.size()) {
            return false;
        }
        const int hi = hex_value(in[i + 1]);
        const int lo = hex_value(in[i + 2]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }

    return true;
}

bool has_parent_segment(const std::string &path) {
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        if (path.compare(start, end - start, "..") == 0) {
            return true;
        }
        start = end + 1;
    }
    return false;
}

bool parse_request_target(const std::string &target, std::string &path, std::string &error) {
    const size_t cut = target.find_first_of("?#");
    const std::string raw = target.substr(0, cut);

    if (raw.empty()) {
        error = "Empty request path";
        return false;
    }

    std::string decoded;
    if (!percent_decode(raw, decoded)) {
        error = "Malformed percent-encoding in path: " + raw;
        return false;
    }

    if (decoded.empty() || decoded.front() != '/') {
        error = "Request path must start with '/': " + raw;
        return false;
    }

    if (decoded.find('\0') != std::string::npos) {
        error = "Request path contains a NUL byte";
        return false;
    }

    if (has_parent_segment(decoded)) {
        error = "Request path escapes the document root: " + raw;
        return false;
    }

    path = decoded;
    return true;
}

}  // namespace routing
}  // namespace spaserve
