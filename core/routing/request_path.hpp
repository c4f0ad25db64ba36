#pragma once

#include <string>

namespace spaserve {
namespace routing {

/**
 * @brief Extract the decoded path component of a raw request target
 *
 * Drops the query string and fragment, then percent-decodes what is left.
 * A target is rejected when:
 * - a '%' is not followed by two hex digits
 * - the decoded path does not start with '/'
 * - the decoded path contains a NUL byte
 * - any segment of the decoded path is ".."
 *
 * '+' is kept as-is; it only means space in form-encoded query strings.
 *
 * @param target Raw request target, e.g. "/dashboard%20x?tab=1"
 * @param path Populated with the decoded path on success
 * @param error Populated with the reason on failure
 * @return true if the target yielded a usable path
 */
bool parse_request_target(const std::string &target, std::string &path, std::string &error);

// Strict percent-decoding; returns false on a truncated or non-hex escape
bool percent_decode(const std::string &in, std::string &out);

// True if any '/'-separated segment equals ".."
bool has_parent_segment(const std::string &path);

}  // namespace routing
}  // namespace spaserve
