#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace spaserve {
namespace http {

/**
 * @brief Status codes reported in JSON error bodies
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - METHOD_NOT_ALLOWED -> HTTP 405
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, METHOD_NOT_ALLOWED, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::METHOD_NOT_ALLOWED:
            return 405;
        case StatusCode::INTERNAL:
            return 500;
        default:
            return 500;
    }
}

// Maps an HTTP status back to the closest code; anything unrecognized is INTERNAL
inline StatusCode http_to_status_code(int status) {
    switch (status) {
        case 200:
            return StatusCode::OK;
        case 400:
            return StatusCode::INVALID_ARGUMENT;
        case 404:
            return StatusCode::NOT_FOUND;
        case 405:
            return StatusCode::METHOD_NOT_ALLOWED;
        default:
            return StatusCode::INTERNAL;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::METHOD_NOT_ALLOWED:
            return "METHOD_NOT_ALLOWED";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Build a JSON error body
 *
 * Shape: {"status": {"code": "NOT_FOUND", "message": "..."}}
 */
inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    std::string msg = message.empty() ? status_code_to_string(code) : message;
    return {{"status", {{"code", status_code_to_string(code)}, {"message", msg}}}};
}

}  // namespace http
}  // namespace spaserve
