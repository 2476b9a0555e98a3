#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace itemvault {
namespace http {

/**
 * @brief Error kinds exposed to clients, mapped to HTTP status codes
 *
 * - VALIDATION -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - ROUTE_NOT_FOUND -> HTTP 404
 * - METHOD_NOT_ALLOWED -> HTTP 405
 * - INTERNAL -> HTTP 500
 */
enum class ErrorKind { VALIDATION, NOT_FOUND, ROUTE_NOT_FOUND, METHOD_NOT_ALLOWED, INTERNAL };

constexpr int kStatusOk = 200;
constexpr int kStatusCreated = 201;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;

inline int error_kind_to_http(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:
            return kStatusBadRequest;
        case ErrorKind::NOT_FOUND:
        case ErrorKind::ROUTE_NOT_FOUND:
            return kStatusNotFound;
        case ErrorKind::METHOD_NOT_ALLOWED:
            return kStatusMethodNotAllowed;
        case ErrorKind::INTERNAL:
            return kStatusInternal;
        default:
            return kStatusInternal;
    }
}

// Value of the "error" field in error bodies
inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION:
            return "validation_error";
        case ErrorKind::NOT_FOUND:
            return "not_found";
        case ErrorKind::ROUTE_NOT_FOUND:
            return "route_not_found";
        case ErrorKind::METHOD_NOT_ALLOWED:
            return "method_not_allowed";
        case ErrorKind::INTERNAL:
            return "internal_error";
        default:
            return "internal_error";
    }
}

/**
 * @brief Build a JSON error body
 *
 * Shape: { "error": <kind>, "message": <text>, "details"?: <any> }
 * "details" is omitted when null.
 */
inline nlohmann::json make_error_body(ErrorKind kind, const std::string &message,
                                      const nlohmann::json &details = nullptr) {
    nlohmann::json body = {{"error", error_kind_to_string(kind)}, {"message", message}};
    if (!details.is_null()) {
        body["details"] = details;
    }
    return body;
}

}  // namespace http
}  // namespace itemvault
