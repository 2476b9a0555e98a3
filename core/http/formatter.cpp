#include "formatter.hpp"

#include <type_traits>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "model/item_json.hpp"

namespace itemvault {
namespace http {

namespace {

constexpr const char *kJsonContentType = "application/json";

Response json_response(int status, const nlohmann::json &body) {
    Response res;
    res.status = status;
    res.body = body.dump();
    res.content_type = kJsonContentType;
    return res;
}

Response error_response(ErrorKind kind, const std::string &message, const nlohmann::json &details = nullptr) {
    return json_response(error_kind_to_http(kind), make_error_body(kind, message, details));
}

std::string join(const std::vector<std::string> &parts, const char *sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

Response format_success(const handlers::Success &success) {
    if (success.kind == handlers::SuccessKind::NO_CONTENT) {
        Response res;
        res.status = kStatusNoContent;
        return res;
    }

    int status = success.kind == handlers::SuccessKind::CREATED ? kStatusCreated : kStatusOk;
    if (const auto *item = std::get_if<model::Item>(&success.body)) {
        return json_response(status, model::encode_item(*item));
    }
    if (const auto *items = std::get_if<std::vector<model::Item>>(&success.body)) {
        return json_response(status, model::encode_items(*items));
    }
    Response res;
    res.status = status;
    return res;
}

Response format_failure(const handlers::Failure &failure) {
    return std::visit(
        [](const auto &error) -> Response {
            using T = std::decay_t<decltype(error)>;

            if constexpr (std::is_same_v<T, handlers::ValidationError>) {
                nlohmann::json details = nlohmann::json::array();
                for (const auto &field : error.fields) {
                    details.push_back({{"field", field.field}, {"reason", field.reason}});
                }
                return error_response(ErrorKind::VALIDATION, "Invalid item data", details);
            } else if constexpr (std::is_same_v<T, handlers::NotFoundError>) {
                return error_response(ErrorKind::NOT_FOUND, "Item not found: " + error.id, {{"id", error.id}});
            } else if constexpr (std::is_same_v<T, handlers::RouteError>) {
                if (error.method_mismatch()) {
                    Response res = error_response(ErrorKind::METHOD_NOT_ALLOWED,
                                                  "Method " + error.method + " not allowed on " + error.path,
                                                  {{"allowed", error.allowed_methods}});
                    res.headers.emplace_back("Allow", join(error.allowed_methods, ", "));
                    return res;
                }
                return error_response(ErrorKind::ROUTE_NOT_FOUND,
                                      "Route not found: " + error.method + " " + error.path);
            } else if constexpr (std::is_same_v<T, handlers::ConflictError>) {
                return error_response(ErrorKind::INTERNAL, "Internal server error", {{"errorId", error.error_id}});
            } else {
                static_assert(std::is_same_v<T, handlers::InternalError>, "unhandled failure kind");
                return error_response(ErrorKind::INTERNAL, "Internal server error", {{"errorId", error.error_id}});
            }
        },
        failure);
}

}  // namespace

Response format_response(const handlers::Outcome &outcome) {
    if (outcome.is_success()) {
        return format_success(outcome.success());
    }
    return format_failure(outcome.failure());
}

}  // namespace http
}  // namespace itemvault
