#include "dispatcher.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"

namespace itemvault {
namespace http {

namespace {

const std::vector<std::string> kCollectionMethods = {"GET", "POST"};
const std::vector<std::string> kMemberMethods = {"GET", "PUT", "DELETE"};

std::string strip_query(const std::string &path) {
    auto pos = path.find('?');
    return pos == std::string::npos ? path : path.substr(0, pos);
}

// Parse a create/update body into a JSON value, or describe why it is not one
std::optional<nlohmann::json> parse_body(const std::string &body, std::string &error) {
    nlohmann::json parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded()) {
        error = body.empty() ? "request body is empty, expected a JSON object" : "invalid JSON";
        return std::nullopt;
    }
    return parsed;
}

handlers::Outcome invalid_body(const std::string &reason) {
    handlers::ValidationError error;
    error.fields.push_back({"body", reason});
    return handlers::Outcome::fail(std::move(error));
}

}  // namespace

Dispatcher::Dispatcher(handlers::ItemHandlers &handlers, std::string resource_root)
    : handlers_(handlers), root_(std::move(resource_root)) {}

handlers::Outcome Dispatcher::dispatch(const Request &request) const {
    const std::string path = strip_query(request.path);
    const std::string &method = request.method;

    auto match = match_path(path);
    if (!match) {
        LOG_DEBUG("[HTTP] No route for " << method << " " << path);
        return handlers::Outcome::fail(handlers::RouteError{method, path, {}});
    }

    if (match->collection) {
        if (method == "GET") {
            return handlers_.list();
        }
        if (method == "POST") {
            std::string error;
            auto payload = parse_body(request.body, error);
            if (!payload) {
                return invalid_body(error);
            }
            return handlers_.create(*payload);
        }
        return handlers::Outcome::fail(handlers::RouteError{method, path, kCollectionMethods});
    }

    if (method == "GET") {
        return handlers_.get(match->id);
    }
    if (method == "PUT") {
        std::string error;
        auto payload = parse_body(request.body, error);
        if (!payload) {
            return invalid_body(error);
        }
        return handlers_.update(match->id, *payload);
    }
    if (method == "DELETE") {
        return handlers_.remove(match->id);
    }
    return handlers::Outcome::fail(handlers::RouteError{method, path, kMemberMethods});
}

std::vector<std::string> Dispatcher::allowed_methods(const std::string &path) const {
    auto match = match_path(strip_query(path));
    if (!match) {
        return {};
    }
    return match->collection ? kCollectionMethods : kMemberMethods;
}

std::optional<Dispatcher::PathMatch> Dispatcher::match_path(const std::string &path) const {
    if (path.compare(0, root_.size(), root_) != 0) {
        return std::nullopt;
    }

    std::string rest = path.substr(root_.size());
    if (rest.empty() || rest == "/") {
        PathMatch match;
        match.collection = true;
        return match;
    }

    if (rest[0] != '/') {
        return std::nullopt;  // e.g. "/itemsfoo"
    }
    rest.erase(0, 1);
    if (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }
    if (rest.empty() || rest.find('/') != std::string::npos) {
        return std::nullopt;
    }

    PathMatch match;
    match.id = std::move(rest);
    return match;
}

}  // namespace http
}  // namespace itemvault
