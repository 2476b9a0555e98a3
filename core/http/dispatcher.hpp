#pragma once

#include <optional>
#include <string>
#include <vector>

#include "handlers/item_handlers.hpp"
#include "handlers/outcome.hpp"
#include "message.hpp"

namespace itemvault {
namespace http {

/**
 * @brief Routes (method, path) to an item operation
 *
 * Routes:
 * - POST   /items       -> create
 * - GET    /items       -> list
 * - GET    /items/{id}  -> get
 * - PUT    /items/{id}  -> update
 * - DELETE /items/{id}  -> remove
 *
 * A path that matches a route with the wrong method yields a RouteError with
 * the allowed methods (405); an unknown path yields a RouteError without
 * them (404). Create/update bodies that are not valid JSON are rejected here
 * as a ValidationError on "body".
 */
class Dispatcher {
public:
    explicit Dispatcher(handlers::ItemHandlers &handlers, std::string resource_root = "/items");

    handlers::Outcome dispatch(const Request &request) const;

    const std::string &resource_root() const { return root_; }

    // Methods accepted on `path`, empty when the path is not a known route
    std::vector<std::string> allowed_methods(const std::string &path) const;

private:
    struct PathMatch {
        bool collection = false;  // "/items"
        std::string id;           // Set for "/items/{id}"
    };

    std::optional<PathMatch> match_path(const std::string &path) const;

    handlers::ItemHandlers &handlers_;
    std::string root_;
};

}  // namespace http
}  // namespace itemvault
