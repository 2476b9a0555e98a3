#ifndef ITEMVAULT_HANDLERS_OUTCOME_HPP
#define ITEMVAULT_HANDLERS_OUTCOME_HPP

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "model/item.hpp"
#include "validation/item_validator.hpp"

namespace itemvault {
namespace handlers {

using validation::FieldError;
using validation::ValidationError;

// Referenced id is absent from the store
struct NotFoundError {
    std::string id;
};

// Store refused a write because the key already exists. Reported to clients
// as an internal error tagged with error_id; detail is for logs only.
struct ConflictError {
    std::string id;
    std::string error_id;
    std::string detail;
};

// No handler for (method, path). allowed_methods is non-empty when the path
// is known and only the method is wrong.
struct RouteError {
    std::string method;
    std::string path;
    std::vector<std::string> allowed_methods;

    bool method_mismatch() const { return !allowed_methods.empty(); }
};

// Store unavailable or otherwise unexpected. Clients only ever see error_id;
// the same id is logged next to detail.
struct InternalError {
    std::string error_id;
    std::string detail;
};

using Failure = std::variant<ValidationError, NotFoundError, ConflictError, RouteError, InternalError>;

enum class SuccessKind {
    CREATED,    // 201, body is the item
    OK,         // 200, body is an item or a list
    NO_CONTENT  // 204, no body
};

struct Success {
    SuccessKind kind = SuccessKind::OK;
    std::variant<std::monostate, model::Item, std::vector<model::Item>> body;
};

/**
 * @brief Result of one routed request
 *
 * Either a Success or exactly one Failure kind. Produced by the dispatcher and
 * handlers, consumed by the response formatter.
 */
class Outcome {
public:
    static Outcome created(model::Item item) { return Outcome(Success{SuccessKind::CREATED, std::move(item)}); }
    static Outcome ok(model::Item item) { return Outcome(Success{SuccessKind::OK, std::move(item)}); }
    static Outcome ok(std::vector<model::Item> items) { return Outcome(Success{SuccessKind::OK, std::move(items)}); }
    static Outcome no_content() { return Outcome(Success{SuccessKind::NO_CONTENT, std::monostate{}}); }
    static Outcome fail(Failure failure) { return Outcome(std::move(failure)); }

    bool is_success() const { return std::holds_alternative<Success>(value_); }
    const Success &success() const { return std::get<Success>(value_); }
    const Failure &failure() const { return std::get<Failure>(value_); }

    // Typed access to a failure kind; nullptr when the outcome is something else
    template <typename E>
    const E *failure_as() const {
        if (is_success()) {
            return nullptr;
        }
        return std::get_if<E>(&failure());
    }

    // Item payload of a successful get/create/update, nullptr otherwise
    const model::Item *item() const {
        if (!is_success()) {
            return nullptr;
        }
        return std::get_if<model::Item>(&success().body);
    }

    const std::vector<model::Item> *items() const {
        if (!is_success()) {
            return nullptr;
        }
        return std::get_if<std::vector<model::Item>>(&success().body);
    }

private:
    explicit Outcome(Success success) : value_(std::move(success)) {}
    explicit Outcome(Failure failure) : value_(std::move(failure)) {}

    std::variant<Success, Failure> value_;
};

}  // namespace handlers
}  // namespace itemvault

#endif  // ITEMVAULT_HANDLERS_OUTCOME_HPP
