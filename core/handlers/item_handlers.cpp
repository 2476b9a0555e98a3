#include "item_handlers.hpp"

#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace itemvault {
namespace handlers {

ItemHandlers::ItemHandlers(store::IItemStore &store, const util::IClock &clock, util::IIdGenerator &ids)
    : store_(store), clock_(clock), ids_(ids) {}

Outcome ItemHandlers::create(const nlohmann::json &payload) {
    auto validated = validation::validate_item_payload(payload, validation::Operation::CREATE);
    if (auto *errors = std::get_if<ValidationError>(&validated)) {
        LOG_DEBUG("[Handlers] Create rejected: " << errors->fields.size() << " invalid field(s)");
        return Outcome::fail(std::move(*errors));
    }
    const auto &fields = std::get<model::ItemFields>(validated);

    std::string last_id;
    for (int attempt = 1; attempt <= kMaxCreateAttempts; ++attempt) {
        model::Item item = model::make_item(ids_.next_id(), fields, clock_.now());
        last_id = item.id;

        auto result = store_.put(item.id, item, true);
        if (result.ok()) {
            LOG_DEBUG("[Handlers] Created item " << item.id);
            return Outcome::created(std::move(item));
        }

        if (result.status != store::StoreStatus::CONFLICT) {
            return store_failure("create", item.id, result.status, result.error_message);
        }

        LOG_WARN("[Handlers] Generated id collided (attempt " << attempt << "/" << kMaxCreateAttempts
                                                              << "): " << item.id);
    }

    std::string error_id = util::make_error_id();
    LOG_ERROR("[Handlers] Create failed [" << error_id << "]: id collision persisted after " << kMaxCreateAttempts
                                           << " attempts (last id " << last_id << ")");
    return Outcome::fail(
        InternalError{error_id, "create: id collision persisted after retry (last id " + last_id + ")"});
}

Outcome ItemHandlers::get(const std::string &id) {
    auto result = store_.get(id);
    if (!result.ok()) {
        return store_failure("get", id, result.status, result.error_message);
    }
    if (!result.item) {
        return store_failure("get", id, store::StoreStatus::UNAVAILABLE, "store returned OK without an item");
    }
    return Outcome::ok(std::move(*result.item));
}

Outcome ItemHandlers::list() {
    auto cursor = store_.scan_all();
    if (cursor.status() != store::StoreStatus::OK) {
        return store_failure("list", "", cursor.status(), cursor.error_message());
    }

    std::vector<model::Item> items;
    model::Item item;
    while (cursor.next(item)) {
        items.push_back(std::move(item));
    }
    return Outcome::ok(std::move(items));
}

Outcome ItemHandlers::update(const std::string &id, const nlohmann::json &payload) {
    auto validated = validation::validate_item_payload(payload, validation::Operation::UPDATE);
    if (auto *errors = std::get_if<ValidationError>(&validated)) {
        LOG_DEBUG("[Handlers] Update of " << id << " rejected: " << errors->fields.size() << " invalid field(s)");
        return Outcome::fail(std::move(*errors));
    }
    const auto &fields = std::get<model::ItemFields>(validated);

    auto current = store_.get(id);
    if (!current.ok()) {
        return store_failure("update", id, current.status, current.error_message);
    }
    if (!current.item) {
        return store_failure("update", id, store::StoreStatus::UNAVAILABLE, "store returned OK without an item");
    }

    model::Item updated = model::apply_update(*current.item, fields, clock_.now());

    // Last writer wins: a concurrent delete between get and replace surfaces as NotFound
    auto result = store_.replace(id, updated);
    if (!result.ok()) {
        return store_failure("update", id, result.status, result.error_message);
    }

    LOG_DEBUG("[Handlers] Updated item " << id);
    return Outcome::ok(std::move(updated));
}

Outcome ItemHandlers::remove(const std::string &id) {
    auto result = store_.remove(id);
    if (!result.ok()) {
        return store_failure("delete", id, result.status, result.error_message);
    }

    LOG_DEBUG("[Handlers] Deleted item " << id);
    return Outcome::no_content();
}

Outcome ItemHandlers::store_failure(const char *operation, const std::string &id, store::StoreStatus status,
                                    const std::string &message) const {
    if (status == store::StoreStatus::NOT_FOUND) {
        return Outcome::fail(NotFoundError{id});
    }

    std::string error_id = util::make_error_id();
    LOG_ERROR("[Handlers] Store failure during " << operation << (id.empty() ? "" : " of ") << id << " ["
                                                  << error_id << "]: " << store::store_status_to_string(status)
                                                  << " " << message);
    if (status == store::StoreStatus::CONFLICT) {
        return Outcome::fail(ConflictError{id, error_id, message});
    }
    return Outcome::fail(InternalError{error_id, std::string(operation) + ": " + message});
}

}  // namespace handlers
}  // namespace itemvault
