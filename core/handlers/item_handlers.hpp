#ifndef ITEMVAULT_HANDLERS_ITEM_HANDLERS_HPP
#define ITEMVAULT_HANDLERS_ITEM_HANDLERS_HPP

#include <string>

#include <nlohmann/json.hpp>

#include "outcome.hpp"
#include "store/i_item_store.hpp"
#include "util/clock.hpp"
#include "util/id_generator.hpp"

namespace itemvault {
namespace handlers {

/**
 * @brief CRUD operations on items
 *
 * Each call validates its input, talks to the injected store and returns an
 * Outcome. Holds only references to its collaborators, so one instance is
 * shared by every request thread.
 *
 * Failure mapping:
 * - invalid payload            -> ValidationError (no store call made)
 * - store NOT_FOUND            -> NotFoundError
 * - repeated create CONFLICT   -> InternalError (after one retry)
 * - other store CONFLICT       -> ConflictError
 * - store UNAVAILABLE          -> InternalError
 */
class ItemHandlers {
public:
    ItemHandlers(store::IItemStore &store, const util::IClock &clock, util::IIdGenerator &ids);

    // POST /items
    Outcome create(const nlohmann::json &payload);

    // GET /items/{id}
    Outcome get(const std::string &id);

    // GET /items
    Outcome list();

    // PUT /items/{id}
    Outcome update(const std::string &id, const nlohmann::json &payload);

    // DELETE /items/{id}
    Outcome remove(const std::string &id);

    // Create attempts made per request: the first try plus one retry on id collision
    static constexpr int kMaxCreateAttempts = 2;

private:
    Outcome store_failure(const char *operation, const std::string &id, store::StoreStatus status,
                          const std::string &message) const;

    store::IItemStore &store_;
    const util::IClock &clock_;
    util::IIdGenerator &ids_;
};

}  // namespace handlers
}  // namespace itemvault

#endif  // ITEMVAULT_HANDLERS_ITEM_HANDLERS_HPP
