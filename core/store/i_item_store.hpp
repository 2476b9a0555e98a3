#ifndef ITEMVAULT_STORE_I_ITEM_STORE_HPP
#define ITEMVAULT_STORE_I_ITEM_STORE_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "model/item.hpp"

namespace itemvault {
namespace store {

enum class StoreStatus {
    OK,
    NOT_FOUND,    // Key absent (get / replace / remove)
    CONFLICT,     // Key present on a conditional put
    UNAVAILABLE   // Backend failure; message carries the detail
};

const char *store_status_to_string(StoreStatus status);

// Result of a write operation
struct StoreResult {
    StoreStatus status = StoreStatus::OK;
    std::string error_message;

    bool ok() const { return status == StoreStatus::OK; }

    static StoreResult success() { return {}; }
    static StoreResult failure(StoreStatus status, std::string message) { return {status, std::move(message)}; }
};

// Result of a point read
struct StoreGetResult {
    StoreStatus status = StoreStatus::OK;
    std::optional<model::Item> item;  // Set only when status == OK
    std::string error_message;

    bool ok() const { return status == StoreStatus::OK; }
};

/**
 * @brief Single-pass sequence of items returned by a full scan
 *
 * Finite and not restartable: next() hands out each item once and then
 * keeps returning false.
 */
class ItemCursor {
public:
    ItemCursor() = default;
    explicit ItemCursor(std::vector<model::Item> items) : items_(std::move(items)) {}

    ItemCursor(const ItemCursor &) = delete;
    ItemCursor &operator=(const ItemCursor &) = delete;
    ItemCursor(ItemCursor &&) = default;
    ItemCursor &operator=(ItemCursor &&) = default;

    bool next(model::Item &out) {
        if (pos_ >= items_.size()) {
            return false;
        }
        out = std::move(items_[pos_++]);
        return true;
    }

    // Backend failure while producing the scan (cursor is then empty)
    StoreStatus status() const { return status_; }
    const std::string &error_message() const { return error_; }

    static ItemCursor failed(StoreStatus status, std::string message) {
        ItemCursor cursor;
        cursor.status_ = status;
        cursor.error_ = std::move(message);
        return cursor;
    }

private:
    std::vector<model::Item> items_;
    size_t pos_ = 0;
    StoreStatus status_ = StoreStatus::OK;
    std::string error_;
};

/**
 * @brief Key-value capability the item handlers consume
 *
 * Every operation is atomic per key. Implementations own their locking and
 * never throw across this interface; backend failures are reported as
 * StoreStatus::UNAVAILABLE.
 */
class IItemStore {
public:
    virtual ~IItemStore() = default;

    // Write an item. With if_not_exists, fails with CONFLICT when the id is present.
    virtual StoreResult put(const std::string &id, const model::Item &item, bool if_not_exists) = 0;

    virtual StoreGetResult get(const std::string &id) const = 0;

    // Overwrite an existing item; NOT_FOUND when absent
    virtual StoreResult replace(const std::string &id, const model::Item &item) = 0;

    // Delete an existing item; NOT_FOUND when absent
    virtual StoreResult remove(const std::string &id) = 0;

    // All items, unspecified order
    virtual ItemCursor scan_all() const = 0;

    // Human-readable backend/table identity for logs
    virtual std::string describe() const = 0;
};

}  // namespace store
}  // namespace itemvault

#endif  // ITEMVAULT_STORE_I_ITEM_STORE_HPP
