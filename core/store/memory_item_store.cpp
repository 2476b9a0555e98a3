#include "memory_item_store.hpp"

#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace itemvault {
namespace store {

MemoryItemStore::MemoryItemStore(std::string table) : table_(std::move(table)) {}

StoreResult MemoryItemStore::put(const std::string &id, const model::Item &item, bool if_not_exists) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it != items_.end() && if_not_exists) {
        return StoreResult::failure(StoreStatus::CONFLICT, "Item already exists: " + id);
    }

    std::optional<model::Item> previous;
    if (it != items_.end()) {
        previous = it->second;
        it->second = item;
    } else {
        items_.emplace(id, item);
    }

    return persist_or_rollback(id, previous ? &*previous : nullptr);
}

StoreGetResult MemoryItemStore::get(const std::string &id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    StoreGetResult result;
    auto it = items_.find(id);
    if (it == items_.end()) {
        result.status = StoreStatus::NOT_FOUND;
        result.error_message = "Item not found: " + id;
        return result;
    }
    result.item = it->second;
    return result;
}

StoreResult MemoryItemStore::replace(const std::string &id, const model::Item &item) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return StoreResult::failure(StoreStatus::NOT_FOUND, "Item not found: " + id);
    }

    model::Item previous = it->second;
    it->second = item;
    return persist_or_rollback(id, &previous);
}

StoreResult MemoryItemStore::remove(const std::string &id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = items_.find(id);
    if (it == items_.end()) {
        return StoreResult::failure(StoreStatus::NOT_FOUND, "Item not found: " + id);
    }

    model::Item previous = std::move(it->second);
    items_.erase(it);

    std::string error;
    if (!persist_locked(items_, error)) {
        items_.emplace(id, std::move(previous));
        LOG_ERROR("[Store] Delete of " << id << " rolled back: " << error);
        return StoreResult::failure(StoreStatus::UNAVAILABLE, error);
    }
    return StoreResult::success();
}

ItemCursor MemoryItemStore::scan_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<model::Item> snapshot;
    snapshot.reserve(items_.size());
    for (const auto &entry : items_) {
        snapshot.push_back(entry.second);
    }
    return ItemCursor(std::move(snapshot));
}

std::string MemoryItemStore::describe() const { return "memory:" + table_; }

size_t MemoryItemStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return items_.size();
}

bool MemoryItemStore::persist_locked(const Table &, std::string &) { return true; }

StoreResult MemoryItemStore::persist_or_rollback(const std::string &id, const model::Item *previous) {
    std::string error;
    if (persist_locked(items_, error)) {
        return StoreResult::success();
    }

    if (previous != nullptr) {
        items_[id] = *previous;
    } else {
        items_.erase(id);
    }
    LOG_ERROR("[Store] Write of " << id << " rolled back: " << error);
    return StoreResult::failure(StoreStatus::UNAVAILABLE, error);
}

}  // namespace store
}  // namespace itemvault
