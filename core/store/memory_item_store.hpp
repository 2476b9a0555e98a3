#ifndef ITEMVAULT_STORE_MEMORY_ITEM_STORE_HPP
#define ITEMVAULT_STORE_MEMORY_ITEM_STORE_HPP

#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "i_item_store.hpp"

namespace itemvault {
namespace store {

/**
 * @brief In-memory item table
 *
 * Thread Safety:
 * - get() and scan_all() take a shared_lock (concurrent reads safe)
 * - put(), replace(), remove() take a unique_lock
 * - Returns by value so callers never hold references into the table
 *
 * Subclasses that persist the table override persist_locked(), which runs
 * under the unique lock after each mutation. A false return rolls the
 * mutation back and the caller sees UNAVAILABLE.
 */
class MemoryItemStore : public IItemStore {
public:
    explicit MemoryItemStore(std::string table = "items");
    ~MemoryItemStore() override = default;

    // Non-copyable, non-movable (manages mutex)
    MemoryItemStore(const MemoryItemStore &) = delete;
    MemoryItemStore &operator=(const MemoryItemStore &) = delete;

    StoreResult put(const std::string &id, const model::Item &item, bool if_not_exists) override;
    StoreGetResult get(const std::string &id) const override;
    StoreResult replace(const std::string &id, const model::Item &item) override;
    StoreResult remove(const std::string &id) override;
    ItemCursor scan_all() const override;
    std::string describe() const override;

    size_t size() const;
    const std::string &table() const { return table_; }

protected:
    using Table = std::unordered_map<std::string, model::Item>;

    virtual bool persist_locked(const Table &items, std::string &error);

    std::string table_;
    Table items_;
    mutable std::shared_mutex mutex_;

private:
    StoreResult persist_or_rollback(const std::string &id, const model::Item *previous);
};

}  // namespace store
}  // namespace itemvault

#endif  // ITEMVAULT_STORE_MEMORY_ITEM_STORE_HPP
