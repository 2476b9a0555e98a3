#ifndef ITEMVAULT_STORE_FILE_ITEM_STORE_HPP
#define ITEMVAULT_STORE_FILE_ITEM_STORE_HPP

#include <filesystem>
#include <string>

#include "memory_item_store.hpp"

namespace itemvault {
namespace store {

/**
 * @brief Item table persisted as a JSON document
 *
 * The table lives in memory (see MemoryItemStore) and is mirrored to
 * `<data_dir>/<table>.json`. Every successful mutation rewrites the whole
 * file via a temporary sibling and a rename, so a failed write leaves the
 * previous file in place. The file is not fsynced; durability across power
 * loss is up to the filesystem.
 *
 * File layout:
 *   { "table": "<table>", "items": [ <item>, ... ] }
 *
 * Lifecycle:
 * - open() creates data_dir if needed and loads an existing file
 * - A missing file is an empty table; a corrupt file fails open()
 */
class FileItemStore : public MemoryItemStore {
public:
    FileItemStore(std::filesystem::path data_dir, std::string table);

    bool open(std::string &error);

    std::string describe() const override;
    const std::filesystem::path &file_path() const { return file_path_; }

protected:
    bool persist_locked(const Table &items, std::string &error) override;

private:
    std::filesystem::path data_dir_;
    std::filesystem::path file_path_;
};

}  // namespace store
}  // namespace itemvault

#endif  // ITEMVAULT_STORE_FILE_ITEM_STORE_HPP
