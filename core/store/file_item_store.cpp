#include "file_item_store.hpp"

#include <fstream>
#include <mutex>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

#include "logging/logger.hpp"
#include "model/item_json.hpp"

namespace itemvault {
namespace store {

namespace fs = std::filesystem;

FileItemStore::FileItemStore(fs::path data_dir, std::string table)
    : MemoryItemStore(table), data_dir_(std::move(data_dir)), file_path_(data_dir_ / (table + ".json")) {}

bool FileItemStore::open(std::string &error) {
    std::error_code ec;
    fs::create_directories(data_dir_, ec);
    if (ec) {
        error = "Cannot create data directory " + data_dir_.string() + ": " + ec.message();
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    items_.clear();

    const bool present = fs::exists(file_path_, ec);
    if (ec) {
        error = "Cannot check table file " + file_path_.string() + ": " + ec.message();
        return false;
    }
    if (!present) {
        LOG_INFO("[Store] No table file at " << file_path_.string() << ", starting empty");
        return true;
    }

    std::ifstream in(file_path_);
    if (!in) {
        error = "Cannot open table file: " + file_path_.string();
        return false;
    }

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception &e) {
        error = "Corrupt table file " + file_path_.string() + ": " + e.what();
        return false;
    }

    if (!doc.is_object() || !doc.contains("items") || !doc["items"].is_array()) {
        error = "Corrupt table file " + file_path_.string() + ": expected an object with an 'items' array";
        return false;
    }

    if (doc.contains("table") && doc["table"].is_string() && doc["table"].get<std::string>() != table_) {
        LOG_WARN("[Store] Table file " << file_path_.string() << " was written for table '"
                                       << doc["table"].get<std::string>() << "'");
    }

    size_t index = 0;
    for (const auto &entry : doc["items"]) {
        model::Item item;
        std::string item_error;
        if (!model::decode_item(entry, item, item_error)) {
            error = "Corrupt item #" + std::to_string(index) + " in " + file_path_.string() + ": " + item_error;
            items_.clear();
            return false;
        }
        if (items_.count(item.id) != 0) {
            error = "Duplicate item id '" + item.id + "' in " + file_path_.string();
            items_.clear();
            return false;
        }
        std::string id = item.id;
        items_.emplace(std::move(id), std::move(item));
        ++index;
    }

    LOG_INFO("[Store] Loaded " << items_.size() << " item(s) from " << file_path_.string());
    return true;
}

std::string FileItemStore::describe() const { return "file:" + file_path_.string(); }

bool FileItemStore::persist_locked(const Table &items, std::string &error) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &entry : items) {
        array.push_back(model::encode_item(entry.second));
    }
    nlohmann::json doc = {{"table", table_}, {"items", array}};

    fs::path tmp_path = file_path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            error = "Cannot write " + tmp_path.string();
            return false;
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out) {
            error = "Write failed for " + tmp_path.string();
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, file_path_, ec);
    if (ec) {
        error = "Cannot replace " + file_path_.string() + ": " + ec.message();
        fs::remove(tmp_path, ec);
        return false;
    }
    return true;
}

}  // namespace store
}  // namespace itemvault
