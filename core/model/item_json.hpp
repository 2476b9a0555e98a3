#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "item.hpp"

namespace itemvault {
namespace model {

/**
 * @brief JSON encoding for items
 *
 * Wire shape (camelCase, timestamps as ISO-8601 UTC strings):
 *   { "id", "name", "description", "createdAt", "updatedAt" }
 */
nlohmann::json encode_item(const Item &item);
nlohmann::json encode_items(const std::vector<Item> &items);

// Strict decode of a stored item (all five fields required, invariants checked)
bool decode_item(const nlohmann::json &json, Item &item, std::string &error);

}  // namespace model
}  // namespace itemvault
