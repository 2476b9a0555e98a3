#include "item_json.hpp"

namespace itemvault {
namespace model {

namespace {

bool read_string_field(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end()) {
        error = std::string("missing field '") + key + "'";
        return false;
    }
    if (!it->is_string()) {
        error = std::string("field '") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool read_timestamp_field(const nlohmann::json &json, const char *key, Timestamp &out, std::string &error) {
    std::string text;
    if (!read_string_field(json, key, text, error)) {
        return false;
    }
    auto parsed = parse_timestamp(text);
    if (!parsed) {
        error = std::string("field '") + key + "' is not an ISO-8601 timestamp: " + text;
        return false;
    }
    out = *parsed;
    return true;
}

}  // namespace

nlohmann::json encode_item(const Item &item) {
    return {{"id", item.id},
            {"name", item.name},
            {"description", item.description},
            {"createdAt", format_timestamp(item.created_at)},
            {"updatedAt", format_timestamp(item.updated_at)}};
}

nlohmann::json encode_items(const std::vector<Item> &items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &item : items) {
        array.push_back(encode_item(item));
    }
    return array;
}

bool decode_item(const nlohmann::json &json, Item &item, std::string &error) {
    if (!json.is_object()) {
        error = "item must be a JSON object";
        return false;
    }

    Item decoded;
    if (!read_string_field(json, "id", decoded.id, error) || !read_string_field(json, "name", decoded.name, error) ||
        !read_string_field(json, "description", decoded.description, error) ||
        !read_timestamp_field(json, "createdAt", decoded.created_at, error) ||
        !read_timestamp_field(json, "updatedAt", decoded.updated_at, error)) {
        return false;
    }

    if (!check_invariants(decoded, error)) {
        return false;
    }

    item = std::move(decoded);
    return true;
}

}  // namespace model
}  // namespace itemvault
