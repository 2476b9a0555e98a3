#ifndef ITEMVAULT_MODEL_ITEM_HPP
#define ITEMVAULT_MODEL_ITEM_HPP

#include <chrono>
#include <optional>
#include <string>

namespace itemvault {
namespace model {

// UTC wall-clock time. Items only ever hold millisecond-truncated values so a
// stored item compares equal to its JSON round-trip.
using Timestamp = std::chrono::system_clock::time_point;

// Client-controlled part of an item, produced by the validator
struct ItemFields {
    std::string name;
    std::string description;
};

struct Item {
    std::string id;           // Server-generated, immutable, store key
    std::string name;         // Non-empty
    std::string description;  // Defaults to ""
    Timestamp created_at;     // Set once at creation
    Timestamp updated_at;     // Refreshed on every update, never < created_at

    bool operator==(const Item &other) const {
        return id == other.id && name == other.name && description == other.description &&
               created_at == other.created_at && updated_at == other.updated_at;
    }
    bool operator!=(const Item &other) const { return !(*this == other); }
};

// Build a fresh item; both timestamps are `now` truncated to milliseconds
Item make_item(const std::string &id, const ItemFields &fields, Timestamp now);

// Apply an update to `current`: id and created_at are kept, fields replaced,
// updated_at = max(now, current.updated_at)
Item apply_update(const Item &current, const ItemFields &fields, Timestamp now);

// Checks the entity invariants (non-empty id and name, created_at <= updated_at)
bool check_invariants(const Item &item, std::string &error);

Timestamp truncate_to_millis(Timestamp ts);

// ISO-8601 UTC with milliseconds: 2024-05-01T12:30:45.123Z
std::string format_timestamp(Timestamp ts);

// Inverse of format_timestamp. Accepts only that exact form.
std::optional<Timestamp> parse_timestamp(const std::string &text);

}  // namespace model
}  // namespace itemvault

#endif  // ITEMVAULT_MODEL_ITEM_HPP
