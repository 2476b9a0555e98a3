#ifndef ITEMVAULT_VALIDATION_ITEM_VALIDATOR_HPP
#define ITEMVAULT_VALIDATION_ITEM_VALIDATOR_HPP

#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/item.hpp"

namespace itemvault {
namespace validation {

enum class Operation { CREATE, UPDATE };

const char *operation_to_string(Operation op);

struct FieldError {
    std::string field;
    std::string reason;

    bool operator==(const FieldError &other) const { return field == other.field && reason == other.reason; }
};

// Every violated field of one payload, in field order (name, description)
struct ValidationError {
    std::vector<FieldError> fields;

    bool has_field(const std::string &field) const;
};

using ValidationResult = std::variant<model::ItemFields, ValidationError>;

/**
 * @brief Validate and normalize a create/update payload
 *
 * Rules (identical for CREATE and UPDATE):
 * - payload must be a JSON object
 * - "name" is required and must be a non-empty string
 * - "description" is optional; when present it must be a string (null is
 *   rejected). Absent normalizes to "".
 * - Every other key ("id", "createdAt", unknown keys) is ignored. For UPDATE
 *   the id always comes from the request path.
 *
 * Pure: no I/O, same input gives the same result.
 */
ValidationResult validate_item_payload(const nlohmann::json &payload, Operation op);

// Convenience accessors for the tagged result
inline bool is_valid(const ValidationResult &result) { return std::holds_alternative<model::ItemFields>(result); }

}  // namespace validation
}  // namespace itemvault

#endif  // ITEMVAULT_VALIDATION_ITEM_VALIDATOR_HPP
