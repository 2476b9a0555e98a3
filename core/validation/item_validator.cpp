#include "item_validator.hpp"

#include <algorithm>

namespace itemvault {
namespace validation {

namespace {

const char *json_type_name(const nlohmann::json &value) {
    if (value.is_null()) return "null";
    if (value.is_boolean()) return "boolean";
    if (value.is_number()) return "number";
    if (value.is_string()) return "string";
    if (value.is_array()) return "array";
    if (value.is_object()) return "object";
    return "unknown";
}

}  // namespace

const char *operation_to_string(Operation op) {
    switch (op) {
        case Operation::CREATE:
            return "create";
        case Operation::UPDATE:
            return "update";
        default:
            return "unknown";
    }
}

bool ValidationError::has_field(const std::string &field) const {
    return std::any_of(fields.begin(), fields.end(), [&field](const FieldError &e) { return e.field == field; });
}

ValidationResult validate_item_payload(const nlohmann::json &payload, Operation op) {
    ValidationError errors;

    if (!payload.is_object()) {
        errors.fields.push_back(
            {"body", std::string("must be a JSON object for ") + operation_to_string(op) + ", got " +
                         json_type_name(payload)});
        return errors;
    }

    model::ItemFields fields;

    auto name_it = payload.find("name");
    if (name_it == payload.end() || name_it->is_null()) {
        errors.fields.push_back({"name", "is required"});
    } else if (!name_it->is_string()) {
        errors.fields.push_back({"name", std::string("must be a string, got ") + json_type_name(*name_it)});
    } else if (name_it->get_ref<const std::string &>().empty()) {
        errors.fields.push_back({"name", "must not be empty"});
    } else {
        fields.name = name_it->get<std::string>();
    }

    auto desc_it = payload.find("description");
    if (desc_it != payload.end()) {
        if (!desc_it->is_string()) {
            errors.fields.push_back(
                {"description", std::string("must be a string, got ") + json_type_name(*desc_it)});
        } else {
            fields.description = desc_it->get<std::string>();
        }
    }

    if (!errors.fields.empty()) {
        return errors;
    }
    return fields;
}

}  // namespace validation
}  // namespace itemvault
