#include "validation/item_validator.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace itemvault;
using namespace itemvault::validation;
using json = nlohmann::json;

namespace {

const ValidationError &errors_of(const ValidationResult &result) { return std::get<ValidationError>(result); }
const model::ItemFields &fields_of(const ValidationResult &result) { return std::get<model::ItemFields>(result); }

}  // namespace

class ItemValidatorTest : public ::testing::TestWithParam<Operation> {};

TEST_P(ItemValidatorTest, AcceptsNameOnlyAndDefaultsDescription) {
    auto result = validate_item_payload(json{{"name", "Widget"}}, GetParam());

    ASSERT_TRUE(is_valid(result));
    EXPECT_EQ(fields_of(result).name, "Widget");
    EXPECT_EQ(fields_of(result).description, "");
}

TEST_P(ItemValidatorTest, AcceptsNameAndDescription) {
    auto result = validate_item_payload(json{{"name", "Widget"}, {"description", "A blue widget"}}, GetParam());

    ASSERT_TRUE(is_valid(result));
    EXPECT_EQ(fields_of(result).description, "A blue widget");
}

TEST_P(ItemValidatorTest, NullDescriptionRejected) {
    auto result = validate_item_payload(json{{"name", "Widget"}, {"description", nullptr}}, GetParam());

    ASSERT_FALSE(is_valid(result));
    const auto &errors = errors_of(result);
    ASSERT_EQ(errors.fields.size(), 1u);
    EXPECT_EQ(errors.fields[0].field, "description");
    EXPECT_EQ(errors.fields[0].reason, "must be a string, got null");
}

TEST_P(ItemValidatorTest, MissingNameIsNamed) {
    auto result = validate_item_payload(json{{"description", "x"}}, GetParam());

    ASSERT_FALSE(is_valid(result));
    const auto &errors = errors_of(result);
    ASSERT_EQ(errors.fields.size(), 1u);
    EXPECT_EQ(errors.fields[0].field, "name");
    EXPECT_EQ(errors.fields[0].reason, "is required");
}

TEST_P(ItemValidatorTest, EmptyNameRejected) {
    auto result = validate_item_payload(json{{"name", ""}}, GetParam());

    ASSERT_FALSE(is_valid(result));
    EXPECT_TRUE(errors_of(result).has_field("name"));
}

TEST_P(ItemValidatorTest, NonStringNameRejected) {
    for (const json &bad : {json(42), json(true), json::array({"a"}), json::object()}) {
        auto result = validate_item_payload(json{{"name", bad}}, GetParam());
        ASSERT_FALSE(is_valid(result)) << bad.dump();
        EXPECT_TRUE(errors_of(result).has_field("name"));
    }
}

TEST_P(ItemValidatorTest, ReportsEveryViolatedField) {
    auto result = validate_item_payload(json{{"name", 7}, {"description", 3.5}}, GetParam());

    ASSERT_FALSE(is_valid(result));
    const auto &errors = errors_of(result);
    ASSERT_EQ(errors.fields.size(), 2u);
    EXPECT_EQ(errors.fields[0].field, "name");
    EXPECT_EQ(errors.fields[1].field, "description");
    EXPECT_EQ(errors.fields[1].reason, "must be a string, got number");
}

TEST_P(ItemValidatorTest, UnknownAndServerOwnedFieldsIgnored) {
    json payload = {{"name", "Widget"},
                    {"id", "client-chosen"},
                    {"createdAt", "1999-01-01T00:00:00.000Z"},
                    {"color", "blue"},
                    {"tags", {"a", "b"}}};
    auto result = validate_item_payload(payload, GetParam());

    ASSERT_TRUE(is_valid(result));
    EXPECT_EQ(fields_of(result).name, "Widget");
}

TEST_P(ItemValidatorTest, NonObjectPayloadRejected) {
    for (const json &bad : {json::array(), json("Widget"), json(nullptr), json(1)}) {
        auto result = validate_item_payload(bad, GetParam());
        ASSERT_FALSE(is_valid(result)) << bad.dump();
        EXPECT_TRUE(errors_of(result).has_field("body"));
    }
}

TEST_P(ItemValidatorTest, Deterministic) {
    json payload = {{"name", 1}, {"description", false}};
    auto first = validate_item_payload(payload, GetParam());
    auto second = validate_item_payload(payload, GetParam());
    EXPECT_EQ(errors_of(first).fields, errors_of(second).fields);
}

INSTANTIATE_TEST_SUITE_P(CreateAndUpdate, ItemValidatorTest, ::testing::Values(Operation::CREATE, Operation::UPDATE),
                         [](const ::testing::TestParamInfo<Operation> &info) {
                             return std::string(operation_to_string(info.param));
                         });
