/**
 * @file test_header_schema.cpp
 * @brief Юнит-тесты схем заголовков LVM
 */

#include <doctest/doctest.h>
#include "model/header_schema.hpp"

using namespace lvmread::model;

TEST_CASE("Built-in schemas are consistent") {
    CHECK(checkSchemaConsistency(fileHeaderSchema()).empty());
    CHECK(checkSchemaConsistency(segmentHeaderSchema()).empty());
}

TEST_CASE("File header schema declares required fields") {
    const auto& schema = fileHeaderSchema();
    for (auto name : {fields::kDate, fields::kTime, fields::kWriterVersion}) {
        const auto* spec = findFieldSpec(schema, name);
        REQUIRE(spec != nullptr);
        CHECK(spec->required);
        CHECK_FALSE(spec->default_value.has_value());
    }
}

TEST_CASE("File header schema defaults") {
    const auto& schema = fileHeaderSchema();

    const auto* x_columns = findFieldSpec(schema, fields::kXColumns);
    REQUIRE(x_columns != nullptr);
    CHECK(x_columns->type == FieldType::Options);
    CHECK(std::get<std::string>(*x_columns->default_value) == "One");
    CHECK(x_columns->options.size() == 3);

    const auto* multi = findFieldSpec(schema, fields::kMultiHeadings);
    REQUIRE(multi != nullptr);
    CHECK(multi->type == FieldType::Bool);
    CHECK_FALSE(std::get<bool>(*multi->default_value));

    const auto* reader = findFieldSpec(schema, fields::kReaderVersion);
    REQUIRE(reader != nullptr);
    CHECK_FALSE(reader->required);
    CHECK_FALSE(reader->default_value.has_value());
}

TEST_CASE("Segment header schema declares per-channel numeric fields") {
    const auto& schema = segmentHeaderSchema();

    const auto* channels = findFieldSpec(schema, fields::kChannels);
    REQUIRE(channels != nullptr);
    CHECK(channels->type == FieldType::Integer);
    CHECK(channels->required);

    const auto* x0 = findFieldSpec(schema, fields::kX0);
    REQUIRE(x0 != nullptr);
    CHECK(x0->type == FieldType::Number);

    const auto* y_dimension = findFieldSpec(schema, fields::kYDimension);
    REQUIRE(y_dimension != nullptr);
    CHECK(std::get<std::string>(*y_dimension->default_value) == "Electric Potential");

    CHECK(findFieldSpec(schema, "Writer_Version") == nullptr);
}

TEST_CASE("Consistency check reports broken tables") {
    HeaderSchema schema;

    FieldSpec required_with_default;
    required_with_default.type = FieldType::Integer;
    required_with_default.required = true;
    required_with_default.default_value = FieldValue{std::int64_t{1}};
    schema.emplace("A", required_with_default);

    FieldSpec wrong_type;
    wrong_type.type = FieldType::Date;
    wrong_type.default_value = FieldValue{std::string{"today"}};
    schema.emplace("B", wrong_type);

    FieldSpec bad_option;
    bad_option.type = FieldType::Options;
    bad_option.default_value = FieldValue{std::string{"Maybe"}};
    bad_option.options = {"Yes", "No"};
    schema.emplace("C", bad_option);

    FieldSpec no_options;
    no_options.type = FieldType::Options;
    schema.emplace("D", no_options);

    CHECK(checkSchemaConsistency(schema).size() == 4);
}
