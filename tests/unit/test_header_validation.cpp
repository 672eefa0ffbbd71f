/**
 * @file test_header_validation.cpp
 * @brief Юнит-тесты проверки заголовков по схеме
 */

#include <doctest/doctest.h>
#include "model/validation.hpp"

using namespace lvmread::model;

namespace {

HeaderSchema sampleSchema() {
    HeaderSchema schema;

    FieldSpec count;
    count.type = FieldType::Integer;
    count.required = true;
    schema.emplace("Count", count);

    FieldSpec mode;
    mode.type = FieldType::Options;
    mode.default_value = FieldValue{std::string{"Fast"}};
    mode.options = {"Fast", "Slow"};
    schema.emplace("Mode", mode);

    FieldSpec note;
    note.type = FieldType::Text;
    note.default_value = FieldValue{std::string{}};
    schema.emplace("Note", note);

    return schema;
}

} // namespace

TEST_CASE("Complete header passes validation") {
    HeaderFields values;
    values.emplace("Count", HeaderValue{FieldValue{std::int64_t{3}}});
    values.emplace("Mode", HeaderValue{FieldValue{std::string{"Slow"}}});

    auto result = validateHeader(values, sampleSchema());
    CHECK(result.is_valid);
    CHECK_FALSE(result.hasErrors());
}

TEST_CASE("Missing required field is reported") {
    HeaderFields values;
    values.emplace("Mode", HeaderValue{FieldValue{std::string{"Fast"}}});

    auto result = validateHeader(values, sampleSchema());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].type == ValidationErrorType::MissingRequiredField);
    CHECK(result.errors[0].field == "Count");
}

TEST_CASE("Option outside the allowed list is reported") {
    HeaderFields values;
    values.emplace("Count", HeaderValue{FieldValue{std::int64_t{3}}});
    values.emplace("Mode", HeaderValue{FieldValue{std::string{"Medium"}}});

    auto result = validateHeader(values, sampleSchema());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].type == ValidationErrorType::InvalidOption);
    CHECK(result.errors[0].value == "Medium");
}

TEST_CASE("Per-channel options are checked element by element") {
    HeaderFields values;
    values.emplace("Count", HeaderValue{FieldValue{std::int64_t{2}}});
    values.emplace("Mode", HeaderValue::perChannel({
        FieldValue{std::string{"Fast"}},
        FieldValue{std::string{"Never"}}
    }));

    auto result = validateHeader(values, sampleSchema());
    REQUIRE(result.errors.size() == 1);
    CHECK(result.errors[0].value == "Never");
}

TEST_CASE("Validation collects every error") {
    HeaderFields values;
    values.emplace("Mode", HeaderValue{FieldValue{std::string{"Medium"}}});

    auto result = validateHeader(values, sampleSchema());
    CHECK_FALSE(result.is_valid);
    CHECK(result.errors.size() == 2);
}
