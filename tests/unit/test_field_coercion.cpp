/**
 * @file test_field_coercion.cpp
 * @brief Юнит-тесты преобразования полей LVM
 */

#include <doctest/doctest.h>
#include "io/field_coercion.hpp"
#include "io/lvm_error.hpp"
#include <cmath>

using namespace lvmread::io;
using namespace lvmread::model;

TEST_CASE("Number narrows integral values to integer") {
    auto value = coerceField("3.0", FieldType::Number, '\t', '.');
    REQUIRE(value.has_value());
    REQUIRE(std::holds_alternative<std::int64_t>(*value));
    CHECK(std::get<std::int64_t>(*value) == 3);

    auto fractional = coerceField("2.5", FieldType::Number, '\t', '.');
    REQUIRE(fractional.has_value());
    REQUIRE(std::holds_alternative<double>(*fractional));
    CHECK(std::get<double>(*fractional) == doctest::Approx(2.5));
}

TEST_CASE("Number honours the file decimal separator") {
    auto value = coerceField("0,25", FieldType::Number, '\t', ',');
    REQUIRE(value.has_value());
    CHECK(std::get<double>(*value) == doctest::Approx(0.25));

    auto exponent = coerceField("1,0000000000000000E-3", FieldType::Number, '\t', ',');
    REQUIRE(exponent.has_value());
    CHECK(std::get<double>(*exponent) == doctest::Approx(0.001));
}

TEST_CASE("Empty and non-numeric tokens are absent, not errors") {
    CHECK_FALSE(coerceField("", FieldType::Number, '\t', '.').has_value());
    CHECK_FALSE(coerceField("abc", FieldType::Float, '\t', '.').has_value());
    CHECK_FALSE(coerceField("1.5", FieldType::Integer, '\t', '.').has_value());
    CHECK_FALSE(coerceField("12x", FieldType::Integer, '\t', '.').has_value());
}

TEST_CASE("Float keeps integral values as floating point") {
    auto value = coerceField("2", FieldType::Float, '\t', '.');
    REQUIRE(value.has_value());
    REQUIRE(std::holds_alternative<double>(*value));
    CHECK(std::get<double>(*value) == doctest::Approx(2.0));
}

TEST_CASE("Integer parses decimal text") {
    auto value = coerceField("-42", FieldType::Integer, '\t', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<std::int64_t>(*value) == -42);
}

TEST_CASE("Text unescapes the delimiter in both hex cases") {
    auto value = coerceField("a\\2Cb\\2cc", FieldType::Text, ',', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<std::string>(*value) == "a,b,c");

    auto tab = coerceField("x\\09y", FieldType::Text, '\t', '.');
    REQUIRE(tab.has_value());
    CHECK(std::get<std::string>(*tab) == "x\ty");
}

TEST_CASE("Options are kept verbatim for validation") {
    auto value = coerceField("Sideways", FieldType::Options, '\t', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<std::string>(*value) == "Sideways");
}

TEST_CASE("Date parses YYYY/MM/DD") {
    auto value = coerceField("2013/02/01", FieldType::Date, '\t', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<Date>(*value) == Date{2013, 2, 1});

    CHECK(parseLvmDate("2024/2/29") == Date{2024, 2, 29});
}

TEST_CASE("Invalid dates fail coercion") {
    CHECK_THROWS_AS((void)parseLvmDate("2013-02-01"), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmDate("2013/13/01"), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmDate("2023/02/29"), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmDate("13/02/01"), LvmFormatError);

    try {
        (void)coerceField("yesterday", FieldType::Date, '\t', '.');
        FAIL("exception expected");
    } catch (const LvmFormatError& e) {
        CHECK(e.kind() == LvmErrorKind::FieldCoercionFailure);
    }
}

TEST_CASE("Time truncates the fraction to microseconds") {
    auto value = coerceField("15:40:17.4968891143798828125", FieldType::Time, '\t', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<TimeOfDay>(*value) == TimeOfDay{15, 40, 17, 496889});
}

TEST_CASE("Time pads a short fraction and uses the decimal separator") {
    CHECK(parseLvmTime("08:05:09,5", ',') == TimeOfDay{8, 5, 9, 500000});
    CHECK(parseLvmTime("23:59:59", '.') == TimeOfDay{23, 59, 59, 0});
}

TEST_CASE("Time accepts leap seconds") {
    CHECK(parseLvmTime("23:59:60", '.') == TimeOfDay{23, 59, 60, 0});
    CHECK(parseLvmTime("23:59:61.5", '.') == TimeOfDay{23, 59, 61, 500000});
    CHECK_THROWS_AS((void)parseLvmTime("23:59:62", '.'), LvmFormatError);
}

TEST_CASE("Invalid times fail coercion") {
    CHECK_THROWS_AS((void)parseLvmTime("24:00:00", '.'), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmTime("12:60:00", '.'), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmTime("12:00", '.'), LvmFormatError);
    CHECK_THROWS_AS((void)parseLvmTime("12:00:00.5x", '.'), LvmFormatError);
}

TEST_CASE("Bool accepts only Yes and No") {
    auto yes = coerceField("Yes", FieldType::Bool, '\t', '.');
    auto no = coerceField("No", FieldType::Bool, '\t', '.');
    REQUIRE(yes.has_value());
    REQUIRE(no.has_value());
    CHECK(std::get<bool>(*yes));
    CHECK_FALSE(std::get<bool>(*no));

    CHECK_THROWS_AS((void)coerceField("yes", FieldType::Bool, '\t', '.'), LvmFormatError);
}

TEST_CASE("None type always yields an empty string") {
    auto value = coerceField("anything", FieldType::None, '\t', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<std::string>(*value).empty());
}

TEST_CASE("parseLvmFloat rejects trailing garbage") {
    CHECK(parseLvmFloat(" 1.5", '.').value_or(0.0) == doctest::Approx(1.5));
    CHECK_FALSE(parseLvmFloat("1.5abc", '.').has_value());
    CHECK_FALSE(parseLvmFloat("   ", '.').has_value());
}

TEST_CASE("formatFieldValue renders every alternative") {
    CHECK(formatFieldValue(FieldValue{std::int64_t{7}}) == "7");
    CHECK(formatFieldValue(FieldValue{true}) == "Yes");
    CHECK(formatFieldValue(FieldValue{Date{2013, 2, 1}}) == "2013/02/01");
    CHECK(formatFieldValue(FieldValue{TimeOfDay{9, 5, 3, 0}}) == "09:05:03");
    CHECK(formatFieldValue(FieldValue{TimeOfDay{9, 5, 3, 250000}}) == "09:05:03.250000");
}

TEST_CASE("Integral number with decimal comma becomes an integer") {
    auto value = coerceField("5,0", FieldType::Number, '\t', ',');
    REQUIRE(value.has_value());
    REQUIRE(std::holds_alternative<std::int64_t>(*value));
    CHECK(std::get<std::int64_t>(*value) == 5);
}

TEST_CASE("Re-coercing the formatted number yields the same value") {
    for (const char* token : {"0.1", "-3.75e-5", "42", "1e300"}) {
        CAPTURE(token);
        auto first = coerceField(token, FieldType::Float, '\t', '.');
        REQUIRE(first.has_value());
        auto second = coerceField(formatFieldValue(*first), FieldType::Float, '\t', '.');
        REQUIRE(second.has_value());
        CHECK(std::get<double>(*first) == std::get<double>(*second));
    }
}

TEST_CASE("Text without escapes is returned unchanged") {
    auto value = coerceField("plain \\ text 2C", FieldType::Text, ',', '.');
    REQUIRE(value.has_value());
    CHECK(std::get<std::string>(*value) == "plain \\ text 2C");
}
