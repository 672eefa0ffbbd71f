/**
 * @file test_lvm_reader.cpp
 * @brief Юнит-тесты разбора файла LVM целиком
 */

#include <doctest/doctest.h>
#include "io/lvm_error.hpp"
#include "io/lvm_reader.hpp"
#include "model/header_schema.hpp"
#include <string>

using namespace lvmread::io;
using namespace lvmread::model;

namespace {

std::string fileHeader(const std::string& extra = {}) {
    return "LabVIEW Measurement\t\n"
           "Writer_Version\t2\n"
           "Separator\tTab\n"
           "Decimal_Separator\t.\n"
           "Date\t2020/01/02\n"
           "Time\t10:00:00\n" +
           extra +
           "***End_of_Header***\t\n"
           "\n";
}

std::string segmentHeader(const std::string& fields, const std::string& columns) {
    return "Date\t2020/01/02\n"
           "Time\t10:00:00\n" +
           fields +
           "***End_of_Header***\n" +
           columns + "\n";
}

LvmErrorKind errorKind(const std::string& text) {
    try {
        (void)readLvmString(text);
    } catch (const LvmFormatError& e) {
        return e.kind();
    }
    FAIL("LvmFormatError expected");
    return LvmErrorKind::MagicMismatch;
}

} // namespace

TEST_CASE("Minimal single-segment file with one X column") {
    auto result = readLvmString(
        fileHeader() +
        segmentHeader("Channels\t1\nSamples\t3\nX0\t0\nDelta_X\t1\n", "X_Value\tVoltage") +
        "0\t1.0\n"
        "1\t2.0\n"
        "2\t3.0\n");

    REQUIRE(result.segments.size() == 1);
    const auto& segment = result.segments[0];
    REQUIRE(segment.channels.size() == 1);
    CHECK(segment.channels[0].x == std::vector<double>{0.0, 1.0, 2.0});
    CHECK(segment.channels[0].y == std::vector<double>{1.0, 2.0, 3.0});
    CHECK(result.totalSamples() == 3);
}

TEST_CASE("No X column computes X from the header") {
    auto result = readLvmString(
        fileHeader("X_Columns\tNo\n") +
        segmentHeader("Channels\t1\nSamples\t3\nX0\t10\nDelta_X\t5\n", "X_Value\tVoltage") +
        "\t7\n"
        "\t8\n"
        "\t9\n");

    REQUIRE(result.segments.size() == 1);
    CHECK(result.segments[0].channels[0].x == std::vector<double>{10.0, 15.0, 20.0});
    CHECK(result.segments[0].channels[0].y == std::vector<double>{7.0, 8.0, 9.0});
}

TEST_CASE("Segments sharing one header continue X from the previous segment") {
    auto result = readLvmString(
        fileHeader("X_Columns\tNo\nMulti_Headings\tNo\n") +
        segmentHeader("Channels\t1\nSamples\t2\nX0\t0\nDelta_X\t1\n", "X_Value\tVoltage") +
        "\t1\n"
        "\t2\n"
        "\n"
        "\t3\n"
        "\t4\n");

    REQUIRE(result.segments.size() == 2);
    CHECK(result.segments[0].channels[0].x == std::vector<double>{0.0, 1.0});
    CHECK(result.segments[1].channels[0].x == std::vector<double>{1.0, 2.0});
    CHECK(result.segments[1].channels[0].y == std::vector<double>{3.0, 4.0});
    CHECK(result.segments[0].header == result.segments[1].header);
}

TEST_CASE("Continuation falls back to X0 for a channel without samples") {
    auto result = readLvmString(
        fileHeader("X_Columns\tNo\n") +
        segmentHeader("Channels\t2\nSamples\t1\nX0\t5\t7\nDelta_X\t1\n", "X_Value\ta\tb") +
        "\t1\t\n"
        "\t2\t3\n");

    REQUIRE(result.segments.size() == 2);
    CHECK(result.segments[0].channels[1].empty());
    CHECK(result.segments[1].channels[0].x == std::vector<double>{5.0});
    CHECK(result.segments[1].channels[1].x == std::vector<double>{7.0});
}

TEST_CASE("Blank Y ends one channel while its sibling continues") {
    auto result = readLvmString(
        fileHeader() +
        segmentHeader("Channels\t2\nSamples\t4\t2\nX0\t0\nDelta_X\t1\n", "X_Value\ta\tb\tComment") +
        "0\t1\t10\tstart\n"
        "1\t2\t20\n"
        "2\t3\t\n"
        "3\t4\t\tend\n");

    REQUIRE(result.segments.size() == 1);
    const auto& segment = result.segments[0];
    CHECK(segment.channels[0].y == std::vector<double>{1.0, 2.0, 3.0, 4.0});
    CHECK(segment.channels[1].y == std::vector<double>{10.0, 20.0});
    CHECK(segment.comments == std::vector<std::string>{"start", "", "", "end"});
    CHECK(segment.header.y_labels.size() == segment.header.channels());
}

TEST_CASE("Multi X columns read X,Y pairs per channel") {
    auto result = readLvmString(
        fileHeader("X_Columns\tMulti\n") +
        segmentHeader("Channels\t2\nSamples\t2\nX0\t0\nDelta_X\t1\n",
                      "X_Value\ta\tX_Value\tb\tComment") +
        "0\t1\t0.5\t10\tfirst\n"
        "1\t2\t1.5\t20\tsecond\n");

    REQUIRE(result.segments.size() == 1);
    const auto& segment = result.segments[0];
    CHECK(segment.channels[0].x == std::vector<double>{0.0, 1.0});
    CHECK(segment.channels[1].x == std::vector<double>{0.5, 1.5});
    CHECK(segment.channels[1].y == std::vector<double>{10.0, 20.0});
    CHECK(segment.comments == std::vector<std::string>{"first", "second"});
    REQUIRE(segment.header.y_labels.size() == 2);
    CHECK(segment.header.y_labels[1] == "b");
}

TEST_CASE("Every segment carries its own header in multi-heading mode") {
    auto result = readLvmString(
        fileHeader("Multi_Headings\tYes\n") +
        segmentHeader("Channels\t1\nSamples\t1\nX0\t0\nDelta_X\t1\n", "X_Value\ta") +
        "0\t1\n"
        "\n" +
        segmentHeader("Channels\t2\nSamples\t2\nX0\t0\nDelta_X\t1\n", "X_Value\tb\tc") +
        "0\t2\t3\n"
        "1\t4\t5\n");

    REQUIRE(result.segments.size() == 2);
    CHECK(result.segments[0].header.channels() == 1);
    CHECK(result.segments[1].header.channels() == 2);
    CHECK(result.segments[1].channels[1].y == std::vector<double>{3.0, 5.0});
}

TEST_CASE("Computed X continues across segments with their own headers") {
    auto result = readLvmString(
        fileHeader("Multi_Headings\tYes\nX_Columns\tNo\n") +
        segmentHeader("Channels\t1\nSamples\t2\nX0\t0\nDelta_X\t1\n", "X_Value\ta") +
        "\t1\n"
        "\t2\n"
        "\n" +
        segmentHeader("Channels\t2\nSamples\t2\nX0\t0\t50\nDelta_X\t1\n", "X_Value\ta\tb") +
        "\t3\t30\n"
        "\t4\t40\n");

    REQUIRE(result.segments.size() == 2);
    CHECK(result.segments[0].channels[0].x == std::vector<double>{0.0, 1.0});
    // Канал 0 продолжает предыдущий сегмент, новый канал 1 начинает со своего X0
    CHECK(result.segments[1].channels[0].x == std::vector<double>{1.0, 2.0});
    CHECK(result.segments[1].channels[1].x == std::vector<double>{50.0, 51.0});
}

TEST_CASE("Separator is stored as the literal character") {
    auto result = readLvmString(
        "LabVIEW Measurement;\n"
        "Writer_Version;2\n"
        "Separator;Semicolon\n"
        "Date;2020/01/02\n"
        "Time;10:00:00\n"
        "***End_of_Header***;\n"
        "Channels;1\nSamples;1\nDate;2020/01/02\nTime;10:00:00\nX0;0\nDelta_X;1\n"
        "***End_of_Header***\n"
        "X_Value;a;Comment\n"
        "0;1,5;note\n");

    CHECK(result.file_header.text(fields::kSeparator) == ";");
    REQUIRE(result.segments.size() == 1);
    CHECK(result.segments[0].channels[0].y.front() == doctest::Approx(1.5));
    CHECK(result.segments[0].comments.front() == "note");
}

TEST_CASE("File without segments has an empty segment list") {
    auto result = readLvmString(fileHeader());
    CHECK(result.segments.empty());
    CHECK(result.totalSamples() == 0);
}

TEST_CASE("Header without data ends the file cleanly") {
    auto result = readLvmString(
        fileHeader() +
        segmentHeader("Channels\t1\nSamples\t3\nX0\t0\nDelta_X\t1\n", "X_Value\ta"));
    CHECK(result.segments.empty());
}

TEST_CASE("Zero-sample segment with a shared header does not loop") {
    auto result = readLvmString(
        fileHeader() +
        segmentHeader("Channels\t1\nSamples\t0\nX0\t0\nDelta_X\t1\n", "X_Value\ta") +
        "0\t1\n");
    REQUIRE(result.segments.size() == 1);
    CHECK(result.segments[0].rowCount() == 0);
}

TEST_CASE("Format errors abort the whole parse") {
    SUBCASE("unknown file header field") {
        CHECK(errorKind(fileHeader("Colour\tred\n")) == LvmErrorKind::UnknownField);
    }
    SUBCASE("missing Writer_Version") {
        CHECK(errorKind("LabVIEW Measurement\nDate\t2020/01/02\nTime\t10:00:00\n***End_of_Header***\n")
              == LvmErrorKind::MissingRequiredField);
    }
    SUBCASE("truncated data in a later segment") {
        CHECK(errorKind(fileHeader("Multi_Headings\tYes\n") +
                        segmentHeader("Channels\t1\nSamples\t1\nX0\t0\nDelta_X\t1\n", "X_Value\ta") +
                        "0\t1\n"
                        "\n" +
                        segmentHeader("Channels\t1\nSamples\t3\nX0\t0\nDelta_X\t1\n", "X_Value\ta") +
                        "0\t1\n") == LvmErrorKind::TruncatedSegmentData);
    }
}
