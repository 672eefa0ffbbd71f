/**
 * @file test_line_cursor.cpp
 * @brief Юнит-тесты курсора строк и разбиения полей
 */

#include <doctest/doctest.h>
#include "io/line_cursor.hpp"
#include "io/text_utils.hpp"
#include <sstream>

using namespace lvmread::io;

TEST_CASE("fromText strips LF and CRLF terminators") {
    auto cursor = LineCursor::fromText("a\r\nb\nc");
    REQUIRE(cursor.size() == 3);
    CHECK(*cursor.next() == "a");
    CHECK(*cursor.next() == "b");
    CHECK(*cursor.next() == "c");
    CHECK(cursor.atEnd());
    CHECK_FALSE(cursor.next().has_value());
}

TEST_CASE("Trailing newline does not produce an extra line") {
    auto cursor = LineCursor::fromText("a\n\nb\n");
    CHECK(cursor.size() == 3);
}

TEST_CASE("peek looks ahead without consuming") {
    auto cursor = LineCursor::fromText("one\ntwo\nthree");
    CHECK(*cursor.peek() == "one");
    CHECK(*cursor.peek(2) == "three");
    CHECK_FALSE(cursor.peek(3).has_value());
    CHECK(cursor.position() == 0);

    (void)cursor.next();
    CHECK(cursor.lineNumber() == 1);
    CHECK(*cursor.peek() == "two");
}

TEST_CASE("fromStream reads every line") {
    std::istringstream in("x\r\ny\n");
    auto cursor = LineCursor::fromStream(in);
    REQUIRE(cursor.size() == 2);
    CHECK(*cursor.next() == "x");
    CHECK(*cursor.next() == "y");
}

TEST_CASE("splitFields keeps empty fields") {
    auto parts = splitFields("a\t\tb\t", '\t');
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "a");
    CHECK(parts[1].empty());
    CHECK(parts[2] == "b");
    CHECK(parts[3].empty());

    CHECK(splitFields("", ',').size() == 1);
}

TEST_CASE("Blank and delimiter-led header lines are skippable") {
    CHECK(isSkippableHeaderLine("", '\t'));
    CHECK(isSkippableHeaderLine("\t\t", '\t'));
    CHECK_FALSE(isSkippableHeaderLine("Channels\t2", '\t'));
}

TEST_CASE("stripLineTerminator handles every terminator") {
    CHECK(stripLineTerminator("a\r\n") == "a");
    CHECK(stripLineTerminator("a\n") == "a");
    CHECK(stripLineTerminator("a\r") == "a");
    CHECK(stripLineTerminator("a") == "a");
}

TEST_CASE("replaceAll replaces non-overlapping occurrences") {
    CHECK(replaceAll("a--b--c", "--", "+") == "a+b+c");
    CHECK(replaceAll("abc", "x", "y") == "abc");
}
