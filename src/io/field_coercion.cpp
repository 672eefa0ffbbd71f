/**
 * @file field_coercion.cpp
 * @brief Реализация преобразования полей LVM
 */

#include "field_coercion.hpp"
#include "lvm_error.hpp"
#include "text_utils.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace lvmread::io {

namespace {

constexpr size_t kMaxFractionDigits = 6;

// Допускаются секунды координации 60 и 61
constexpr int kMaxSecond = 61;

bool isAllDigits(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

bool isBlank(std::string_view s) noexcept {
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Поле из 1..max_len цифр
std::optional<int> parseDigits(std::string_view s, size_t min_len, size_t max_len) noexcept {
    if (s.size() < min_len || s.size() > max_len || !isAllDigits(s)) {
        return std::nullopt;
    }
    int value = 0;
    for (char c : s) {
        value = value * 10 + (c - '0');
    }
    return value;
}

bool isLeapYear(int year) noexcept {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) noexcept {
    static constexpr int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

[[noreturn]] void throwCoercion(const std::string& message) {
    throw LvmFormatError(LvmErrorKind::FieldCoercionFailure, message);
}

std::optional<FieldValue> narrowNumber(double value) {
    constexpr double kInt64Limit = 9223372036854775808.0;  // 2^63
    if (std::isfinite(value) && std::trunc(value) == value &&
        value >= -kInt64Limit && value < kInt64Limit) {
        return FieldValue{static_cast<std::int64_t>(value)};
    }
    return FieldValue{value};
}

} // namespace

std::optional<double> parseLvmFloat(std::string_view token, char decimal_separator) noexcept {
    if (token.empty() || isBlank(token)) {
        return std::nullopt;
    }

    std::string normalized(token);
    if (decimal_separator != '.') {
        for (auto& c : normalized) {
            if (c == decimal_separator) {
                c = '.';
            }
        }
    }

    try {
        size_t pos = 0;
        double value = std::stod(normalized, &pos);
        while (pos < normalized.size() && std::isspace(static_cast<unsigned char>(normalized[pos]))) {
            ++pos;
        }
        if (pos != normalized.size()) {
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::int64_t> parseLvmInteger(std::string_view token) noexcept {
    if (token.empty() || isBlank(token)) {
        return std::nullopt;
    }

    std::string text(token);
    try {
        size_t pos = 0;
        long long value = std::stoll(text, &pos, 10);
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos != text.size()) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string unescapeDelimiter(std::string_view text, char delimiter) {
    char upper[4];
    char lower[4];
    auto code = static_cast<unsigned>(static_cast<unsigned char>(delimiter));
    std::snprintf(upper, sizeof(upper), "\\%02X", code);
    std::snprintf(lower, sizeof(lower), "\\%02x", code);

    const std::string_view replacement(&delimiter, 1);
    auto result = replaceAll(text, upper, replacement);
    return replaceAll(result, lower, replacement);
}

Date parseLvmDate(std::string_view token) {
    auto first = token.find('/');
    auto second = first == std::string_view::npos ? first : token.find('/', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos) {
        throwCoercion("Некорректная дата (ожидается YYYY/MM/DD): '" + std::string(token) + "'");
    }

    auto year = parseDigits(token.substr(0, first), 4, 4);
    auto month = parseDigits(token.substr(first + 1, second - first - 1), 1, 2);
    auto day = parseDigits(token.substr(second + 1), 1, 2);

    if (!year || !month || !day || *month < 1 || *month > 12 ||
        *day < 1 || *day > daysInMonth(*year, *month)) {
        throwCoercion("Некорректная дата (ожидается YYYY/MM/DD): '" + std::string(token) + "'");
    }

    return Date{*year, *month, *day};
}

TimeOfDay parseLvmTime(std::string_view token, char decimal_separator) {
    auto fail = [&token]() {
        throwCoercion("Некорректное время (ожидается HH:MM:SS): '" + std::string(token) + "'");
    };

    std::string_view clock = token;
    int microsecond = 0;

    auto dec_pos = token.find(decimal_separator);
    if (dec_pos != std::string_view::npos) {
        clock = token.substr(0, dec_pos);
        auto fraction = token.substr(dec_pos + 1);
        if (fraction.find(decimal_separator) != std::string_view::npos || !isAllDigits(fraction)) {
            fail();
        }
        if (fraction.size() > kMaxFractionDigits) {
            fraction = fraction.substr(0, kMaxFractionDigits);
        }
        microsecond = *parseDigits(fraction, 1, kMaxFractionDigits);
        for (size_t i = fraction.size(); i < kMaxFractionDigits; ++i) {
            microsecond *= 10;
        }
    }

    auto first = clock.find(':');
    auto second = first == std::string_view::npos ? first : clock.find(':', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos) {
        fail();
    }

    auto hour = parseDigits(clock.substr(0, first), 1, 2);
    auto minute = parseDigits(clock.substr(first + 1, second - first - 1), 1, 2);
    auto sec = parseDigits(clock.substr(second + 1), 1, 2);

    if (!hour || !minute || !sec || *hour > 23 || *minute > 59 || *sec > kMaxSecond) {
        fail();
    }

    return TimeOfDay{*hour, *minute, *sec, microsecond};
}

std::optional<FieldValue> coerceField(
    std::string_view token,
    FieldType type,
    char delimiter,
    char decimal_separator
) {
    switch (type) {
        case FieldType::Number: {
            auto value = parseLvmFloat(token, decimal_separator);
            if (!value.has_value()) {
                return std::nullopt;
            }
            return narrowNumber(*value);
        }

        case FieldType::Integer: {
            auto value = parseLvmInteger(token);
            if (!value.has_value()) {
                return std::nullopt;
            }
            return FieldValue{*value};
        }

        case FieldType::Float: {
            auto value = parseLvmFloat(token, decimal_separator);
            if (!value.has_value()) {
                return std::nullopt;
            }
            return FieldValue{*value};
        }

        case FieldType::Options:
            return FieldValue{std::string(token)};

        case FieldType::Text:
            return FieldValue{unescapeDelimiter(token, delimiter)};

        case FieldType::Date:
            return FieldValue{parseLvmDate(token)};

        case FieldType::Time:
            return FieldValue{parseLvmTime(token, decimal_separator)};

        case FieldType::Bool:
            if (token == "Yes") {
                return FieldValue{true};
            }
            if (token == "No") {
                return FieldValue{false};
            }
            throwCoercion("Ожидается Yes или No: '" + std::string(token) + "'");

        case FieldType::None:
            return FieldValue{std::string{}};
    }

    return std::nullopt;
}

} // namespace lvmread::io
