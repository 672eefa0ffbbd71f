/**
 * @file field_value.hpp
 * @brief Типизированные значения полей заголовков LVM
 */

#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace lvmread::model {

/**
 * @brief Календарная дата (YYYY/MM/DD)
 */
struct Date {
    int year = 1904;
    int month = 1;
    int day = 1;

    constexpr auto operator<=>(const Date&) const noexcept = default;
};

/**
 * @brief Время суток с точностью до микросекунды (HH:MM:SS.ffffff)
 */
struct TimeOfDay {
    int hour = 0;
    int minute = 0;
    int second = 0;
    int microsecond = 0;

    constexpr auto operator<=>(const TimeOfDay&) const noexcept = default;
};

/**
 * @brief Значение одного поля заголовка
 *
 * Порядок альтернатив фиксирован: он используется при сериализации в JSON.
 */
using FieldValue = std::variant<std::int64_t, double, bool, std::string, Date, TimeOfDay>;

/**
 * @brief Объявленный тип поля заголовка
 */
enum class FieldType {
    None,       ///< Тип не объявлен: значение всегда пустая строка
    Number,     ///< Вещественное, сужается до целого при нулевой дробной части
    Integer,    ///< Целое в десятичной записи
    Float,      ///< Вещественное без сужения
    Options,    ///< Перечисление (проверяется валидатором)
    Text,       ///< Свободный текст с экранированием разделителя
    Date,       ///< YYYY/MM/DD
    Time,       ///< HH:MM:SS[.ffffff]
    Bool        ///< Yes / No
};

[[nodiscard]] inline std::string_view toString(FieldType type) noexcept {
    switch (type) {
        case FieldType::None: return "none";
        case FieldType::Number: return "number";
        case FieldType::Integer: return "integer";
        case FieldType::Float: return "float";
        case FieldType::Options: return "options";
        case FieldType::Text: return "text";
        case FieldType::Date: return "date";
        case FieldType::Time: return "time";
        case FieldType::Bool: return "bool";
    }
    return "none";
}

/**
 * @brief Числовое значение поля (целое или вещественное)
 */
[[nodiscard]] inline std::optional<double> asDouble(const FieldValue& value) noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    return std::nullopt;
}

/**
 * @brief Целочисленное значение поля
 */
[[nodiscard]] inline std::optional<std::int64_t> asInteger(const FieldValue& value) noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return *i;
    }
    return std::nullopt;
}

/**
 * @brief Проверка соответствия значения объявленному типу
 */
[[nodiscard]] inline bool matchesType(const FieldValue& value, FieldType type) noexcept {
    switch (type) {
        case FieldType::Number:
            return std::holds_alternative<std::int64_t>(value) ||
                   std::holds_alternative<double>(value);
        case FieldType::Integer: return std::holds_alternative<std::int64_t>(value);
        case FieldType::Float: return std::holds_alternative<double>(value);
        case FieldType::None:
        case FieldType::Options:
        case FieldType::Text: return std::holds_alternative<std::string>(value);
        case FieldType::Date: return std::holds_alternative<Date>(value);
        case FieldType::Time: return std::holds_alternative<TimeOfDay>(value);
        case FieldType::Bool: return std::holds_alternative<bool>(value);
    }
    return false;
}

/**
 * @brief Текстовое представление значения (для сообщений об ошибках и CLI)
 */
[[nodiscard]] std::string formatFieldValue(const FieldValue& value);

} // namespace lvmread::model
