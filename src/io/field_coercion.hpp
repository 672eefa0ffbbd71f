/**
 * @file field_coercion.hpp
 * @brief Преобразование текстовых полей LVM в типизированные значения
 */

#pragma once

#include "model/field_value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Преобразовать токен в значение объявленного типа
 *
 * Различаются два исхода неудачи:
 * - std::nullopt — «нет значения» (пустое или нечисловое поле числового типа);
 * - LvmFormatError(FieldCoercionFailure) — значение присутствует, но не
 *   декодируется (дата, время, логическое значение).
 *
 * @param token Исходный текст поля
 * @param type Объявленный тип
 * @param delimiter Разделитель полей файла (для снятия экранирования в тексте)
 * @param decimal_separator Десятичный разделитель файла
 * @throws LvmFormatError При ошибке декодирования даты, времени или Yes/No
 */
[[nodiscard]] std::optional<FieldValue> coerceField(
    std::string_view token,
    FieldType type,
    char delimiter,
    char decimal_separator
);

/**
 * @brief Вещественное число с учётом десятичного разделителя
 * @return std::nullopt для пустого или нечислового токена
 */
[[nodiscard]] std::optional<double> parseLvmFloat(std::string_view token, char decimal_separator) noexcept;

/**
 * @brief Целое число в десятичной записи
 */
[[nodiscard]] std::optional<std::int64_t> parseLvmInteger(std::string_view token) noexcept;

/**
 * @brief Снять экранирование разделителя: "\2C" / "\2c" → ","
 */
[[nodiscard]] std::string unescapeDelimiter(std::string_view text, char delimiter);

/**
 * @brief Дата в формате YYYY/MM/DD
 * @throws LvmFormatError Некорректная дата
 */
[[nodiscard]] Date parseLvmDate(std::string_view token);

/**
 * @brief Время HH:MM:SS с необязательной дробной частью секунд
 *
 * Дробная часть отделяется десятичным разделителем файла и усекается
 * до 6 знаков.
 *
 * @throws LvmFormatError Некорректное время
 */
[[nodiscard]] TimeOfDay parseLvmTime(std::string_view token, char decimal_separator);

} // namespace lvmread::io
