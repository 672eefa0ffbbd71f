/**
 * @file header_parsing.hpp
 * @brief Общие шаги разбора заголовков LVM (файла и сегмента)
 */

#pragma once

#include "line_cursor.hpp"
#include "model/header.hpp"
#include "model/header_schema.hpp"
#include "model/validation.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Пропустить специальный блок
 *
 * Строка ***Start_Special*** уже потреблена. Потребляет строки до
 * ***End_Special*** включительно или до конца ввода.
 *
 * @return true, если найден маркер конца блока
 */
bool skipSpecialBlock(LineCursor& cursor);

/**
 * @brief Строка начинает специальный блок
 */
[[nodiscard]] bool isSpecialBlockStart(std::string_view line) noexcept;

/**
 * @brief Строка является маркером конца заголовка
 */
[[nodiscard]] bool isEndOfHeader(std::string_view line) noexcept;

/**
 * @brief Заполнить заголовок значениями по умолчанию необязательных полей
 */
[[nodiscard]] HeaderFields defaultHeaderFields(const HeaderSchema& schema);

/**
 * @brief Преобразовать значение поля заголовка, дополнив ошибку номером строки и именем поля
 *
 * @throws LvmFormatError FieldCoercionFailure при ошибке декодирования
 */
[[nodiscard]] std::optional<FieldValue> coerceHeaderToken(
    std::string_view token,
    std::string_view field,
    const FieldSpec& spec,
    char delimiter,
    char decimal_separator,
    size_t line
);

/**
 * @brief Превратить первую ошибку валидации в LvmFormatError
 *
 * @throws LvmFormatError MissingRequiredField или InvalidOption
 */
void throwIfInvalid(const ValidationResult& validation, size_t line);

} // namespace lvmread::io
