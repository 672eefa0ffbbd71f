/**
 * @file file_header_reader.hpp
 * @brief Чтение заголовка файла LVM
 */

#pragma once

#include "line_cursor.hpp"
#include "model/header.hpp"

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Найти объявление разделителя просмотром вперёд
 *
 * Ищет строку, начинающуюся со слова Separator; разделителем
 * считается символ сразу после него. Если раньше встречен
 * ***End_of_Header***, разделитель по умолчанию: табуляция. Строки не потребляются.
 *
 * @throws LvmFormatError MissingDelimiterDeclaration, если ввод закончился раньше
 */
[[nodiscard]] char findSeparator(const LineCursor& cursor);

/**
 * @brief Прочитать заголовок файла до ***End_of_Header*** включительно
 *
 * @param cursor Курсор, стоящий на первой строке файла
 * @return Проверенный заголовок; поле Separator содержит символ-разделитель
 * @throws LvmFormatError При нарушении формата
 */
[[nodiscard]] FileHeader readFileHeader(LineCursor& cursor);

} // namespace lvmread::io
