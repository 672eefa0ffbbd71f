/**
 * @file lvm_reader.hpp
 * @brief Разбор содержимого LVM: заголовок файла и последовательность сегментов
 */

#pragma once

#include "line_cursor.hpp"
#include "model/lvm_data.hpp"
#include <string_view>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Разобрать LVM из курсора строк
 *
 * Читает заголовок файла, затем сегменты до чистого конца ввода.
 * При Multi_Headings = No заголовок первого сегмента используется для всех
 * последующих. В каждом следующем сегменте вычисляемый X продолжается
 * с последнего значения канала.
 *
 * @param cursor Курсор, стоящий на первой строке файла
 * @return Полный результат разбора
 * @throws LvmFormatError При любом нарушении формата (частичного результата нет)
 */
[[nodiscard]] ParseResult readLvmLines(LineCursor& cursor);

/**
 * @brief Разобрать LVM из строки в памяти
 * @throws LvmFormatError При нарушении формата
 */
[[nodiscard]] ParseResult readLvmString(std::string_view text);

} // namespace lvmread::io
