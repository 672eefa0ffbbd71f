/**
 * @file segment_header_reader.hpp
 * @brief Чтение заголовка сегмента LVM
 */

#pragma once

#include "line_cursor.hpp"
#include "model/header.hpp"
#include <optional>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Прочитать заголовок сегмента и строку имён колонок
 *
 * Поля со значениями по каналам допускают ровно одно значение (общее для
 * всех каналов) или ровно Channels значений, поэтому Channels должно
 * встретиться раньше них.
 *
 * @param cursor Курсор после данных предыдущего сегмента (или заголовка файла)
 * @param file_header Заголовок файла (разделители)
 * @return Заголовок сегмента; std::nullopt, если ввод закончился до начала нового сегмента
 * @throws LvmFormatError При нарушении формата или обрыве заголовка
 */
[[nodiscard]] std::optional<SegmentHeader> readSegmentHeader(
    LineCursor& cursor,
    const FileHeader& file_header
);

} // namespace lvmread::io
