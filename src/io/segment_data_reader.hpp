/**
 * @file segment_data_reader.hpp
 * @brief Чтение таблицы данных сегмента LVM
 */

#pragma once

#include "line_cursor.hpp"
#include "model/header.hpp"
#include "model/lvm_data.hpp"
#include <optional>
#include <string>
#include <vector>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Данные сегмента без заголовка
 */
struct SegmentData {
    std::vector<ChannelData> channels;   ///< По одному на канал
    std::vector<std::string> comments;   ///< По одному на прочитанную строку
};

/**
 * @brief Прочитать таблицу отсчётов сегмента
 *
 * Пустые строки перед таблицей пропускаются. Читается max(Samples) строк
 * либо до пустой строки (она потребляется).
 * Пустая строка сразу после полной таблицы также потребляется как
 * завершающая. Пустое значение Y означает окончание ряда канала: в эту
 * строку канал ничего не добавляет.
 *
 * Раскладка колонок по X_Columns:
 * - One:   X в колонке 0, Y каналов в 1..C, комментарий в C+1;
 * - Multi: пары (X, Y) в колонках (2i, 2i+1), комментарий в 2C;
 * - No:    X = x0[i] + Delta_X[i] * s, Y в 1..C, комментарий в C+1.
 *
 * @param cursor Курсор после строки имён колонок (или после предыдущего сегмента)
 * @param file_header Заголовок файла
 * @param segment_header Заголовок сегмента
 * @param x0_override Начальные X каналов вместо X0 заголовка (режим No)
 * @return Данные; std::nullopt, если до конца ввода нет ни одной строки данных
 * @throws LvmFormatError TruncatedSegmentData, если строк меньше объявленного
 */
[[nodiscard]] std::optional<SegmentData> readSegmentData(
    LineCursor& cursor,
    const FileHeader& file_header,
    const SegmentHeader& segment_header,
    const std::optional<std::vector<double>>& x0_override = std::nullopt
);

} // namespace lvmread::io
