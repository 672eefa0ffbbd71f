/**
 * @file lvm_file.hpp
 * @brief Чтение файлов LVM с диска с кэшированием результата
 */

#pragma once

#include "model/lvm_data.hpp"
#include <filesystem>

namespace lvmread::io {

using namespace lvmread::model;

/**
 * @brief Опции чтения файла
 */
struct ReadOptions {
    bool use_cache = true;     ///< Брать результат из кэша, если он актуален
    bool write_cache = true;   ///< Сохранять кэш после разбора
};

/**
 * @brief Путь кэша для файла: "<file>.json" рядом с исходным
 */
[[nodiscard]] std::filesystem::path cachePathFor(const std::filesystem::path& path);

/**
 * @brief Прочитать файл LVM
 *
 * Кэш используется, если он строго новее исходного файла либо исходного файла
 * больше нет. Повреждённый кэш игнорируется с предупреждением в std::cerr.
 *
 * @param path Путь к файлу .lvm
 * @param options Опции чтения
 * @return Результат разбора
 * @throws LvmIoError Если файл не открывается
 * @throws LvmFormatError При нарушении формата
 */
[[nodiscard]] ParseResult readLvm(
    const std::filesystem::path& path,
    const ReadOptions& options = {}
);

/**
 * @brief Проверка, является ли файл LVM (по первой строке)
 */
[[nodiscard]] bool canReadLvm(const std::filesystem::path& path) noexcept;

} // namespace lvmread::io
