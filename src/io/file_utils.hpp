/**
 * @file file_utils.hpp
 * @brief Вспомогательные функции для работы с файлами
 */

#pragma once

#include <filesystem>
#include <string>

namespace lvmread::io {

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 * @throws LvmIoError Если файл не удалось записать
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Прочитать файл целиком
 * @throws LvmIoError Если файл не открывается
 */
[[nodiscard]] std::string readWholeFile(const std::filesystem::path& path);

} // namespace lvmread::io
