/**
 * @file lvm_json.hpp
 * @brief Сериализация результата разбора LVM в JSON (экспорт и кэш)
 */

#pragma once

#include "model/lvm_data.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace lvmread::io {

using namespace lvmread::model;

/// Идентификатор формата JSON
constexpr const char* LVM_JSON_FORMAT_ID = "lvmread-result";

/// Версия формата JSON; кэш другой версии не используется
constexpr int LVM_JSON_FORMAT_VERSION = 1;

/**
 * @brief Значение поля с тегом типа: {"type": "...", "value": ...}
 */
[[nodiscard]] nlohmann::json fieldValueToJson(const FieldValue& value);

/**
 * @throws LvmIoError Неизвестный тег или неверное значение
 */
[[nodiscard]] FieldValue fieldValueFromJson(const nlohmann::json& j);

/**
 * @brief Полный результат разбора в JSON
 *
 * Отсутствующие X (NaN) записываются как null.
 */
[[nodiscard]] nlohmann::json resultToJson(const ParseResult& result);

/**
 * @throws LvmIoError При нарушении структуры документа
 */
[[nodiscard]] ParseResult resultFromJson(const nlohmann::json& j);

/**
 * @brief Сохранить результат в файл (атомарная запись)
 * @throws LvmIoError При ошибке записи
 */
void saveResultJson(const ParseResult& result, const std::filesystem::path& path, int indent = -1);

/**
 * @brief Загрузить результат из файла
 * @throws LvmIoError При ошибке чтения, парсинга или несовпадении версии формата
 */
[[nodiscard]] ParseResult loadResultJson(const std::filesystem::path& path);

} // namespace lvmread::io
