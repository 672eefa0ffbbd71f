/**
 * @file header_schema.hpp
 * @brief Декларативные схемы полей заголовков LVM
 *
 * Поля и значения по умолчанию взяты из описания формата .lvm от NI.
 * Обе таблицы неизменяемы и проверяются на внутреннюю согласованность
 * при первом обращении.
 */

#pragma once

#include "field_value.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lvmread::model {

/// Идентификатор формата в начале первой строки файла
constexpr std::string_view kFileMagic = "LabVIEW Measurement";

/// Маркер конца заголовка (файла и сегмента)
constexpr std::string_view kEndOfHeader = "***End_of_Header***";

/// Начало и конец специального блока
constexpr std::string_view kSpecialBlockStart = "***Start_Special***";
constexpr std::string_view kSpecialBlockEnd = "***End_Special***";

/// Первая колонка строки имён колонок
constexpr std::string_view kXValueColumn = "X_Value";
constexpr std::string_view kCommentColumn = "Comment";

/// Ключевое слово объявления разделителя
constexpr std::string_view kSeparatorKeyword = "Separator";

/// Разделитель по умолчанию
constexpr char kDefaultSeparator = '\t';

/**
 * @brief Имена полей заголовков
 */
namespace fields {
    // Заголовок файла
    constexpr std::string_view kDate = "Date";
    constexpr std::string_view kDescription = "Description";
    constexpr std::string_view kMultiHeadings = "Multi_Headings";
    constexpr std::string_view kOperator = "Operator";
    constexpr std::string_view kProject = "Project";
    constexpr std::string_view kReaderVersion = "Reader_Version";
    constexpr std::string_view kSeparator = "Separator";
    constexpr std::string_view kDecimalSeparator = "Decimal_Separator";
    constexpr std::string_view kTime = "Time";
    constexpr std::string_view kTimePref = "Time_Pref";
    constexpr std::string_view kWriterVersion = "Writer_Version";
    constexpr std::string_view kXColumns = "X_Columns";

    // Заголовок сегмента
    constexpr std::string_view kChannels = "Channels";
    constexpr std::string_view kDeltaX = "Delta_X";
    constexpr std::string_view kNotes = "Notes";
    constexpr std::string_view kSamples = "Samples";
    constexpr std::string_view kTestName = "Test_Name";
    constexpr std::string_view kTestNumbers = "Test_Numbers";
    constexpr std::string_view kTestSeries = "Test_Series";
    constexpr std::string_view kUutModel = "UUT_M/N";
    constexpr std::string_view kUutName = "UUT_Name";
    constexpr std::string_view kUutSerial = "UUT_S/N";
    constexpr std::string_view kX0 = "X0";
    constexpr std::string_view kXDimension = "X_Dimension";
    constexpr std::string_view kXUnitLabel = "X_Unit_Label";
    constexpr std::string_view kYDimension = "Y_Dimension";
    constexpr std::string_view kYUnitLabel = "Y_Unit_Label";
} // namespace fields

/**
 * @brief Описание одного поля схемы
 */
struct FieldSpec {
    FieldType type = FieldType::None;
    bool required = false;
    std::optional<FieldValue> default_value;  ///< Только для необязательных полей
    std::vector<std::string> options;         ///< Допустимые значения для Options
};

/// Схема заголовка: имя поля → описание (упорядочено по имени)
using HeaderSchema = std::map<std::string, FieldSpec, std::less<>>;

/**
 * @brief Схема заголовка файла
 */
[[nodiscard]] const HeaderSchema& fileHeaderSchema();

/**
 * @brief Схема заголовка сегмента
 */
[[nodiscard]] const HeaderSchema& segmentHeaderSchema();

/**
 * @brief Поиск описания поля
 * @return nullptr, если поле не входит в схему
 */
[[nodiscard]] const FieldSpec* findFieldSpec(const HeaderSchema& schema, std::string_view name);

/**
 * @brief Проверка согласованности схемы
 *
 * Обязательные поля не имеют значения по умолчанию, тип значения по
 * умолчанию совпадает с объявленным, у полей Options список вариантов
 * не пуст и содержит значение по умолчанию.
 *
 * @return Список найденных несоответствий (пустой, если схема согласована)
 */
[[nodiscard]] std::vector<std::string> checkSchemaConsistency(const HeaderSchema& schema);

} // namespace lvmread::model
