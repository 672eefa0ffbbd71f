/**
 * @file header.hpp
 * @brief Заголовок файла и заголовок сегмента LVM
 */

#pragma once

#include "field_value.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lvmread::model {

/**
 * @brief Значение поля заголовка: общее для всех каналов или по одному на канал
 */
struct HeaderValue {
    std::vector<FieldValue> values;   ///< Одно значение или Channels значений
    bool per_channel = false;         ///< Список по каналам

    HeaderValue() = default;
    HeaderValue(FieldValue scalar) : values{std::move(scalar)} {}

    [[nodiscard]] static HeaderValue perChannel(std::vector<FieldValue> list) {
        HeaderValue v;
        v.values = std::move(list);
        v.per_channel = true;
        return v;
    }

    [[nodiscard]] bool empty() const noexcept { return values.empty(); }

    /**
     * @brief Первое (единственное для скаляра) значение
     * @throws std::out_of_range Если значений нет
     */
    [[nodiscard]] const FieldValue& scalar() const { return values.at(0); }

    /**
     * @brief Значение для канала: скаляр применяется ко всем каналам
     * @throws std::out_of_range Если канал вне списка
     */
    [[nodiscard]] const FieldValue& forChannel(size_t channel) const {
        return per_channel ? values.at(channel) : values.at(0);
    }

    bool operator==(const HeaderValue&) const = default;
};

/// Поля заголовка по именам (упорядочены для стабильной сериализации)
using HeaderFields = std::map<std::string, HeaderValue, std::less<>>;

/**
 * @brief Режим хранения значений оси X
 */
enum class XColumns {
    No,      ///< X не сохраняется, вычисляется из X0 и Delta_X
    One,     ///< Одна общая колонка X
    Multi    ///< Колонка X для каждого канала
};

[[nodiscard]] inline std::string_view toString(XColumns mode) noexcept {
    switch (mode) {
        case XColumns::No: return "No";
        case XColumns::One: return "One";
        case XColumns::Multi: return "Multi";
    }
    return "One";
}

/**
 * @brief Парсинг режима X_Columns (значение уже проверено валидатором)
 */
[[nodiscard]] inline XColumns parseXColumns(std::string_view str) noexcept {
    if (str == "No") return XColumns::No;
    if (str == "Multi") return XColumns::Multi;
    return XColumns::One;
}

/**
 * @brief Заголовок файла
 *
 * После чтения поле Separator содержит сам символ-разделитель,
 * а не текстовое значение из файла.
 */
struct FileHeader {
    HeaderFields fields;

    [[nodiscard]] const HeaderValue* find(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

    [[nodiscard]] char separator() const;
    [[nodiscard]] char decimalSeparator() const;
    [[nodiscard]] XColumns xColumns() const;
    [[nodiscard]] bool multiHeadings() const;

    /**
     * @brief Текстовое поле или пустая строка
     */
    [[nodiscard]] std::string text(std::string_view name) const;

    bool operator==(const FileHeader&) const = default;
};

/**
 * @brief Заголовок сегмента данных
 */
struct SegmentHeader {
    HeaderFields fields;
    std::vector<std::string> columns;   ///< Строка имён колонок, начинается с X_Value
    std::vector<std::string> y_labels;  ///< columns без X_Value и Comment

    [[nodiscard]] const HeaderValue* find(std::string_view name) const;
    [[nodiscard]] bool has(std::string_view name) const { return find(name) != nullptr; }

    /**
     * @brief Число каналов (0, если поле ещё не прочитано)
     */
    [[nodiscard]] size_t channels() const;

    /**
     * @brief Числовое значение поля для канала (X0, Delta_X и т.п.)
     */
    [[nodiscard]] std::optional<double> numberForChannel(std::string_view name, size_t channel) const;

    /**
     * @brief Объявленное число отсчётов канала
     */
    [[nodiscard]] size_t samplesForChannel(size_t channel) const;

    /**
     * @brief Максимум Samples по всем каналам (число строк таблицы)
     */
    [[nodiscard]] size_t maxSamples() const;

    bool operator==(const SegmentHeader&) const = default;
};

} // namespace lvmread::model
