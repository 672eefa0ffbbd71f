/**
 * @file validation.hpp
 * @brief Проверка заголовков LVM по схеме
 */

#pragma once

#include "header.hpp"
#include "header_schema.hpp"
#include <string>
#include <vector>

namespace lvmread::model {

/**
 * @brief Тип ошибки валидации заголовка
 */
enum class ValidationErrorType {
    MissingRequiredField,   ///< Обязательное поле не получило значения
    InvalidOption           ///< Значение вне списка допустимых вариантов
};

/**
 * @brief Ошибка валидации
 */
struct ValidationError {
    ValidationErrorType type;
    std::string field;               ///< Имя поля с ошибкой
    std::string value;               ///< Ошибочное значение (для InvalidOption)
    std::string message;             ///< Описание ошибки
};

/**
 * @brief Результат валидации
 */
struct ValidationResult {
    bool is_valid = true;
    std::vector<ValidationError> errors;

    void addError(ValidationErrorType type, const std::string& field,
                  const std::string& value, const std::string& message) {
        is_valid = false;
        errors.push_back({type, field, value, message});
    }

    [[nodiscard]] bool hasErrors() const noexcept { return !errors.empty(); }
};

/**
 * @brief Проверка заполненного заголовка по схеме
 *
 * Проверка исчерпывающая: собираются все ошибки в порядке полей схемы.
 *
 * @param values Поля заголовка
 * @param schema Схема
 */
[[nodiscard]] inline ValidationResult validateHeader(
    const HeaderFields& values,
    const HeaderSchema& schema
) {
    ValidationResult result;

    for (const auto& [name, spec] : schema) {
        auto it = values.find(name);
        bool present = it != values.end() && !it->second.empty();

        if (spec.required && !present) {
            result.addError(ValidationErrorType::MissingRequiredField, name, {},
                "Не найдено обязательное поле заголовка " + name);
            continue;
        }

        if (spec.type != FieldType::Options || !present) {
            continue;
        }

        for (const auto& value : it->second.values) {
            const auto* text = std::get_if<std::string>(&value);
            bool known = false;
            if (text != nullptr) {
                for (const auto& option : spec.options) {
                    if (option == *text) {
                        known = true;
                        break;
                    }
                }
            }
            if (!known) {
                auto shown = formatFieldValue(value);
                result.addError(ValidationErrorType::InvalidOption, name, shown,
                    "Поле " + name + " не допускает значение '" + shown + "'");
                break;
            }
        }
    }

    return result;
}

} // namespace lvmread::model
