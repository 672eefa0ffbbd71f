/**
 * @file lvm_error.hpp
 * @brief Ошибки чтения файлов LVM
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace lvmread::io {

/**
 * @brief Вид ошибки формата
 */
enum class LvmErrorKind {
    MagicMismatch,               ///< Нет идентификатора формата в первой строке
    MissingDelimiterDeclaration, ///< Не найдено объявление Separator
    UnknownField,                ///< Неизвестное поле заголовка
    MissingRequiredField,        ///< Обязательное поле не заполнено
    InvalidOption,               ///< Значение вне списка вариантов
    FieldCoercionFailure,        ///< Значение не декодируется в объявленный тип
    ChannelCardinalityMismatch,  ///< Число значений не 1 и не Channels
    MalformedHeaderLine,         ///< Строка заголовка файла не «ключ, значение»
    TruncatedFileHeader,         ///< Файл закончился внутри заголовка файла
    TruncatedSegmentHeader,      ///< Файл закончился внутри заголовка сегмента
    TruncatedSegmentData,        ///< Файл закончился раньше объявленных отсчётов
    MalformedColumnRow           ///< Строка имён колонок не начинается с X_Value
};

[[nodiscard]] std::string_view toString(LvmErrorKind kind) noexcept;

/**
 * @brief Ошибка формата LVM
 *
 * Любая такая ошибка прерывает разбор всего файла.
 */
class LvmFormatError : public std::runtime_error {
public:
    LvmFormatError(LvmErrorKind kind, const std::string& message,
                   size_t line = 0, std::string field = {})
        : std::runtime_error(message)
        , kind_(kind)
        , line_(line)
        , field_(std::move(field)) {}

    [[nodiscard]] LvmErrorKind kind() const noexcept { return kind_; }

    /// Номер строки (с 1); 0, если неизвестен
    [[nodiscard]] size_t line() const noexcept { return line_; }

    /// Имя поля заголовка, если ошибка к нему относится
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    LvmErrorKind kind_;
    size_t line_;
    std::string field_;
};

/**
 * @brief Ошибка ввода-вывода (открытие файла, кэш)
 */
class LvmIoError : public std::runtime_error {
public:
    explicit LvmIoError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace lvmread::io
