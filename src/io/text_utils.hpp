/**
 * @file text_utils.hpp
 * @brief Утилиты разбора строк LVM
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace lvmread::io {

/**
 * @brief Отбросить завершающие символы перевода строки ("\n", "\r\n", "\r")
 */
[[nodiscard]] std::string_view stripLineTerminator(std::string_view line) noexcept;

/**
 * @brief Разбить строку по разделителю
 *
 * Пустые поля сохраняются: "a\t\tb" → {"a", "", "b"}; пустая строка → {""}.
 */
[[nodiscard]] std::vector<std::string> splitFields(std::string_view line, char delimiter);

/**
 * @brief Строка пуста или начинается с разделителя (такие строки заголовка пропускаются)
 */
[[nodiscard]] bool isSkippableHeaderLine(std::string_view line, char delimiter) noexcept;

/**
 * @brief Заменить все вхождения подстроки
 */
[[nodiscard]] std::string replaceAll(std::string_view input, std::string_view from, std::string_view to);

} // namespace lvmread::io
