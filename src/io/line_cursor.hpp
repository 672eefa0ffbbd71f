/**
 * @file line_cursor.hpp
 * @brief Курсор по буферу строк с просмотром вперёд
 */

#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lvmread::io {

/**
 * @brief Курсор чтения по индексируемому буферу строк
 *
 * Строки хранятся без завершающих "\n" / "\r\n". Чтение идёт только вперёд;
 * peek() позволяет заглянуть на любое число строк без их потребления.
 */
class LineCursor {
public:
    LineCursor() = default;
    explicit LineCursor(std::vector<std::string> lines);

    /**
     * @brief Разбить текст на строки (разделитель "\n", "\r" перед ним отбрасывается)
     */
    [[nodiscard]] static LineCursor fromText(std::string_view text);

    /**
     * @brief Прочитать все строки потока
     */
    [[nodiscard]] static LineCursor fromStream(std::istream& in);

    [[nodiscard]] bool atEnd() const noexcept { return pos_ >= lines_.size(); }

    /**
     * @brief Строка на расстоянии offset от текущей позиции без потребления
     */
    [[nodiscard]] std::optional<std::string_view> peek(size_t offset = 0) const noexcept;

    /**
     * @brief Потребить текущую строку
     * @return std::nullopt, если строки закончились
     */
    std::optional<std::string_view> next() noexcept;

    /// Индекс следующей непрочитанной строки (с 0)
    [[nodiscard]] size_t position() const noexcept { return pos_; }

    /// Номер последней потреблённой строки (с 1); 0, если ничего не прочитано
    [[nodiscard]] size_t lineNumber() const noexcept { return pos_; }

    [[nodiscard]] size_t size() const noexcept { return lines_.size(); }

private:
    std::vector<std::string> lines_;
    size_t pos_ = 0;
};

} // namespace lvmread::io
