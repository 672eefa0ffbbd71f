/**
 * @file line_cursor.cpp
 * @brief Реализация курсора по строкам
 */

#include "line_cursor.hpp"
#include "text_utils.hpp"
#include <utility>

namespace lvmread::io {

LineCursor::LineCursor(std::vector<std::string> lines)
    : lines_(std::move(lines)) {
    for (auto& line : lines_) {
        line = std::string(stripLineTerminator(line));
    }
}

LineCursor LineCursor::fromText(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, end - start));
        start = end + 1;
    }
    return LineCursor(std::move(lines));
}

LineCursor LineCursor::fromStream(std::istream& in) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return LineCursor(std::move(lines));
}

std::optional<std::string_view> LineCursor::peek(size_t offset) const noexcept {
    if (pos_ + offset >= lines_.size()) {
        return std::nullopt;
    }
    return std::string_view(lines_[pos_ + offset]);
}

std::optional<std::string_view> LineCursor::next() noexcept {
    if (atEnd()) {
        return std::nullopt;
    }
    return std::string_view(lines_[pos_++]);
}

} // namespace lvmread::io
