/**
 * @file text_utils.cpp
 * @brief Утилиты разбора строк LVM
 */

#include "text_utils.hpp"

namespace lvmread::io {

std::string_view stripLineTerminator(std::string_view line) noexcept {
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.remove_suffix(1);
    }
    return line;
}

std::vector<std::string> splitFields(std::string_view line, char delimiter) {
    std::vector<std::string> result;
    size_t start = 0;
    while (true) {
        size_t end = line.find(delimiter, start);
        if (end == std::string_view::npos) {
            result.emplace_back(line.substr(start));
            break;
        }
        result.emplace_back(line.substr(start, end - start));
        start = end + 1;
    }
    return result;
}

bool isSkippableHeaderLine(std::string_view line, char delimiter) noexcept {
    return line.empty() || line.front() == delimiter;
}

std::string replaceAll(std::string_view input, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return std::string(input);
    }
    std::string out;
    out.reserve(input.size());
    size_t start = 0;
    while (true) {
        size_t pos = input.find(from, start);
        if (pos == std::string_view::npos) {
            out.append(input.substr(start));
            break;
        }
        out.append(input.substr(start, pos - start));
        out.append(to);
        start = pos + from.size();
    }
    return out;
}

} // namespace lvmread::io
