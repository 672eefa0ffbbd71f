/**
 * @file lvm_data.hpp
 * @brief Результат разбора файла LVM
 */

#pragma once

#include "header.hpp"
#include <string>
#include <vector>

namespace lvmread::model {

/**
 * @brief Данные одного канала сегмента
 *
 * Длины x и y всегда совпадают; длины разных каналов могут различаться.
 */
struct ChannelData {
    std::vector<double> x;
    std::vector<double> y;

    [[nodiscard]] size_t size() const noexcept { return y.size(); }
    [[nodiscard]] bool empty() const noexcept { return y.empty(); }

    bool operator==(const ChannelData&) const = default;
};

/**
 * @brief Сегмент: заголовок, данные каналов и комментарии строк
 */
struct Segment {
    SegmentHeader header;
    std::vector<ChannelData> channels;
    std::vector<std::string> comments;   ///< По одному на прочитанную строку

    [[nodiscard]] size_t rowCount() const noexcept { return comments.size(); }

    bool operator==(const Segment&) const = default;
};

/**
 * @brief Полный результат разбора файла
 */
struct ParseResult {
    FileHeader file_header;
    std::vector<Segment> segments;

    /**
     * @brief Общее число отсчётов по всем сегментам и каналам
     */
    [[nodiscard]] size_t totalSamples() const noexcept {
        size_t total = 0;
        for (const auto& segment : segments) {
            for (const auto& channel : segment.channels) {
                total += channel.size();
            }
        }
        return total;
    }

    bool operator==(const ParseResult&) const = default;
};

} // namespace lvmread::model
