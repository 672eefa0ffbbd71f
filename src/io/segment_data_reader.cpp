/**
 * @file segment_data_reader.cpp
 * @brief Реализация чтения таблицы данных сегмента LVM
 */

#include "segment_data_reader.hpp"
#include "field_coercion.hpp"
#include "lvm_error.hpp"
#include "model/header_schema.hpp"
#include "text_utils.hpp"
#include <limits>

namespace lvmread::io {

namespace {

constexpr double kMissingX = std::numeric_limits<double>::quiet_NaN();

std::optional<double> columnValue(const std::vector<std::string>& values, size_t index, char decimal) {
    if (index >= values.size()) {
        return std::nullopt;
    }
    return parseLvmFloat(values[index], decimal);
}

std::vector<double> startValues(
    const SegmentHeader& header,
    const std::optional<std::vector<double>>& x0_override,
    size_t channels
) {
    std::vector<double> x0(channels, 0.0);
    for (size_t ch = 0; ch < channels; ++ch) {
        if (x0_override.has_value() && ch < x0_override->size()) {
            x0[ch] = (*x0_override)[ch];
        } else {
            x0[ch] = header.numberForChannel(fields::kX0, ch).value_or(0.0);
        }
    }
    return x0;
}

} // namespace

std::optional<SegmentData> readSegmentData(
    LineCursor& cursor,
    const FileHeader& file_header,
    const SegmentHeader& segment_header,
    const std::optional<std::vector<double>>& x0_override
) {
    // Пустые строки перед таблицей не относятся к данным
    while (auto ahead = cursor.peek()) {
        if (!ahead->empty()) {
            break;
        }
        cursor.next();
    }
    if (cursor.atEnd()) {
        return std::nullopt;
    }

    const char separator = file_header.separator();
    const char decimal = file_header.decimalSeparator();
    const XColumns x_columns = file_header.xColumns();
    const size_t channels = segment_header.channels();
    const size_t max_samples = segment_header.maxSamples();

    const auto x0 = startValues(segment_header, x0_override, channels);
    std::vector<double> delta_x(channels, 0.0);
    for (size_t ch = 0; ch < channels; ++ch) {
        delta_x[ch] = segment_header.numberForChannel(fields::kDeltaX, ch).value_or(0.0);
    }

    const size_t comment_column = x_columns == XColumns::Multi ? channels * 2 : channels + 1;

    SegmentData data;
    data.channels.resize(channels);

    size_t sample = 0;
    while (sample < max_samples) {
        auto line = cursor.next();
        if (!line.has_value()) {
            throw LvmFormatError(LvmErrorKind::TruncatedSegmentData,
                "Файл закончился до конца сегмента: прочитано " + std::to_string(sample) +
                " из " + std::to_string(max_samples) + " строк",
                cursor.lineNumber());
        }
        if (line->empty()) {
            break;
        }

        const auto values = splitFields(*line, separator);

        std::optional<double> shared_x;
        if (x_columns == XColumns::One) {
            shared_x = columnValue(values, 0, decimal);
        }

        for (size_t ch = 0; ch < channels; ++ch) {
            double x_value = kMissingX;
            std::optional<double> y_value;

            switch (x_columns) {
                case XColumns::One:
                    x_value = shared_x.value_or(kMissingX);
                    y_value = columnValue(values, ch + 1, decimal);
                    break;
                case XColumns::Multi:
                    x_value = columnValue(values, ch * 2, decimal).value_or(kMissingX);
                    y_value = columnValue(values, ch * 2 + 1, decimal);
                    break;
                case XColumns::No:
                    x_value = x0[ch] + delta_x[ch] * static_cast<double>(sample);
                    y_value = columnValue(values, ch + 1, decimal);
                    break;
            }

            // Пустой Y: ряд канала закончился
            if (!y_value.has_value()) {
                continue;
            }

            data.channels[ch].x.push_back(x_value);
            data.channels[ch].y.push_back(*y_value);
        }

        data.comments.push_back(values.size() > comment_column ? values[comment_column] : std::string{});
        ++sample;
    }

    // Пустая строка после полной таблицы завершает сегмент
    if (sample == max_samples) {
        auto next = cursor.peek();
        if (next.has_value() && next->empty()) {
            cursor.next();
        }
    }

    return data;
}

} // namespace lvmread::io
