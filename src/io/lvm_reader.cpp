/**
 * @file lvm_reader.cpp
 * @brief Реализация разбора содержимого LVM
 */

#include "lvm_reader.hpp"
#include "file_header_reader.hpp"
#include "model/header_schema.hpp"
#include "segment_data_reader.hpp"
#include "segment_header_reader.hpp"
#include <optional>
#include <vector>

namespace lvmread::io {

namespace {

enum class ReadState {
    NeedsHeader,
    HasHeader,
    Done
};

/// Начальные X следующего сегмента: последний X канала либо его X0
std::vector<double> continuationValues(const Segment& segment) {
    const size_t channels = segment.header.channels();
    std::vector<double> values(channels, 0.0);
    for (size_t ch = 0; ch < channels; ++ch) {
        if (ch < segment.channels.size() && !segment.channels[ch].x.empty()) {
            values[ch] = segment.channels[ch].x.back();
        } else {
            values[ch] = segment.header.numberForChannel(fields::kX0, ch).value_or(0.0);
        }
    }
    return values;
}

} // namespace

ParseResult readLvmLines(LineCursor& cursor) {
    ParseResult result;
    result.file_header = readFileHeader(cursor);
    const bool multi_headings = result.file_header.multiHeadings();

    std::optional<SegmentHeader> header;
    std::optional<std::vector<double>> x0_override;
    ReadState state = ReadState::NeedsHeader;

    while (state != ReadState::Done) {
        if (state == ReadState::NeedsHeader || multi_headings) {
            header = readSegmentHeader(cursor, result.file_header);
            if (!header.has_value()) {
                state = ReadState::Done;
                continue;
            }
            state = ReadState::HasHeader;
        }

        const size_t start = cursor.position();
        auto data = readSegmentData(cursor, result.file_header, *header, x0_override);
        if (!data.has_value()) {
            state = ReadState::Done;
            continue;
        }

        // Повторный заголовок без отсчётов не продвигает курсор
        if (!multi_headings && !result.segments.empty() && cursor.position() == start) {
            state = ReadState::Done;
            continue;
        }

        Segment segment;
        segment.header = *header;
        segment.channels = std::move(data->channels);
        segment.comments = std::move(data->comments);

        x0_override = continuationValues(segment);
        result.segments.push_back(std::move(segment));
    }

    return result;
}

ParseResult readLvmString(std::string_view text) {
    auto cursor = LineCursor::fromText(text);
    return readLvmLines(cursor);
}

} // namespace lvmread::io
