/**
 * @file segment_header_reader.cpp
 * @brief Реализация чтения заголовка сегмента LVM
 */

#include "segment_header_reader.hpp"
#include "header_parsing.hpp"
#include "lvm_error.hpp"
#include "text_utils.hpp"
#include <sstream>
#include <string>
#include <vector>

namespace lvmread::io {

namespace {

std::string describeValues(const std::vector<FieldValue>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << formatFieldValue(values[i]);
    }
    oss << "] (" << values.size() << ")";
    return oss.str();
}

void readColumnRow(LineCursor& cursor, SegmentHeader& header, char separator) {
    auto row = cursor.next();
    if (!row.has_value()) {
        throw LvmFormatError(LvmErrorKind::TruncatedSegmentHeader,
            "Файл закончился до строки имён колонок", cursor.lineNumber());
    }
    if (!row->starts_with(kXValueColumn)) {
        throw LvmFormatError(LvmErrorKind::MalformedColumnRow,
            "Не удалось прочитать имена колонок: строка должна начинаться с " +
            std::string(kXValueColumn), cursor.lineNumber());
    }

    header.columns = splitFields(*row, separator);
    header.y_labels.clear();
    for (const auto& column : header.columns) {
        if (column != kXValueColumn && column != kCommentColumn) {
            header.y_labels.push_back(column);
        }
    }
}

void storeValues(SegmentHeader& header, const std::string& key,
                 std::vector<FieldValue> values, size_t line_num) {
    const size_t channels = header.channels();

    if (values.size() == 1) {
        if (key == fields::kChannels) {
            auto count = asInteger(values.front());
            if (!count.has_value() || *count < 1) {
                throw LvmFormatError(LvmErrorKind::FieldCoercionFailure,
                    "Число каналов должно быть не меньше 1: " + formatFieldValue(values.front()),
                    line_num, key);
            }
        }
        header.fields[key] = HeaderValue{std::move(values.front())};
        return;
    }

    if (channels > 0 && values.size() == channels) {
        header.fields[key] = HeaderValue::perChannel(std::move(values));
        return;
    }

    std::string known = channels > 0 ? std::to_string(channels) : std::string("не найдено");
    throw LvmFormatError(LvmErrorKind::ChannelCardinalityMismatch,
        "Несоответствие числа каналов (" + known + ") и поля " + key +
        ": данные " + describeValues(values),
        line_num, key);
}

} // namespace

std::optional<SegmentHeader> readSegmentHeader(
    LineCursor& cursor,
    const FileHeader& file_header
) {
    const auto& schema = segmentHeaderSchema();
    const char separator = file_header.separator();
    const char decimal = file_header.decimalSeparator();

    SegmentHeader header;
    header.fields = defaultHeaderFields(schema);
    bool started = false;

    while (auto line = cursor.next()) {
        const size_t line_num = cursor.lineNumber();

        if (isEndOfHeader(*line)) {
            throwIfInvalid(validateHeader(header.fields, schema), line_num);
            readColumnRow(cursor, header, separator);
            return header;
        }

        if (isSkippableHeaderLine(*line, separator)) {
            continue;
        }

        started = true;

        if (isSpecialBlockStart(*line)) {
            skipSpecialBlock(cursor);
            continue;
        }

        auto tokens = splitFields(*line, separator);
        const auto& key = tokens.front();
        const auto* spec = findFieldSpec(schema, key);
        if (spec == nullptr) {
            throw LvmFormatError(LvmErrorKind::UnknownField,
                "Неизвестное поле заголовка сегмента: " + key, line_num, key);
        }

        std::vector<FieldValue> values;
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (tokens[i].empty()) {
                continue;
            }
            auto value = coerceHeaderToken(tokens[i], key, *spec, separator, decimal, line_num);
            if (value.has_value()) {
                values.push_back(std::move(*value));
            }
        }

        if (values.empty()) {
            throw LvmFormatError(LvmErrorKind::FieldCoercionFailure,
                "Ошибка разбора значения в строке: '" + std::string(*line) + "'",
                line_num, key);
        }

        storeValues(header, key, std::move(values), line_num);
    }

    if (!started) {
        return std::nullopt;
    }

    throw LvmFormatError(LvmErrorKind::TruncatedSegmentHeader,
        "Файл закончился до конца заголовка сегмента", cursor.lineNumber());
}

} // namespace lvmread::io
