/**
 * @file header.cpp
 * @brief Доступ к полям заголовков LVM
 */

#include "header.hpp"
#include "header_schema.hpp"
#include <algorithm>

namespace lvmread::model {

namespace {

const HeaderValue* findIn(const HeaderFields& fields, std::string_view name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) {
        return nullptr;
    }
    return &it->second;
}

char firstChar(const HeaderValue* value, char fallback) {
    if (value == nullptr) {
        return fallback;
    }
    const auto* text = std::get_if<std::string>(&value->scalar());
    if (text == nullptr || text->empty()) {
        return fallback;
    }
    return text->front();
}

} // namespace

const HeaderValue* FileHeader::find(std::string_view name) const {
    return findIn(fields, name);
}

char FileHeader::separator() const {
    return firstChar(find(fields::kSeparator), kDefaultSeparator);
}

char FileHeader::decimalSeparator() const {
    return firstChar(find(fields::kDecimalSeparator), ',');
}

XColumns FileHeader::xColumns() const {
    return parseXColumns(text(fields::kXColumns));
}

bool FileHeader::multiHeadings() const {
    const auto* value = find(fields::kMultiHeadings);
    if (value == nullptr) {
        return false;
    }
    const auto* flag = std::get_if<bool>(&value->scalar());
    return flag != nullptr && *flag;
}

std::string FileHeader::text(std::string_view name) const {
    const auto* value = find(name);
    if (value == nullptr) {
        return {};
    }
    const auto* text = std::get_if<std::string>(&value->scalar());
    return text != nullptr ? *text : std::string{};
}

const HeaderValue* SegmentHeader::find(std::string_view name) const {
    return findIn(fields, name);
}

size_t SegmentHeader::channels() const {
    const auto* value = find(fields::kChannels);
    if (value == nullptr) {
        return 0;
    }
    auto count = asInteger(value->scalar());
    if (!count.has_value() || *count < 0) {
        return 0;
    }
    return static_cast<size_t>(*count);
}

std::optional<double> SegmentHeader::numberForChannel(std::string_view name, size_t channel) const {
    const auto* value = find(name);
    if (value == nullptr || (value->per_channel && channel >= value->values.size())) {
        return std::nullopt;
    }
    return asDouble(value->forChannel(channel));
}

size_t SegmentHeader::samplesForChannel(size_t channel) const {
    const auto* value = find(fields::kSamples);
    if (value == nullptr || (value->per_channel && channel >= value->values.size())) {
        return 0;
    }
    auto samples = asInteger(value->forChannel(channel));
    if (!samples.has_value() || *samples < 0) {
        return 0;
    }
    return static_cast<size_t>(*samples);
}

size_t SegmentHeader::maxSamples() const {
    size_t result = 0;
    for (size_t ch = 0; ch < channels(); ++ch) {
        result = std::max(result, samplesForChannel(ch));
    }
    return result;
}

} // namespace lvmread::model
