/**
 * @file lvm_json.cpp
 * @brief Реализация сериализации результата разбора LVM
 */

#include "lvm_json.hpp"
#include "file_utils.hpp"
#include "lvm_error.hpp"
#include <cmath>
#include <limits>

namespace lvmread::io {

using json = nlohmann::json;

namespace {

// === Значения полей ===

json dateToJson(const Date& d) {
    return json{{"year", d.year}, {"month", d.month}, {"day", d.day}};
}

Date dateFromJson(const json& j) {
    Date d;
    d.year = j.at("year").get<int>();
    d.month = j.at("month").get<int>();
    d.day = j.at("day").get<int>();
    return d;
}

json timeToJson(const TimeOfDay& t) {
    return json{
        {"hour", t.hour},
        {"minute", t.minute},
        {"second", t.second},
        {"microsecond", t.microsecond}
    };
}

TimeOfDay timeFromJson(const json& j) {
    TimeOfDay t;
    t.hour = j.at("hour").get<int>();
    t.minute = j.at("minute").get<int>();
    t.second = j.at("second").get<int>();
    t.microsecond = j.value("microsecond", 0);
    return t;
}

// === Заголовки ===

json fieldsToJson(const HeaderFields& fields) {
    json j = json::object();
    for (const auto& [name, value] : fields) {
        json values = json::array();
        for (const auto& v : value.values) {
            values.push_back(fieldValueToJson(v));
        }
        j[name] = json{{"per_channel", value.per_channel}, {"values", std::move(values)}};
    }
    return j;
}

HeaderFields fieldsFromJson(const json& j) {
    HeaderFields fields;
    for (const auto& [name, item] : j.items()) {
        HeaderValue value;
        value.per_channel = item.value("per_channel", false);
        for (const auto& v : item.at("values")) {
            value.values.push_back(fieldValueFromJson(v));
        }
        fields.emplace(name, std::move(value));
    }
    return fields;
}

// === Данные ===

json samplesToJson(const std::vector<double>& samples) {
    json j = json::array();
    for (double v : samples) {
        if (std::isnan(v)) {
            j.push_back(nullptr);
        } else {
            j.push_back(v);
        }
    }
    return j;
}

std::vector<double> samplesFromJson(const json& j) {
    std::vector<double> samples;
    samples.reserve(j.size());
    for (const auto& v : j) {
        samples.push_back(v.is_null() ? std::numeric_limits<double>::quiet_NaN() : v.get<double>());
    }
    return samples;
}

json segmentToJson(const Segment& segment) {
    json j;
    j["header"] = fieldsToJson(segment.header.fields);
    j["columns"] = segment.header.columns;
    j["y_labels"] = segment.header.y_labels;

    json channels = json::array();
    for (const auto& channel : segment.channels) {
        channels.push_back(json{
            {"x", samplesToJson(channel.x)},
            {"y", samplesToJson(channel.y)}
        });
    }
    j["channels"] = std::move(channels);
    j["comments"] = segment.comments;
    return j;
}

Segment segmentFromJson(const json& j) {
    Segment segment;
    segment.header.fields = fieldsFromJson(j.at("header"));
    segment.header.columns = j.value("columns", std::vector<std::string>{});
    segment.header.y_labels = j.value("y_labels", std::vector<std::string>{});

    for (const auto& item : j.at("channels")) {
        ChannelData channel;
        channel.x = samplesFromJson(item.at("x"));
        channel.y = samplesFromJson(item.at("y"));
        if (channel.x.size() != channel.y.size()) {
            throw LvmIoError("Длины X и Y канала не совпадают");
        }
        segment.channels.push_back(std::move(channel));
    }
    segment.comments = j.value("comments", std::vector<std::string>{});
    return segment;
}

} // namespace

json fieldValueToJson(const FieldValue& value) {
    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        return json{{"type", "integer"}, {"value", *i}};
    }
    if (const auto* d = std::get_if<double>(&value)) {
        return json{{"type", "float"}, {"value", *d}};
    }
    if (const auto* b = std::get_if<bool>(&value)) {
        return json{{"type", "bool"}, {"value", *b}};
    }
    if (const auto* s = std::get_if<std::string>(&value)) {
        return json{{"type", "text"}, {"value", *s}};
    }
    if (const auto* date = std::get_if<Date>(&value)) {
        return json{{"type", "date"}, {"value", dateToJson(*date)}};
    }
    return json{{"type", "time"}, {"value", timeToJson(std::get<TimeOfDay>(value))}};
}

FieldValue fieldValueFromJson(const json& j) {
    try {
        const auto type = j.at("type").get<std::string>();
        const auto& value = j.at("value");

        if (type == "integer") return value.get<std::int64_t>();
        if (type == "float") return value.get<double>();
        if (type == "bool") return value.get<bool>();
        if (type == "text") return value.get<std::string>();
        if (type == "date") return dateFromJson(value);
        if (type == "time") return timeFromJson(value);

        throw LvmIoError("Неизвестный тип значения: " + type);
    } catch (const json::exception& e) {
        throw LvmIoError("Неверное значение поля: " + std::string(e.what()));
    }
}

json resultToJson(const ParseResult& result) {
    json j;
    j["format"] = LVM_JSON_FORMAT_ID;
    j["version"] = LVM_JSON_FORMAT_VERSION;
    j["file_header"] = fieldsToJson(result.file_header.fields);

    json segments = json::array();
    for (const auto& segment : result.segments) {
        segments.push_back(segmentToJson(segment));
    }
    j["segments"] = std::move(segments);
    return j;
}

ParseResult resultFromJson(const json& j) {
    try {
        if (!j.is_object() || j.value("format", "") != LVM_JSON_FORMAT_ID) {
            throw LvmIoError("Документ не является результатом разбора LVM");
        }
        const int version = j.value("version", 0);
        if (version != LVM_JSON_FORMAT_VERSION) {
            throw LvmIoError("Неподдерживаемая версия формата: " + std::to_string(version));
        }

        ParseResult result;
        result.file_header.fields = fieldsFromJson(j.at("file_header"));
        for (const auto& item : j.at("segments")) {
            result.segments.push_back(segmentFromJson(item));
        }
        return result;
    } catch (const json::exception& e) {
        throw LvmIoError("Ошибка структуры JSON: " + std::string(e.what()));
    }
}

void saveResultJson(const ParseResult& result, const std::filesystem::path& path, int indent) {
    atomicWrite(path, resultToJson(result).dump(indent));
}

ParseResult loadResultJson(const std::filesystem::path& path) {
    const auto content = readWholeFile(path);

    json j;
    try {
        j = json::parse(content);
    } catch (const json::parse_error& e) {
        throw LvmIoError("Ошибка парсинга JSON: " + std::string(e.what()));
    }

    return resultFromJson(j);
}

} // namespace lvmread::io
