/**
 * @file header_schema.cpp
 * @brief Таблицы полей заголовков LVM
 */

#include "header_schema.hpp"
#include <stdexcept>

namespace lvmread::model {

namespace {

FieldSpec required(FieldType type) {
    FieldSpec spec;
    spec.type = type;
    spec.required = true;
    return spec;
}

FieldSpec optionalField(FieldType type, FieldValue default_value) {
    FieldSpec spec;
    spec.type = type;
    spec.default_value = std::move(default_value);
    return spec;
}

FieldSpec optionalNoDefault(FieldType type) {
    FieldSpec spec;
    spec.type = type;
    return spec;
}

FieldSpec choice(std::string default_value, std::vector<std::string> options) {
    FieldSpec spec;
    spec.type = FieldType::Options;
    spec.default_value = FieldValue{std::move(default_value)};
    spec.options = std::move(options);
    return spec;
}

HeaderSchema buildFileHeaderSchema() {
    HeaderSchema schema;
    // Дата начала сбора данных
    schema.emplace(fields::kDate, required(FieldType::Date));
    schema.emplace(fields::kDescription, optionalField(FieldType::Text, std::string{}));
    // Каждый сегмент несёт собственный заголовок
    schema.emplace(fields::kMultiHeadings, optionalField(FieldType::Bool, false));
    schema.emplace(fields::kOperator, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kProject, optionalField(FieldType::Text, std::string{}));
    // По умолчанию совпадает с Writer_Version (подставляется после чтения)
    schema.emplace(fields::kReaderVersion, optionalNoDefault(FieldType::Float));
    schema.emplace(fields::kSeparator, optionalField(FieldType::Text, std::string(1, kDefaultSeparator)));
    schema.emplace(fields::kDecimalSeparator, optionalField(FieldType::Text, std::string{","}));
    schema.emplace(fields::kTime, required(FieldType::Time));
    // Absolute: секунды с 1904-01-01 GMT; Relative: от штампа даты/времени
    schema.emplace(fields::kTimePref, choice("Relative", {"Absolute", "Relative"}));
    schema.emplace(fields::kWriterVersion, required(FieldType::Float));
    schema.emplace(fields::kXColumns, choice("One", {"No", "One", "Multi"}));
    return schema;
}

HeaderSchema buildSegmentHeaderSchema() {
    HeaderSchema schema;
    // Должно предшествовать полям со значениями по каналам
    schema.emplace(fields::kChannels, required(FieldType::Integer));
    schema.emplace(fields::kDate, required(FieldType::Date));
    schema.emplace(fields::kDeltaX, required(FieldType::Number));
    schema.emplace(fields::kNotes, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kSamples, required(FieldType::Integer));
    schema.emplace(fields::kTestName, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kTestNumbers, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kTestSeries, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kTime, required(FieldType::Time));
    schema.emplace(fields::kUutModel, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kUutName, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kUutSerial, optionalField(FieldType::Text, std::string{}));
    schema.emplace(fields::kX0, required(FieldType::Number));
    schema.emplace(fields::kXDimension, optionalField(FieldType::Text, std::string{"Time"}));
    schema.emplace(fields::kXUnitLabel, optionalField(FieldType::Text, std::string{"Default SI Unit"}));
    schema.emplace(fields::kYDimension, optionalField(FieldType::Text, std::string{"Electric Potential"}));
    schema.emplace(fields::kYUnitLabel, optionalField(FieldType::Text, std::string{"Default SI Unit"}));
    return schema;
}

const HeaderSchema& verified(const HeaderSchema& schema, const char* name) {
    auto problems = checkSchemaConsistency(schema);
    if (!problems.empty()) {
        std::string message = std::string("Несогласованная схема ") + name + ":";
        for (const auto& p : problems) {
            message += " " + p + ";";
        }
        throw std::logic_error(message);
    }
    return schema;
}

} // namespace

const HeaderSchema& fileHeaderSchema() {
    static const HeaderSchema schema = buildFileHeaderSchema();
    static const HeaderSchema& checked = verified(schema, "заголовка файла");
    return checked;
}

const HeaderSchema& segmentHeaderSchema() {
    static const HeaderSchema schema = buildSegmentHeaderSchema();
    static const HeaderSchema& checked = verified(schema, "заголовка сегмента");
    return checked;
}

const FieldSpec* findFieldSpec(const HeaderSchema& schema, std::string_view name) {
    auto it = schema.find(name);
    return it == schema.end() ? nullptr : &it->second;
}

std::vector<std::string> checkSchemaConsistency(const HeaderSchema& schema) {
    std::vector<std::string> problems;

    for (const auto& [name, spec] : schema) {
        if (spec.required && spec.default_value.has_value()) {
            problems.push_back(name + ": обязательное поле со значением по умолчанию");
        }
        if (spec.default_value.has_value() && !matchesType(*spec.default_value, spec.type)) {
            problems.push_back(name + ": значение по умолчанию не соответствует типу " +
                               std::string(toString(spec.type)));
        }
        if (spec.type == FieldType::Options) {
            if (spec.options.empty()) {
                problems.push_back(name + ": пустой список вариантов");
            } else if (spec.default_value.has_value()) {
                const auto* text = std::get_if<std::string>(&*spec.default_value);
                bool known = false;
                for (const auto& option : spec.options) {
                    if (text != nullptr && option == *text) {
                        known = true;
                        break;
                    }
                }
                if (!known) {
                    problems.push_back(name + ": значение по умолчанию вне списка вариантов");
                }
            }
        } else if (!spec.options.empty()) {
            problems.push_back(name + ": варианты заданы для поля типа " +
                               std::string(toString(spec.type)));
        }
    }

    return problems;
}

} // namespace lvmread::model
