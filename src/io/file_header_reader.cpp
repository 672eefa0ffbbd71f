/**
 * @file file_header_reader.cpp
 * @brief Реализация чтения заголовка файла LVM
 */

#include "file_header_reader.hpp"
#include "header_parsing.hpp"
#include "lvm_error.hpp"
#include "text_utils.hpp"
#include <string>

namespace lvmread::io {

namespace {

void checkDecimalSeparator(const FieldValue& value, size_t line) {
    const auto* text = std::get_if<std::string>(&value);
    if (text == nullptr || text->size() != 1) {
        throw LvmFormatError(LvmErrorKind::FieldCoercionFailure,
            "Десятичный разделитель должен быть одним символом: '" + formatFieldValue(value) + "'",
            line, std::string(fields::kDecimalSeparator));
    }
}

// Reader_Version по умолчанию совпадает с Writer_Version
void resolveReaderVersion(HeaderFields& values) {
    if (values.find(fields::kReaderVersion) != values.end()) {
        return;
    }
    auto writer = values.find(fields::kWriterVersion);
    if (writer != values.end()) {
        values.emplace(std::string(fields::kReaderVersion), writer->second);
    }
}

} // namespace

char findSeparator(const LineCursor& cursor) {
    for (size_t offset = 0; auto line = cursor.peek(offset); ++offset) {
        if (line->starts_with(kSeparatorKeyword)) {
            if (line->size() > kSeparatorKeyword.size()) {
                return (*line)[kSeparatorKeyword.size()];
            }
            break;
        }
        if (isEndOfHeader(*line)) {
            return kDefaultSeparator;
        }
    }

    throw LvmFormatError(LvmErrorKind::MissingDelimiterDeclaration,
        "Не найден заголовок Separator");
}

FileHeader readFileHeader(LineCursor& cursor) {
    const char separator = findSeparator(cursor);
    const auto& schema = fileHeaderSchema();

    auto magic = cursor.next();
    if (!magic.has_value() || !magic->starts_with(kFileMagic)) {
        throw LvmFormatError(LvmErrorKind::MagicMismatch,
            "Не найден идентификатор '" + std::string(kFileMagic) + "' в начале файла",
            cursor.lineNumber());
    }

    FileHeader header;
    header.fields = defaultHeaderFields(schema);

    while (auto line = cursor.next()) {
        const size_t line_num = cursor.lineNumber();

        if (isEndOfHeader(*line)) {
            throwIfInvalid(validateHeader(header.fields, schema), line_num);
            header.fields[std::string(fields::kSeparator)] = HeaderValue{FieldValue{std::string(1, separator)}};
            resolveReaderVersion(header.fields);
            return header;
        }

        if (isSkippableHeaderLine(*line, separator)) {
            continue;
        }

        if (isSpecialBlockStart(*line)) {
            skipSpecialBlock(cursor);
            continue;
        }

        auto tokens = splitFields(*line, separator);
        if (tokens.size() != 2) {
            throw LvmFormatError(LvmErrorKind::MalformedHeaderLine,
                "Ожидается пара «ключ, значение»: '" + std::string(*line) + "'",
                line_num);
        }

        const auto& key = tokens[0];
        const auto* spec = findFieldSpec(schema, key);
        if (spec == nullptr) {
            throw LvmFormatError(LvmErrorKind::UnknownField,
                "Неизвестное поле заголовка файла: " + key, line_num, key);
        }

        auto value = coerceHeaderToken(tokens[1], key, *spec, separator,
                                       header.decimalSeparator(), line_num);
        if (!value.has_value()) {
            throw LvmFormatError(LvmErrorKind::FieldCoercionFailure,
                "Ошибка разбора значения в строке: '" + std::string(*line) + "'",
                line_num, key);
        }

        if (key == fields::kDecimalSeparator) {
            checkDecimalSeparator(*value, line_num);
        }

        header.fields[key] = HeaderValue{std::move(*value)};
    }

    throw LvmFormatError(LvmErrorKind::TruncatedFileHeader,
        "Файл закончился до конца заголовка файла", cursor.lineNumber());
}

} // namespace lvmread::io
