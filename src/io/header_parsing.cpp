/**
 * @file header_parsing.cpp
 * @brief Общие шаги разбора заголовков LVM
 */

#include "header_parsing.hpp"
#include "field_coercion.hpp"
#include "lvm_error.hpp"
#include <string>

namespace lvmread::io {

bool isSpecialBlockStart(std::string_view line) noexcept {
    return line.starts_with(kSpecialBlockStart);
}

bool isEndOfHeader(std::string_view line) noexcept {
    return line.starts_with(kEndOfHeader);
}

bool skipSpecialBlock(LineCursor& cursor) {
    while (auto line = cursor.next()) {
        if (line->starts_with(kSpecialBlockEnd)) {
            return true;
        }
    }
    return false;
}

HeaderFields defaultHeaderFields(const HeaderSchema& schema) {
    HeaderFields fields;
    for (const auto& [name, spec] : schema) {
        if (!spec.required && spec.default_value.has_value()) {
            fields.emplace(name, HeaderValue{*spec.default_value});
        }
    }
    return fields;
}

std::optional<FieldValue> coerceHeaderToken(
    std::string_view token,
    std::string_view field,
    const FieldSpec& spec,
    char delimiter,
    char decimal_separator,
    size_t line
) {
    try {
        return coerceField(token, spec.type, delimiter, decimal_separator);
    } catch (const LvmFormatError& e) {
        throw LvmFormatError(e.kind(),
            "Поле " + std::string(field) + ": " + e.what(),
            line, std::string(field));
    }
}

void throwIfInvalid(const ValidationResult& validation, size_t line) {
    if (!validation.hasErrors()) {
        return;
    }

    const auto& first = validation.errors.front();
    auto kind = first.type == ValidationErrorType::MissingRequiredField
        ? LvmErrorKind::MissingRequiredField
        : LvmErrorKind::InvalidOption;
    throw LvmFormatError(kind, first.message, line, first.field);
}

} // namespace lvmread::io
