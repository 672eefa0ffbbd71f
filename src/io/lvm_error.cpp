/**
 * @file lvm_error.cpp
 * @brief Названия видов ошибок LVM
 */

#include "lvm_error.hpp"

namespace lvmread::io {

std::string_view toString(LvmErrorKind kind) noexcept {
    switch (kind) {
        case LvmErrorKind::MagicMismatch: return "MagicMismatch";
        case LvmErrorKind::MissingDelimiterDeclaration: return "MissingDelimiterDeclaration";
        case LvmErrorKind::UnknownField: return "UnknownField";
        case LvmErrorKind::MissingRequiredField: return "MissingRequiredField";
        case LvmErrorKind::InvalidOption: return "InvalidOption";
        case LvmErrorKind::FieldCoercionFailure: return "FieldCoercionFailure";
        case LvmErrorKind::ChannelCardinalityMismatch: return "ChannelCardinalityMismatch";
        case LvmErrorKind::MalformedHeaderLine: return "MalformedHeaderLine";
        case LvmErrorKind::TruncatedFileHeader: return "TruncatedFileHeader";
        case LvmErrorKind::TruncatedSegmentHeader: return "TruncatedSegmentHeader";
        case LvmErrorKind::TruncatedSegmentData: return "TruncatedSegmentData";
        case LvmErrorKind::MalformedColumnRow: return "MalformedColumnRow";
    }
    return "Unknown";
}

} // namespace lvmread::io
