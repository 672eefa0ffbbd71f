/**
 * @file field_value.cpp
 * @brief Текстовое представление значений полей
 */

#include "field_value.hpp"
#include <iomanip>
#include <limits>
#include <sstream>

namespace lvmread::model {

std::string formatFieldValue(const FieldValue& value) {
    std::ostringstream ss;

    if (const auto* i = std::get_if<std::int64_t>(&value)) {
        ss << *i;
    } else if (const auto* d = std::get_if<double>(&value)) {
        ss << std::setprecision(std::numeric_limits<double>::max_digits10) << *d;
    } else if (const auto* b = std::get_if<bool>(&value)) {
        ss << (*b ? "Yes" : "No");
    } else if (const auto* s = std::get_if<std::string>(&value)) {
        ss << *s;
    } else if (const auto* date = std::get_if<Date>(&value)) {
        ss << std::setfill('0')
           << std::setw(4) << date->year << "/"
           << std::setw(2) << date->month << "/"
           << std::setw(2) << date->day;
    } else if (const auto* t = std::get_if<TimeOfDay>(&value)) {
        ss << std::setfill('0')
           << std::setw(2) << t->hour << ":"
           << std::setw(2) << t->minute << ":"
           << std::setw(2) << t->second;
        if (t->microsecond != 0) {
            ss << "." << std::setw(6) << t->microsecond;
        }
    }

    return ss.str();
}

} // namespace lvmread::model
