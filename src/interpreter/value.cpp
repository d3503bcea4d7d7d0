#include "interpreter/value.hpp"

#include <charconv>
#include <cmath>

namespace pdsl {

std::string formatFloat(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    char buffer[64];
    double magnitude = std::fabs(value);
    bool fixed = magnitude == 0.0 || (magnitude >= 1e-4 && magnitude < 1e16);
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                fixed ? std::chars_format::fixed : std::chars_format::scientific);
    std::string text(buffer, result.ptr);

    if (fixed && text.find('.') == std::string::npos) {
        text += ".0";
    }
    return text;
}

std::string Value::toString() const {
    if (isNull()) return "None";
    if (isInt()) return std::to_string(asInt());
    if (isFloat()) return formatFloat(asFloat());
    if (isString()) return asString();
    if (isBool()) return asBool() ? "True" : "False";
    return "unknown";
}

std::string Value::typeName() const {
    if (isNull()) return "NoneType";
    if (isInt()) return "int";
    if (isFloat()) return "float";
    if (isString()) return "str";
    if (isBool()) return "bool";
    return "unknown";
}

bool Value::isTruthy() const {
    if (isNull()) return false;
    if (isBool()) return asBool();
    if (isInt()) return asInt() != 0;
    if (isFloat()) return asFloat() != 0.0;
    if (isString()) return !asString().empty();
    return true;
}

} // namespace pdsl
