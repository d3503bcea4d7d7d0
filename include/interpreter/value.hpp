#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace pdsl {

// Runtime value of the prompt language
struct Value {
    using ValueType = std::variant<
        std::monostate,  // None
        int64_t,         // integer
        double,          // float
        std::string,     // string
        bool             // boolean
    >;

    ValueType data;

    Value() : data(std::monostate{}) {}
    Value(int v) : data(static_cast<int64_t>(v)) {}
    Value(int64_t v) : data(v) {}
    Value(double v) : data(v) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) : data(std::move(v)) {}
    Value(const char* v) : data(std::string(v)) {}
    Value(bool v) : data(v) {}

    // Type checks
    bool isNull() const { return std::holds_alternative<std::monostate>(data); }
    bool isInt() const { return std::holds_alternative<int64_t>(data); }
    bool isFloat() const { return std::holds_alternative<double>(data); }
    bool isString() const { return std::holds_alternative<std::string>(data); }
    bool isBool() const { return std::holds_alternative<bool>(data); }
    // Booleans take part in arithmetic as 0/1
    bool isNumeric() const { return isInt() || isFloat() || isBool(); }

    // Value accessors
    int64_t asInt() const { return std::get<int64_t>(data); }
    double asFloat() const { return std::get<double>(data); }
    const std::string& asString() const { return std::get<std::string>(data); }
    bool asBool() const { return std::get<bool>(data); }

    // Integral view of int/bool values
    int64_t asInteger() const {
        if (isBool()) return asBool() ? 1 : 0;
        return asInt();
    }

    // Get numeric value as double
    double asNumber() const {
        if (isInt()) return static_cast<double>(asInt());
        if (isFloat()) return asFloat();
        if (isBool()) return asBool() ? 1.0 : 0.0;
        return 0.0;
    }

    // Convert to string for display: True/False/None, 3.0 for integral floats
    std::string toString() const;

    // Get type name (int, float, str, bool, NoneType)
    std::string typeName() const;

    // Truthiness check
    bool isTruthy() const;

    bool operator==(const Value& other) const = default;
};

using VariableMap = std::map<std::string, Value>;

// Shortest text that reads back to the same double, always with a '.' or exponent
std::string formatFloat(double value);

} // namespace pdsl
