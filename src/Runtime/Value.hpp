// Tagged runtime value shared by the BASIC, Pascal and Prolog interpreters.
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace timewarp {

enum class ValueType : uint8_t { Number, Text, Boolean, List };

/**
 * Value - closed tagged union over number, text, boolean and list.
 *
 * Values are treated as immutable: variables hold a Value and are
 * reassigned wholesale. Only the storage slot that owns a list (a Pascal
 * array variable, a BASIC DIM array) updates elements in place.
 */
struct Value {
    ValueType type{ValueType::Number};
    // Storage
    double num{0.0};
    std::string text{};
    bool flag{false};
    std::vector<Value> items{};

    static Value makeNumber(double v) {
        Value x; x.type = ValueType::Number; x.num = v; return x;
    }
    static Value makeText(std::string v) {
        Value x; x.type = ValueType::Text; x.text = std::move(v); return x;
    }
    static Value makeBoolean(bool v) {
        Value x; x.type = ValueType::Boolean; x.flag = v; return x;
    }
    static Value makeList(std::vector<Value> v) {
        Value x; x.type = ValueType::List; x.items = std::move(v); return x;
    }

    bool isNumber() const { return type == ValueType::Number; }
    bool isText() const { return type == ValueType::Text; }
    bool isBoolean() const { return type == ValueType::Boolean; }
    bool isList() const { return type == ValueType::List; }

    // Display form used by PRINT / writeln / write.
    std::string toString() const;

    // Structural equality; numbers compare by value, lists element-wise.
    bool equals(const Value& other) const;
};

const char* typeName(ValueType type);

// Shared number rendering: integral values print without a decimal point.
std::string formatNumber(double v);

// Parses user input as a number. Leading/trailing blanks are ignored; any other
// trailing characters make the parse fail.
bool parseNumber(const std::string& text, double& out);

} // namespace timewarp
