// Variable table with '$'-suffix typing and DIM arrays.
#pragma once

#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

#include "TWError.hpp"
#include "Value.hpp"

namespace timewarp {

/**
 * VariableTable - the single global scope of a TW BASIC program.
 *
 * Names arrive upper-cased from the parser. A trailing '$' makes a text
 * variable, anything else is numeric. Reading a scalar that was never
 * assigned is an error; array elements start out as 0 or "".
 */
class VariableTable {
public:
    // Arrays used without DIM get indices 0..10.
    static constexpr long kDefaultArrayBound = 10;

    static bool isTextName(const std::string& name) {
        return !name.empty() && name.back() == '$';
    }

    // Converts v to the storage type of `name`; booleans become -1 / 0 in
    // numeric variables.
    static Value coerceFor(const std::string& name, const Value& v) {
        if (isTextName(name)) {
            if (!v.isText()) {
                throw TWError(ErrorCodes::TYPE_MISMATCH, "Cannot store a " + std::string(typeName(v.type)) +
                                                             " in text variable " + name);
            }
            return v;
        }
        if (v.isNumber()) return v;
        if (v.isBoolean()) return Value::makeNumber(v.flag ? -1.0 : 0.0);
        throw TWError(ErrorCodes::TYPE_MISMATCH, "Cannot store a " + std::string(typeName(v.type)) +
                                                     " in numeric variable " + name);
    }

    bool has(const std::string& name) const { return scalars_.count(name) != 0; }

    const Value* tryGet(const std::string& name) const {
        auto it = scalars_.find(name);
        return it == scalars_.end() ? nullptr : &it->second;
    }

    const Value& get(const std::string& name) const {
        auto it = scalars_.find(name);
        if (it == scalars_.end()) {
            throw TWError(ErrorCodes::UNDEFINED_VARIABLE, "Undefined variable " + name);
        }
        return it->second;
    }

    void set(const std::string& name, const Value& value) {
        scalars_[name] = coerceFor(name, value);
    }

    // DIM name(bound): elements 0..bound.
    void dimArray(const std::string& name, double bound) {
        if (arrays_.count(name)) {
            throw TWError(ErrorCodes::DUPLICATE_DEFINITION, "Array " + name + " already dimensioned");
        }
        if (bound < 0 || bound != std::floor(bound)) {
            throw TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, "Invalid array size for " + name);
        }
        if (bound > 1000000) {
            throw TWError(ErrorCodes::OUT_OF_MEMORY, "Array " + name + " too large");
        }
        allocate(name, static_cast<long>(bound));
    }

    bool isArray(const std::string& name) const { return arrays_.count(name) != 0; }

    Value getElement(const std::string& name, double index) {
        std::vector<Value>& items = arrayFor(name);
        return items[checkIndex(name, items, index)];
    }

    void setElement(const std::string& name, double index, const Value& value) {
        std::vector<Value>& items = arrayFor(name);
        items[checkIndex(name, items, index)] = coerceFor(name, value);
    }

    void clear() {
        scalars_.clear();
        arrays_.clear();
    }

    std::size_t size() const { return scalars_.size() + arrays_.size(); }

private:
    std::unordered_map<std::string, Value> scalars_;
    std::unordered_map<std::string, std::vector<Value>> arrays_;

    void allocate(const std::string& name, long bound) {
        Value init = isTextName(name) ? Value::makeText("") : Value::makeNumber(0.0);
        arrays_[name] = std::vector<Value>(static_cast<size_t>(bound) + 1, init);
    }

    std::vector<Value>& arrayFor(const std::string& name) {
        auto it = arrays_.find(name);
        if (it == arrays_.end()) {
            allocate(name, kDefaultArrayBound);
            it = arrays_.find(name);
        }
        return it->second;
    }

    static size_t checkIndex(const std::string& name, const std::vector<Value>& items, double index) {
        double i = std::floor(index + 0.5);
        if (!std::isfinite(i) || i < 0 || i >= static_cast<double>(items.size())) {
            throw TWError(ErrorCodes::SUBSCRIPT_OUT_OF_RANGE,
                          "Subscript " + formatNumber(index) + " out of range for " + name);
        }
        return static_cast<size_t>(i);
    }
};

} // namespace timewarp
