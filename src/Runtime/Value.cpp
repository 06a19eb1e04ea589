#include "Value.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace timewarp {

std::string formatNumber(double v) {
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v < 0 ? "-Infinity" : "Infinity";
    if (v == std::floor(v) && std::fabs(v) < 1e15) {
        std::ostringstream os;
        os << static_cast<long long>(v);
        return os.str();
    }
    std::ostringstream os;
    os << std::setprecision(10) << v;
    return os.str();
}

bool parseNumber(const std::string& text, double& out) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (start == end) return false;

    std::string trimmed = text.substr(start, end - start);
    const char* begin = trimmed.c_str();
    char* stop = nullptr;
    errno = 0;
    double v = std::strtod(begin, &stop);
    if (stop != begin + trimmed.size() || errno == ERANGE) return false;
    if (!std::isfinite(v)) return false;
    out = v;
    return true;
}

const char* typeName(ValueType type) {
    switch (type) {
        case ValueType::Number: return "number";
        case ValueType::Text: return "text";
        case ValueType::Boolean: return "boolean";
        case ValueType::List: return "list";
    }
    return "unknown";
}

std::string Value::toString() const {
    switch (type) {
        case ValueType::Number: return formatNumber(num);
        case ValueType::Text: return text;
        case ValueType::Boolean: return flag ? "TRUE" : "FALSE";
        case ValueType::List: {
            std::string s = "[";
            for (size_t i = 0; i < items.size(); ++i) {
                if (i) s += ", ";
                s += items[i].toString();
            }
            s += "]";
            return s;
        }
    }
    return {};
}

bool Value::equals(const Value& other) const {
    if (type != other.type) return false;
    switch (type) {
        case ValueType::Number: return num == other.num;
        case ValueType::Text: return text == other.text;
        case ValueType::Boolean: return flag == other.flag;
        case ValueType::List:
            if (items.size() != other.items.size()) return false;
            for (size_t i = 0; i < items.size(); ++i) {
                if (!items[i].equals(other.items[i])) return false;
            }
            return true;
    }
    return false;
}

} // namespace timewarp
