#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace timewarp {

/**
 * TWError - runtime error raised by any of the three interpreters
 *
 * Carries an error code from ErrorCodes plus the source location of the
 * statement, clause or instruction that failed. The execution boundary turns
 * it into a single terminal RuntimeError event.
 */
class TWError : public std::runtime_error {
public:
    TWError(uint16_t errorCode, const std::string& message, int line = 0, int column = 0)
        : std::runtime_error(message), errorCode_(errorCode), line_(line), column_(column) {}

    uint16_t getErrorCode() const { return errorCode_; }
    int getLine() const { return line_; }
    int getColumn() const { return column_; }

    void setLine(int line) { line_ = line; }

private:
    uint16_t errorCode_;
    int line_;
    int column_;
};

/**
 * ParseError - malformed source text (lexing or parsing)
 *
 * Same {line, column, message} shape for every language so the host can
 * point at the editor buffer uniformly.
 */
class ParseError : public std::runtime_error {
public:
    ParseError(int line, int column, const std::string& message)
        : std::runtime_error(message), line_(line), column_(column) {}

    int getLine() const { return line_; }
    int getColumn() const { return column_; }

private:
    int line_;
    int column_;
};

// Error codes; numbering follows GW-BASIC where a matching code exists.
namespace ErrorCodes {
    constexpr uint16_t NEXT_WITHOUT_FOR = 1;
    constexpr uint16_t SYNTAX_ERROR = 2;
    constexpr uint16_t RETURN_WITHOUT_GOSUB = 3;
    constexpr uint16_t ILLEGAL_FUNCTION_CALL = 5;
    constexpr uint16_t OVERFLOW = 6;
    constexpr uint16_t OUT_OF_MEMORY = 7;
    constexpr uint16_t UNDEFINED_LINE_NUMBER = 8;
    constexpr uint16_t SUBSCRIPT_OUT_OF_RANGE = 9;
    constexpr uint16_t DUPLICATE_DEFINITION = 10;
    constexpr uint16_t DIVISION_BY_ZERO = 11;
    constexpr uint16_t TYPE_MISMATCH = 13;
    constexpr uint16_t UNDEFINED_USER_FUNCTION = 18;
    constexpr uint16_t UNDEFINED_VARIABLE = 30;
    constexpr uint16_t UNDEFINED_PREDICATE = 31;
    constexpr uint16_t FUNCTION_WITHOUT_RESULT = 32;
    constexpr uint16_t INSTANTIATION_ERROR = 33;
    constexpr uint16_t UNDEFINED_LABEL = 34;
    constexpr uint16_t INTERNAL_ERROR = 51;

    inline const char* name(uint16_t code) {
        switch (code) {
            case NEXT_WITHOUT_FOR: return "NextWithoutFor";
            case SYNTAX_ERROR: return "SyntaxError";
            case RETURN_WITHOUT_GOSUB: return "ReturnWithoutGosub";
            case ILLEGAL_FUNCTION_CALL: return "IllegalFunctionCall";
            case OVERFLOW: return "Overflow";
            case OUT_OF_MEMORY: return "OutOfMemory";
            case UNDEFINED_LINE_NUMBER: return "UndefinedLineNumber";
            case SUBSCRIPT_OUT_OF_RANGE: return "SubscriptOutOfRange";
            case DUPLICATE_DEFINITION: return "DuplicateDefinition";
            case DIVISION_BY_ZERO: return "DivisionByZero";
            case TYPE_MISMATCH: return "TypeMismatch";
            case UNDEFINED_USER_FUNCTION: return "UndefinedRoutine";
            case UNDEFINED_VARIABLE: return "UndefinedVariable";
            case UNDEFINED_PREDICATE: return "UndefinedPredicate";
            case FUNCTION_WITHOUT_RESULT: return "FunctionWithoutResult";
            case INSTANTIATION_ERROR: return "InstantiationError";
            case UNDEFINED_LABEL: return "UndefinedLabel";
            case INTERNAL_ERROR: return "InternalError";
            default: return "Error";
        }
    }
}

} // namespace timewarp
