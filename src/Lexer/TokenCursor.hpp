#pragma once

#include <string>
#include <vector>

#include "Lexer.hpp"

namespace timewarp {

// Read position over a token vector for the recursive-descent parsers.
// Every expect*/error helper throws ParseError at the offending token.
class TokenCursor {
public:
    explicit TokenCursor(std::vector<Token> tokens);

    const Token& peek(size_t ahead = 0) const;
    const Token& previous() const;
    const Token& advance();
    bool atEnd() const { return peek().kind == TokenKind::EndOfInput; }

    bool check(TokenKind kind) const { return peek().kind == kind; }
    bool checkSymbol(const std::string& symbol, size_t ahead = 0) const;
    bool checkKeyword(const std::string& keyword, size_t ahead = 0) const;
    bool checkWord(const std::string& word, size_t ahead = 0) const; // identifier or keyword text

    bool matchSymbol(const std::string& symbol);
    bool matchKeyword(const std::string& keyword);

    const Token& expect(TokenKind kind, const std::string& what);
    const Token& expectSymbol(const std::string& symbol);
    const Token& expectKeyword(const std::string& keyword);

    [[noreturn]] void error(const std::string& message) const;
    [[noreturn]] static void errorAt(const Token& token, const std::string& message);

    size_t position() const { return pos_; }
    void reset(size_t position) { pos_ = position; }

private:
    std::vector<Token> tokens_;
    size_t pos_{0};

    static std::string describe(const Token& token);
};

} // namespace timewarp
