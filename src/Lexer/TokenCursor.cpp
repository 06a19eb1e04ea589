#include "TokenCursor.hpp"

#include "../Runtime/TWError.hpp"

namespace timewarp {

TokenCursor::TokenCursor(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().kind != TokenKind::EndOfInput) {
        Token eof;
        eof.kind = TokenKind::EndOfInput;
        if (!tokens_.empty()) {
            eof.line = tokens_.back().line;
            eof.column = tokens_.back().column + static_cast<int>(tokens_.back().raw.size());
        }
        tokens_.push_back(eof);
    }
}

const Token& TokenCursor::peek(size_t ahead) const {
    size_t i = pos_ + ahead;
    if (i >= tokens_.size()) return tokens_.back();
    return tokens_[i];
}

const Token& TokenCursor::previous() const {
    return pos_ == 0 ? tokens_.front() : tokens_[pos_ - 1];
}

const Token& TokenCursor::advance() {
    const Token& t = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) ++pos_;
    return t;
}

bool TokenCursor::checkSymbol(const std::string& symbol, size_t ahead) const {
    const Token& t = peek(ahead);
    return t.kind == TokenKind::Symbol && t.text == symbol;
}

bool TokenCursor::checkKeyword(const std::string& keyword, size_t ahead) const {
    const Token& t = peek(ahead);
    return t.kind == TokenKind::Keyword && t.text == keyword;
}

bool TokenCursor::checkWord(const std::string& word, size_t ahead) const {
    const Token& t = peek(ahead);
    return (t.kind == TokenKind::Keyword || t.kind == TokenKind::Identifier) && t.text == word;
}

bool TokenCursor::matchSymbol(const std::string& symbol) {
    if (!checkSymbol(symbol)) return false;
    advance();
    return true;
}

bool TokenCursor::matchKeyword(const std::string& keyword) {
    if (!checkKeyword(keyword)) return false;
    advance();
    return true;
}

const Token& TokenCursor::expect(TokenKind kind, const std::string& what) {
    if (peek().kind != kind) error("Expected " + what + " but found " + describe(peek()));
    return advance();
}

const Token& TokenCursor::expectSymbol(const std::string& symbol) {
    if (!checkSymbol(symbol)) error("Expected '" + symbol + "' but found " + describe(peek()));
    return advance();
}

const Token& TokenCursor::expectKeyword(const std::string& keyword) {
    if (!checkKeyword(keyword)) error("Expected " + keyword + " but found " + describe(peek()));
    return advance();
}

void TokenCursor::error(const std::string& message) const {
    errorAt(peek(), message);
}

void TokenCursor::errorAt(const Token& token, const std::string& message) {
    throw ParseError(token.line, token.column, message);
}

std::string TokenCursor::describe(const Token& token) {
    switch (token.kind) {
        case TokenKind::EndOfInput:
        case TokenKind::Newline:
            return tokenKindName(token.kind);
        default:
            return "'" + token.raw + "'";
    }
}

} // namespace timewarp
