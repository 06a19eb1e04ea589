#include "Lexer.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "../Runtime/TWError.hpp"

namespace timewarp {

namespace {

bool isAlpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }
bool isWordChar(char c) { return isAlpha(c) || isDigit(c) || c == '_'; }

std::string toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::Identifier: return "identifier";
        case TokenKind::Keyword: return "keyword";
        case TokenKind::Variable: return "variable";
        case TokenKind::Number: return "number";
        case TokenKind::String: return "string";
        case TokenKind::QuotedAtom: return "quoted atom";
        case TokenKind::Symbol: return "symbol";
        case TokenKind::Newline: return "end of line";
        case TokenKind::EndOfInput: return "end of input";
    }
    return "token";
}

void Lexer::Scanner::advance() {
    if (atEnd()) return;
    if (src[pos] == '\n') {
        ++line;
        column = 1;
    } else {
        ++column;
    }
    ++pos;
}

Lexer::Lexer(LexerSpec spec) : spec_(std::move(spec)) {
    // Longest operators first so "<=" wins over "<".
    std::stable_sort(spec_.operators.begin(), spec_.operators.end(),
                     [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

std::string Lexer::normalize(const std::string& word) const {
    return spec_.caseInsensitive ? toUpperCase(word) : word;
}

bool Lexer::isCommentWordAt(const Scanner& sc) const {
    for (const auto& w : spec_.commentWords) {
        if (sc.pos + w.size() > sc.src.size()) continue;
        std::string candidate = sc.src.substr(sc.pos, w.size());
        if (normalize(candidate) != normalize(w)) continue;
        char after = sc.peek(w.size());
        if (!isWordChar(after)) return true;
    }
    return false;
}

bool Lexer::skipBlockComment(Scanner& sc) const {
    for (const auto& bc : spec_.blockComments) {
        if (!sc.startsWith(bc.first)) continue;
        int startLine = sc.line;
        int startColumn = sc.column;
        for (size_t i = 0; i < bc.first.size(); ++i) sc.advance();
        while (!sc.atEnd() && !sc.startsWith(bc.second)) sc.advance();
        if (sc.atEnd()) {
            throw ParseError(startLine, startColumn, "Unterminated comment");
        }
        for (size_t i = 0; i < bc.second.size(); ++i) sc.advance();
        return true;
    }
    return false;
}

Token Lexer::scanNumber(Scanner& sc) const {
    Token t;
    t.kind = TokenKind::Number;
    t.line = sc.line;
    t.column = sc.column;
    size_t start = sc.pos;
    while (isDigit(sc.peek())) sc.advance();
    // A fraction needs a digit after the point: "1..5" and a clause-ending "5." stay integers.
    if (sc.peek() == '.' && isDigit(sc.peek(1))) {
        sc.advance();
        while (isDigit(sc.peek())) sc.advance();
    }
    if (sc.peek() == 'e' || sc.peek() == 'E') {
        size_t look = 1;
        if (sc.peek(1) == '+' || sc.peek(1) == '-') look = 2;
        if (isDigit(sc.peek(look))) {
            for (size_t i = 0; i < look; ++i) sc.advance();
            while (isDigit(sc.peek())) sc.advance();
        }
    }
    t.raw = sc.src.substr(start, sc.pos - start);
    t.text = t.raw;
    t.number = std::strtod(t.raw.c_str(), nullptr);
    return t;
}

Token Lexer::scanQuoted(Scanner& sc, char quote, TokenKind kind) const {
    Token t;
    t.kind = kind;
    t.line = sc.line;
    t.column = sc.column;
    size_t start = sc.pos;
    sc.advance(); // opening quote
    std::string value;
    for (;;) {
        if (sc.atEnd() || sc.peek() == '\n') {
            throw ParseError(t.line, t.column, "Unterminated string literal");
        }
        char c = sc.peek();
        if (c == quote) {
            if (sc.peek(1) == quote) { // doubled quote escapes itself
                value.push_back(quote);
                sc.advance();
                sc.advance();
                continue;
            }
            sc.advance();
            break;
        }
        value.push_back(c);
        sc.advance();
    }
    t.raw = sc.src.substr(start, sc.pos - start);
    t.text = value;
    return t;
}

Token Lexer::scanWord(Scanner& sc) const {
    Token t;
    t.line = sc.line;
    t.column = sc.column;
    size_t start = sc.pos;
    while (isWordChar(sc.peek())) sc.advance();
    if (!spec_.identifierSuffixes.empty() && sc.peek() != '\0' &&
        spec_.identifierSuffixes.find(sc.peek()) != std::string::npos) {
        sc.advance();
    }
    t.raw = sc.src.substr(start, sc.pos - start);
    t.text = normalize(t.raw);
    char first = t.raw[0];
    if (spec_.upperCaseVariables && (first == '_' || std::isupper(static_cast<unsigned char>(first)))) {
        t.kind = TokenKind::Variable;
        t.text = t.raw;
    } else if (spec_.keywords.count(t.text)) {
        t.kind = TokenKind::Keyword;
    } else {
        t.kind = TokenKind::Identifier;
    }
    return t;
}

bool Lexer::scanOperator(Scanner& sc, Token& out) const {
    for (const auto& op : spec_.operators) {
        if (!sc.startsWith(op)) continue;
        out.kind = TokenKind::Symbol;
        out.line = sc.line;
        out.column = sc.column;
        out.raw = op;
        out.text = op;
        for (size_t i = 0; i < op.size(); ++i) sc.advance();
        return true;
    }
    return false;
}

std::vector<Token> Lexer::tokenize(const std::string& source, int firstLine, int firstColumn) const {
    std::vector<Token> tokens;
    Scanner sc{source};
    sc.line = firstLine;
    sc.column = firstColumn;
    bool spaceBefore = false;

    while (!sc.atEnd()) {
        char c = sc.peek();

        if (c == '\n') {
            if (spec_.newlineTokens) {
                Token nl;
                nl.kind = TokenKind::Newline;
                nl.line = sc.line;
                nl.column = sc.column;
                tokens.push_back(nl);
            }
            sc.advance();
            spaceBefore = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            sc.advance();
            spaceBefore = true;
            continue;
        }
        if (skipBlockComment(sc)) {
            spaceBefore = true;
            continue;
        }

        bool lineComment = false;
        for (const auto& lc : spec_.lineComments) {
            if (sc.startsWith(lc)) { lineComment = true; break; }
        }
        if (lineComment || isCommentWordAt(sc)) {
            while (!sc.atEnd() && sc.peek() != '\n') sc.advance();
            spaceBefore = true;
            continue;
        }

        Token t;
        if (isDigit(c) || (spec_.leadingPointNumbers && c == '.' && isDigit(sc.peek(1)))) {
            t = scanNumber(sc);
        } else if (spec_.stringQuotes.find(c) != std::string::npos) {
            t = scanQuoted(sc, c, TokenKind::String);
        } else if (!spec_.atomQuotes.empty() && spec_.atomQuotes.find(c) != std::string::npos) {
            t = scanQuoted(sc, c, TokenKind::QuotedAtom);
        } else if (isAlpha(c) || c == '_') {
            t = scanWord(sc);
        } else if (!scanOperator(sc, t)) {
            throw ParseError(sc.line, sc.column, std::string("Unexpected character '") + c + "'");
        }
        t.spaceBefore = spaceBefore;
        spaceBefore = false;
        tokens.push_back(std::move(t));
    }

    Token eof;
    eof.kind = TokenKind::EndOfInput;
    eof.line = sc.line;
    eof.column = sc.column;
    eof.spaceBefore = spaceBefore;
    tokens.push_back(eof);
    return tokens;
}

} // namespace timewarp
