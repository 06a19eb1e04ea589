#pragma once

#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace timewarp {

/**
 * Table-driven tokenizer shared by the three languages.
 *
 * Each language describes its lexical conventions in a LexerSpec (keywords,
 * operators, comment and quoting styles); the scanning loop itself is common.
 * All failures are reported as ParseError{line, column, message}.
 */
enum class TokenKind {
    Identifier,   // name (folded to upper case when the spec is case-insensitive)
    Keyword,      // identifier found in the keyword table
    Variable,     // Prolog-style variable (upper case or '_' initial)
    Number,       // numeric literal, value in Token::number
    String,       // quoted text literal, quotes removed
    QuotedAtom,   // Prolog 'quoted atom'
    Symbol,       // operator or punctuation from the operator table
    Newline,      // end of a source line (only when the spec asks for it)
    EndOfInput
};

struct Token {
    TokenKind kind{TokenKind::EndOfInput};
    std::string text;       // normalized text
    std::string raw;        // text as written in the source
    double number{0.0};
    int line{0};
    int column{0};
    bool spaceBefore{false}; // whitespace separates this token from the previous one
};

struct LexerSpec {
    std::unordered_set<std::string> keywords;
    bool caseInsensitive{false};
    std::vector<std::string> operators;          // longest match wins
    std::vector<std::string> lineComments;       // e.g. "'", "//", "%"
    std::vector<std::string> commentWords;       // e.g. "REM": rest of line is a comment
    std::vector<std::pair<std::string, std::string>> blockComments;
    std::string stringQuotes{"\""};              // quote chars producing String tokens
    std::string atomQuotes;                      // quote chars producing QuotedAtom tokens
    std::string identifierSuffixes;              // one trailing char allowed, e.g. "$"
    bool upperCaseVariables{false};              // Prolog variable convention
    bool newlineTokens{false};                   // emit Newline tokens
    bool leadingPointNumbers{false};             // ".5" is a number (BASIC)
};

const char* tokenKindName(TokenKind kind);

class Lexer {
public:
    explicit Lexer(LexerSpec spec);

    // Tokenize source text. Line/column numbering starts at firstLine/firstColumn
    // so a caller can tokenize a fragment of a larger buffer.
    std::vector<Token> tokenize(const std::string& source, int firstLine = 1, int firstColumn = 1) const;

    const LexerSpec& spec() const { return spec_; }

private:
    LexerSpec spec_;

    struct Scanner {
        const std::string& src;
        size_t pos{0};
        int line{1};
        int column{1};

        bool atEnd() const { return pos >= src.size(); }
        char peek(size_t offset = 0) const { return pos + offset < src.size() ? src[pos + offset] : '\0'; }
        bool startsWith(const std::string& s) const { return src.compare(pos, s.size(), s) == 0; }
        void advance();
    };

    std::string normalize(const std::string& word) const;
    bool isCommentWordAt(const Scanner& sc) const;
    bool skipBlockComment(Scanner& sc) const;
    Token scanNumber(Scanner& sc) const;
    Token scanQuoted(Scanner& sc, char quote, TokenKind kind) const;
    Token scanWord(Scanner& sc) const;
    bool scanOperator(Scanner& sc, Token& out) const;
};

} // namespace timewarp
