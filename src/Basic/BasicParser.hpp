#pragma once

#include <memory>
#include <string>

#include "BasicAst.hpp"
#include "../Lexer/Lexer.hpp"
#include "../Lexer/TokenCursor.hpp"

namespace timewarp {

/**
 * BasicParser
 *
 * Builds a basic::Program from TW BASIC source. Each physical line may start
 * with a line number (classic mode) or not (free-form mode); both can be
 * mixed in one program. A line is then one of:
 *   *LABEL                      PILOT label
 *   T: A: M: Y: N: J: U: E: C: R:   PILOT command (optionally TY:, TN:, T(expr):)
 *   BASIC / Logo statements separated by ':' or whitespace
 * Throws ParseError; never returns a partially built program.
 */
class BasicParser {
public:
    BasicParser();

    std::shared_ptr<const basic::Program> parse(const std::string& source);

    static LexerSpec lexerSpec();
    static bool isBuiltinFunction(const std::string& name);

private:
    Lexer lexer_;
    basic::Program* program_{nullptr};

    void parseLine(const std::string& text, size_t offset, int sourceLine, basic::Line& out);
    bool parsePilot(const std::string& text, size_t offset, int sourceLine, basic::Line& out);
    basic::ExprPtr parseFragmentExpr(const std::string& text, int line, int column);

    // Statements
    basic::StmtList parseStatements(TokenCursor& c, bool stopAtElse);
    basic::StmtPtr parseStatement(TokenCursor& c);
    basic::StmtPtr parsePrint(TokenCursor& c, const Token& at);
    basic::StmtPtr parseInput(TokenCursor& c, const Token& at);
    basic::StmtPtr parseIf(TokenCursor& c, const Token& at);
    basic::StmtPtr parseFor(TokenCursor& c, const Token& at);
    basic::StmtPtr parseDim(TokenCursor& c, const Token& at);
    basic::StmtPtr parseRepeat(TokenCursor& c, const Token& at);
    basic::StmtPtr parseTurtle(TokenCursor& c, const Token& at);
    basic::StmtPtr parseLet(TokenCursor& c, const Token& at);
    basic::Target parseTarget(TokenCursor& c);
    int parseLineNumber(TokenCursor& c);
    bool atStatementEnd(const TokenCursor& c) const;

    // Expressions (lowest to highest precedence)
    basic::ExprPtr parseExpr(TokenCursor& c);
    basic::ExprPtr parseAnd(TokenCursor& c);
    basic::ExprPtr parseNot(TokenCursor& c);
    basic::ExprPtr parseComparison(TokenCursor& c);
    basic::ExprPtr parseAdditive(TokenCursor& c);
    basic::ExprPtr parseTerm(TokenCursor& c);
    basic::ExprPtr parsePower(TokenCursor& c);
    basic::ExprPtr parseUnary(TokenCursor& c);
    basic::ExprPtr parsePrimary(TokenCursor& c);

    void noteName(const std::string& name);
};

} // namespace timewarp
