#pragma once

#include <memory>
#include <string>

#include "PascalAst.hpp"
#include "../Lexer/Lexer.hpp"
#include "../Lexer/TokenCursor.hpp"

namespace timewarp {

// Recursive-descent parser for TW Pascal. Produces the block tree only; name
// resolution happens in PascalCompiler.
class PascalParser {
public:
    PascalParser();

    std::unique_ptr<pascal::Program> parse(const std::string& source);

    static LexerSpec lexerSpec();

private:
    Lexer lexer_;

    void parseDeclarations(TokenCursor& c, pascal::Block& block, pascal::Program* program);
    void parseConsts(TokenCursor& c, pascal::Block& block);
    void parseVars(TokenCursor& c, pascal::Block& block);
    pascal::Routine parseRoutine(TokenCursor& c, bool isFunction);
    pascal::TypeSpec parseType(TokenCursor& c, bool allowArray);
    long parseBound(TokenCursor& c, const pascal::Block& block);

    pascal::StmtList parseStatementList(TokenCursor& c);
    pascal::StmtPtr parseStatement(TokenCursor& c);
    pascal::StmtPtr parseCase(TokenCursor& c, const Token& at);
    pascal::StmtPtr parseWrite(TokenCursor& c, const Token& at, bool newline);
    pascal::StmtPtr parseRead(TokenCursor& c, const Token& at, bool newline);
    pascal::VarTarget parseTarget(TokenCursor& c);
    std::vector<pascal::ExprPtr> parseArgs(TokenCursor& c);

    pascal::ExprPtr parseExpr(TokenCursor& c);
    pascal::ExprPtr parseSimple(TokenCursor& c);
    pascal::ExprPtr parseTerm(TokenCursor& c);
    pascal::ExprPtr parseFactor(TokenCursor& c);

    const pascal::Block* globals_{nullptr};
};

} // namespace timewarp
