#include "PascalParser.hpp"

#include <cmath>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace pascal;

const char* pascal::baseTypeName(BaseType type) {
    switch (type) {
        case BaseType::Integer: return "integer";
        case BaseType::Real: return "real";
        case BaseType::Boolean: return "boolean";
        case BaseType::String: return "string";
        case BaseType::Char: return "char";
    }
    return "type";
}

namespace {

template <typename Node>
ExprPtr makeExpr(Node node, const Token& at) {
    auto e = std::make_unique<Expr>();
    e->node = std::move(node);
    e->line = at.line;
    e->column = at.column;
    return e;
}

template <typename Node>
StmtPtr makeStmt(Node node, const Token& at) {
    auto s = std::make_unique<Stmt>();
    s->node = std::move(node);
    s->line = at.line;
    s->column = at.column;
    return s;
}

bool isStatementEnd(const TokenCursor& c) {
    return c.atEnd() || c.checkSymbol(";") || c.checkKeyword("END") || c.checkKeyword("UNTIL") ||
           c.checkKeyword("ELSE");
}

} // namespace

PascalParser::PascalParser() : lexer_(lexerSpec()) {}

LexerSpec PascalParser::lexerSpec() {
    LexerSpec spec;
    spec.caseInsensitive = true;
    spec.keywords = {
        "PROGRAM", "USES", "CONST", "VAR", "PROCEDURE", "FUNCTION", "BEGIN", "END",
        "IF", "THEN", "ELSE", "WHILE", "DO", "REPEAT", "UNTIL", "FOR", "TO", "DOWNTO",
        "CASE", "OF", "OTHERWISE", "DIV", "MOD", "AND", "OR", "NOT", "ARRAY", "TRUE", "FALSE",
        "EXIT", "HALT",
    };
    spec.operators = {":=", "<=", ">=", "<>", "..", "=", "<", ">", "+", "-", "*", "/",
                      "(", ")", "[", "]", ",", ";", ":", "."};
    spec.lineComments = {"//"};
    spec.blockComments = {{"{", "}"}, {"(*", "*)"}};
    spec.stringQuotes = "'";
    return spec;
}

std::unique_ptr<Program> PascalParser::parse(const std::string& source) {
    TokenCursor c(lexer_.tokenize(source));
    auto program = std::make_unique<Program>();
    globals_ = &program->main;

    if (c.matchKeyword("PROGRAM")) {
        program->name = c.expect(TokenKind::Identifier, "program name").raw;
        if (c.matchSymbol("(")) {
            do {
                c.expect(TokenKind::Identifier, "program parameter");
            } while (c.matchSymbol(","));
            c.expectSymbol(")");
        }
        c.expectSymbol(";");
    }
    if (c.matchKeyword("USES")) {
        do {
            c.expect(TokenKind::Identifier, "unit name");
        } while (c.matchSymbol(","));
        c.expectSymbol(";");
    }

    parseDeclarations(c, program->main, program.get());
    c.expectKeyword("BEGIN");
    program->main.body = parseStatementList(c);
    c.expectKeyword("END");
    c.expectSymbol(".");
    if (!c.atEnd()) c.error("Unexpected text after 'end.'");

    globals_ = nullptr;
    return program;
}

void PascalParser::parseDeclarations(TokenCursor& c, Block& block, Program* program) {
    for (;;) {
        if (c.matchKeyword("CONST")) {
            parseConsts(c, block);
        } else if (c.matchKeyword("VAR")) {
            parseVars(c, block);
        } else if (c.checkKeyword("PROCEDURE") || c.checkKeyword("FUNCTION")) {
            if (!program) c.error("Nested routines are not supported");
            bool isFunction = c.advance().text == "FUNCTION";
            program->routines.push_back(parseRoutine(c, isFunction));
        } else {
            return;
        }
    }
}

void PascalParser::parseConsts(TokenCursor& c, Block& block) {
    do {
        const Token& name = c.expect(TokenKind::Identifier, "constant name");
        ConstDecl decl;
        decl.name = name.text;
        decl.line = name.line;
        decl.column = name.column;
        c.expectSymbol("=");
        decl.value = parseExpr(c);
        c.expectSymbol(";");
        block.consts.push_back(std::move(decl));
    } while (c.check(TokenKind::Identifier));
}

void PascalParser::parseVars(TokenCursor& c, Block& block) {
    do {
        std::vector<Token> names;
        names.push_back(c.expect(TokenKind::Identifier, "variable name"));
        while (c.matchSymbol(",")) names.push_back(c.expect(TokenKind::Identifier, "variable name"));
        c.expectSymbol(":");
        TypeSpec type = parseType(c, true);
        c.expectSymbol(";");
        for (const auto& n : names) block.vars.push_back(VarDecl{n.text, type, n.line, n.column});
    } while (c.check(TokenKind::Identifier));
}

Routine PascalParser::parseRoutine(TokenCursor& c, bool isFunction) {
    Routine r;
    const Token& name = c.expect(TokenKind::Identifier, isFunction ? "function name" : "procedure name");
    r.name = name.text;
    r.displayName = name.raw;
    r.line = name.line;
    r.column = name.column;
    r.isFunction = isFunction;

    if (c.matchSymbol("(")) {
        if (!c.checkSymbol(")")) {
            do {
                bool byRef = c.matchKeyword("VAR");
                std::vector<std::string> names;
                names.push_back(c.expect(TokenKind::Identifier, "parameter name").text);
                while (c.matchSymbol(",")) names.push_back(c.expect(TokenKind::Identifier, "parameter name").text);
                c.expectSymbol(":");
                TypeSpec type = parseType(c, false);
                for (auto& n : names) r.params.push_back(Param{n, type, byRef});
            } while (c.matchSymbol(";"));
        }
        c.expectSymbol(")");
    }
    if (isFunction) {
        c.expectSymbol(":");
        r.returnType = parseType(c, false);
    }
    c.expectSymbol(";");

    parseDeclarations(c, r.block, nullptr);
    c.expectKeyword("BEGIN");
    r.block.body = parseStatementList(c);
    c.expectKeyword("END");
    c.expectSymbol(";");
    return r;
}

TypeSpec PascalParser::parseType(TokenCursor& c, bool allowArray) {
    TypeSpec t;
    if (c.checkKeyword("ARRAY")) {
        if (!allowArray) c.error("Array types are only allowed in variable declarations");
        c.advance();
        c.expectSymbol("[");
        const Block& scope = *globals_;
        t.low = parseBound(c, scope);
        c.expectSymbol("..");
        t.high = parseBound(c, scope);
        c.expectSymbol("]");
        if (t.high < t.low) c.error("Array upper bound is below the lower bound");
        if (t.high - t.low >= 1000000) c.error("Array too large");
        c.expectKeyword("OF");
        TypeSpec element = parseType(c, false);
        t.base = element.base;
        t.isArray = true;
        return t;
    }
    const Token& name = c.expect(TokenKind::Identifier, "type name");
    if (name.text == "INTEGER" || name.text == "LONGINT" || name.text == "BYTE" || name.text == "WORD") {
        t.base = BaseType::Integer;
    } else if (name.text == "REAL" || name.text == "DOUBLE") {
        t.base = BaseType::Real;
    } else if (name.text == "BOOLEAN") {
        t.base = BaseType::Boolean;
    } else if (name.text == "STRING") {
        t.base = BaseType::String;
        if (c.matchSymbol("[")) { // string[n]: length is not enforced
            c.expect(TokenKind::Number, "string length");
            c.expectSymbol("]");
        }
    } else if (name.text == "CHAR") {
        t.base = BaseType::Char;
    } else {
        TokenCursor::errorAt(name, "Unknown type '" + name.raw + "'");
    }
    return t;
}

long PascalParser::parseBound(TokenCursor& c, const Block& block) {
    bool negative = c.matchSymbol("-");
    const Token& t = c.peek();
    double value = 0.0;
    if (t.kind == TokenKind::Number) {
        value = t.number;
    } else if (t.kind == TokenKind::Identifier) {
        const ConstDecl* found = nullptr;
        for (const auto& k : block.consts) {
            if (k.name == t.text) found = &k;
        }
        const NumberLit* lit = found ? std::get_if<NumberLit>(&found->value->node) : nullptr;
        if (!lit) c.error("Array bound must be an integer constant");
        value = lit->value;
    } else {
        c.error("Expected an array bound");
    }
    if (value != std::floor(value)) c.error("Array bound must be an integer");
    c.advance();
    return static_cast<long>(negative ? -value : value);
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

StmtList PascalParser::parseStatementList(TokenCursor& c) {
    StmtList list;
    list.push_back(parseStatement(c));
    while (c.matchSymbol(";")) list.push_back(parseStatement(c));
    if (!c.checkKeyword("END") && !c.checkKeyword("UNTIL")) c.error("Expected ';' or END");
    return list;
}

StmtPtr PascalParser::parseStatement(TokenCursor& c) {
    const Token at = c.peek();
    if (isStatementEnd(c)) return makeStmt(EmptyStmt{}, at);

    if (c.matchKeyword("BEGIN")) {
        CompoundStmt block;
        block.body = parseStatementList(c);
        c.expectKeyword("END");
        return makeStmt(std::move(block), at);
    }
    if (c.matchKeyword("IF")) {
        IfStmt s;
        s.condition = parseExpr(c);
        c.expectKeyword("THEN");
        s.thenBranch = parseStatement(c);
        if (c.matchKeyword("ELSE")) s.elseBranch = parseStatement(c);
        return makeStmt(std::move(s), at);
    }
    if (c.matchKeyword("WHILE")) {
        WhileStmt s;
        s.condition = parseExpr(c);
        c.expectKeyword("DO");
        s.body = parseStatement(c);
        return makeStmt(std::move(s), at);
    }
    if (c.matchKeyword("REPEAT")) {
        RepeatStmt s;
        s.body = parseStatementList(c);
        c.expectKeyword("UNTIL");
        s.condition = parseExpr(c);
        return makeStmt(std::move(s), at);
    }
    if (c.matchKeyword("FOR")) {
        ForStmt s;
        s.var = c.expect(TokenKind::Identifier, "loop variable").text;
        c.expectSymbol(":=");
        s.start = parseExpr(c);
        if (c.matchKeyword("DOWNTO")) {
            s.downto = true;
        } else {
            c.expectKeyword("TO");
        }
        s.finish = parseExpr(c);
        c.expectKeyword("DO");
        s.body = parseStatement(c);
        return makeStmt(std::move(s), at);
    }
    if (c.matchKeyword("CASE")) return parseCase(c, at);
    if (c.matchKeyword("EXIT")) return makeStmt(ExitStmt{}, at);
    if (c.matchKeyword("HALT")) {
        if (c.matchSymbol("(")) {
            parseExpr(c);
            c.expectSymbol(")");
        }
        return makeStmt(HaltStmt{}, at);
    }

    if (!c.check(TokenKind::Identifier)) c.error("Expected a statement but found '" + at.raw + "'");

    if (c.checkSymbol(":=", 1) || c.checkSymbol("[", 1)) {
        AssignStmt s;
        s.target = parseTarget(c);
        c.expectSymbol(":=");
        s.value = parseExpr(c);
        return makeStmt(std::move(s), at);
    }

    const std::string name = c.advance().text;
    if (name == "WRITE" || name == "WRITELN") return parseWrite(c, at, name == "WRITELN");
    if (name == "READ" || name == "READLN") return parseRead(c, at, name == "READLN");

    CallStmt call;
    call.name = name;
    if (c.checkSymbol("(")) call.args = parseArgs(c);
    return makeStmt(std::move(call), at);
}

StmtPtr PascalParser::parseCase(TokenCursor& c, const Token& at) {
    CaseStmt s;
    s.selector = parseExpr(c);
    c.expectKeyword("OF");
    while (!c.checkKeyword("END") && !c.checkKeyword("ELSE") && !c.checkKeyword("OTHERWISE")) {
        CaseArm arm;
        do {
            const Token label = c.peek();
            ExprPtr low = parseSimple(c);
            if (c.matchSymbol("..")) {
                ExprPtr high = parseSimple(c);
                low = makeExpr(BinaryExpr{"..", std::move(low), std::move(high)}, label);
            }
            arm.labels.push_back(std::move(low));
        } while (c.matchSymbol(","));
        c.expectSymbol(":");
        arm.body = parseStatement(c);
        s.arms.push_back(std::move(arm));
        if (!c.matchSymbol(";")) break;
    }
    if (c.matchKeyword("ELSE") || c.matchKeyword("OTHERWISE")) {
        s.hasElse = true;
        s.elseBody = parseStatementList(c);
    }
    c.expectKeyword("END");
    return makeStmt(std::move(s), at);
}

StmtPtr PascalParser::parseWrite(TokenCursor& c, const Token& at, bool newline) {
    WriteStmt s;
    s.newline = newline;
    if (c.matchSymbol("(")) {
        if (!c.checkSymbol(")")) {
            do {
                WriteArg arg;
                arg.value = parseExpr(c);
                if (c.matchSymbol(":")) {
                    arg.width = parseExpr(c);
                    if (c.matchSymbol(":")) arg.decimals = parseExpr(c);
                }
                s.args.push_back(std::move(arg));
            } while (c.matchSymbol(","));
        }
        c.expectSymbol(")");
    }
    return makeStmt(std::move(s), at);
}

StmtPtr PascalParser::parseRead(TokenCursor& c, const Token& at, bool newline) {
    ReadStmt s;
    s.newline = newline;
    if (c.matchSymbol("(")) {
        if (!c.checkSymbol(")")) {
            do {
                s.targets.push_back(parseTarget(c));
            } while (c.matchSymbol(","));
        }
        c.expectSymbol(")");
    }
    if (!newline && s.targets.empty()) TokenCursor::errorAt(at, "read needs at least one variable");
    return makeStmt(std::move(s), at);
}

VarTarget PascalParser::parseTarget(TokenCursor& c) {
    const Token& name = c.expect(TokenKind::Identifier, "variable");
    VarTarget t;
    t.name = name.text;
    t.line = name.line;
    t.column = name.column;
    if (c.matchSymbol("[")) {
        t.index = parseExpr(c);
        c.expectSymbol("]");
    }
    return t;
}

std::vector<ExprPtr> PascalParser::parseArgs(TokenCursor& c) {
    std::vector<ExprPtr> args;
    c.expectSymbol("(");
    if (!c.checkSymbol(")")) {
        do {
            args.push_back(parseExpr(c));
        } while (c.matchSymbol(","));
    }
    c.expectSymbol(")");
    return args;
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ExprPtr PascalParser::parseExpr(TokenCursor& c) {
    static const char* const relops[] = {"=", "<>", "<", ">", "<=", ">="};
    ExprPtr left = parseSimple(c);
    for (const char* op : relops) {
        if (c.checkSymbol(op)) {
            const Token t = c.advance();
            ExprPtr right = parseSimple(c);
            return makeExpr(BinaryExpr{op, std::move(left), std::move(right)}, t);
        }
    }
    return left;
}

ExprPtr PascalParser::parseSimple(TokenCursor& c) {
    ExprPtr left = parseTerm(c);
    for (;;) {
        std::string op;
        if (c.checkSymbol("+") || c.checkSymbol("-")) {
            op = c.peek().text;
        } else if (c.checkKeyword("OR")) {
            op = "OR";
        } else {
            return left;
        }
        const Token t = c.advance();
        ExprPtr right = parseTerm(c);
        left = makeExpr(BinaryExpr{op, std::move(left), std::move(right)}, t);
    }
}

ExprPtr PascalParser::parseTerm(TokenCursor& c) {
    ExprPtr left = parseFactor(c);
    for (;;) {
        std::string op;
        if (c.checkSymbol("*") || c.checkSymbol("/")) {
            op = c.peek().text;
        } else if (c.checkKeyword("DIV") || c.checkKeyword("MOD") || c.checkKeyword("AND")) {
            op = c.peek().text;
        } else {
            return left;
        }
        const Token t = c.advance();
        ExprPtr right = parseFactor(c);
        left = makeExpr(BinaryExpr{op, std::move(left), std::move(right)}, t);
    }
}

ExprPtr PascalParser::parseFactor(TokenCursor& c) {
    const Token t = c.peek();
    switch (t.kind) {
        case TokenKind::Number: {
            c.advance();
            bool integral = t.raw.find_first_of(".eE") == std::string::npos;
            return makeExpr(NumberLit{t.number, integral}, t);
        }
        case TokenKind::String:
            c.advance();
            return makeExpr(StringLit{t.text}, t);
        case TokenKind::Keyword:
            if (t.text == "TRUE" || t.text == "FALSE") {
                c.advance();
                return makeExpr(BoolLit{t.text == "TRUE"}, t);
            }
            if (t.text == "NOT") {
                c.advance();
                return makeExpr(UnaryExpr{"NOT", parseFactor(c)}, t);
            }
            break;
        case TokenKind::Symbol:
            if (t.text == "(") {
                c.advance();
                ExprPtr inner = parseExpr(c);
                c.expectSymbol(")");
                return inner;
            }
            if (t.text == "-") {
                c.advance();
                return makeExpr(UnaryExpr{"-", parseFactor(c)}, t);
            }
            if (t.text == "+") {
                c.advance();
                return parseFactor(c);
            }
            break;
        case TokenKind::Identifier: {
            c.advance();
            if (c.matchSymbol("[")) {
                ExprPtr index = parseExpr(c);
                c.expectSymbol("]");
                return makeExpr(IndexRef{t.text, std::move(index)}, t);
            }
            if (c.checkSymbol("(")) {
                CallExpr call;
                call.name = t.text;
                call.args = parseArgs(c);
                return makeExpr(std::move(call), t);
            }
            return makeExpr(NameRef{t.text}, t);
        }
        default:
            break;
    }
    if (t.kind == TokenKind::EndOfInput) c.error("Expected an expression");
    c.error("Unexpected '" + t.raw + "' in expression");
}

} // namespace timewarp
