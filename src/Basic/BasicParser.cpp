#include "BasicParser.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <tuple>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace basic;

namespace {

struct BuiltinArity {
    int minArgs;
    int maxArgs;
};

const std::map<std::string, BuiltinArity>& builtinTable() {
    static const std::map<std::string, BuiltinArity> table = {
        {"ABS", {1, 1}}, {"INT", {1, 1}}, {"SGN", {1, 1}}, {"SQR", {1, 1}},
        {"SIN", {1, 1}}, {"COS", {1, 1}}, {"TAN", {1, 1}}, {"ATN", {1, 1}},
        {"LOG", {1, 1}}, {"EXP", {1, 1}}, {"RND", {0, 1}},
        {"LEN", {1, 1}}, {"VAL", {1, 1}}, {"ASC", {1, 1}},
        {"STR$", {1, 1}}, {"CHR$", {1, 1}},
        {"LEFT$", {2, 2}}, {"RIGHT$", {2, 2}}, {"MID$", {2, 3}},
        {"UCASE$", {1, 1}}, {"LCASE$", {1, 1}},
    };
    return table;
}

struct TurtleWord {
    TurtleCommand::Kind kind;
    int args; // -1: colour argument
};

const std::map<std::string, TurtleWord>& turtleWords() {
    using K = TurtleCommand::Kind;
    static const std::map<std::string, TurtleWord> table = {
        {"FORWARD", {K::Forward, 1}}, {"FD", {K::Forward, 1}},
        {"BACK", {K::Back, 1}}, {"BK", {K::Back, 1}},
        {"RIGHT", {K::Right, 1}}, {"RT", {K::Right, 1}},
        {"LEFT", {K::Left, 1}}, {"LT", {K::Left, 1}},
        {"PENUP", {K::PenUp, 0}}, {"PU", {K::PenUp, 0}},
        {"PENDOWN", {K::PenDown, 0}}, {"PD", {K::PenDown, 0}},
        {"HOME", {K::Home, 0}},
        {"SETXY", {K::SetXY, 2}},
        {"SETHEADING", {K::SetHeading, 1}}, {"SETH", {K::SetHeading, 1}},
        {"SETCOLOR", {K::SetColor, -1}},
        {"SETPENSIZE", {K::SetPenSize, 1}},
        {"CIRCLE", {K::Circle, 1}},
        {"CLEARSCREEN", {K::Clear, 0}}, {"CS", {K::Clear, 0}}, {"CLS", {K::Clear, 0}},
        {"SHOWTURTLE", {K::ShowTurtle, 0}}, {"ST", {K::ShowTurtle, 0}},
        {"HIDETURTLE", {K::HideTurtle, 0}}, {"HT", {K::HideTurtle, 0}},
    };
    return table;
}

const char* const kColorWords[] = {
    "black", "blue", "green", "cyan", "red", "magenta", "brown", "lightgray",
    "darkgray", "lightblue", "lightgreen", "lightcyan", "lightred", "lightmagenta",
    "yellow", "white", "orange", "purple", "pink", "gray", "grey",
};

bool isColorWord(const std::string& lower) {
    for (const char* w : kColorWords) {
        if (lower == w) return true;
    }
    return false;
}

// Keywords that are part of an expression or statement tail rather than a statement start.
bool isClauseKeyword(const std::string& word) {
    return word == "AND" || word == "OR" || word == "NOT" || word == "MOD" || word == "THEN" ||
           word == "ELSE" || word == "TO" || word == "STEP";
}

std::string toUpper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

std::string toLower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

size_t skipSpaces(const std::string& s, size_t pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    return pos;
}

template <typename Node>
ExprPtr makeExpr(Node node, const Token& at) {
    auto e = std::make_unique<Expr>();
    e->node = std::move(node);
    e->line = at.line;
    e->column = at.column;
    return e;
}

template <typename Node>
StmtPtr makeStmt(Node node, int line, int column) {
    auto s = std::make_unique<Stmt>();
    s->node = std::move(node);
    s->line = line;
    s->column = column;
    return s;
}

template <typename Node>
StmtPtr makeStmt(Node node, const Token& at) {
    return makeStmt(std::move(node), at.line, at.column);
}

// Logo variable " :NAME": the colon follows a blank and the name is glued to it.
bool atLogoVariable(const TokenCursor& c) {
    return c.checkSymbol(":") && c.peek().spaceBefore && c.peek(1).kind == TokenKind::Identifier &&
           !c.peek(1).spaceBefore;
}

} // namespace

BasicParser::BasicParser() : lexer_(lexerSpec()) {}

LexerSpec BasicParser::lexerSpec() {
    LexerSpec spec;
    spec.caseInsensitive = true;
    spec.keywords = {
        "PRINT", "LET", "INPUT", "GOTO", "GOSUB", "RETURN", "IF", "THEN", "ELSE",
        "END", "STOP", "FOR", "TO", "STEP", "NEXT", "DIM", "AND", "OR", "NOT", "MOD",
        "REPEAT",
    };
    for (const auto& entry : turtleWords()) spec.keywords.insert(entry.first);
    spec.operators = {"<=", ">=", "<>", "=", "<", ">", "+", "-", "*", "/", "^",
                      "(", ")", ",", ";", ":", "[", "]", "?"};
    spec.lineComments = {"'"};
    spec.commentWords = {"REM"};
    spec.stringQuotes = "\"";
    spec.identifierSuffixes = "$";
    spec.leadingPointNumbers = true;
    return spec;
}

bool BasicParser::isBuiltinFunction(const std::string& name) {
    return builtinTable().count(name) != 0;
}

std::shared_ptr<const Program> BasicParser::parse(const std::string& source) {
    auto program = std::make_shared<Program>();
    program_ = program.get();

    struct Pending {
        int key;
        int order; // numbered lines first among equal keys
        size_t seq;
        Line line;
    };
    std::vector<Pending> pending;
    std::map<int, int> seenNumbers;

    int lastNumber = -1;
    size_t start = 0;
    int sourceLine = 0;
    while (start <= source.size()) {
        size_t end = source.find('\n', start);
        if (end == std::string::npos) end = source.size();
        std::string text = source.substr(start, end - start);
        if (!text.empty() && text.back() == '\r') text.pop_back();
        ++sourceLine;
        start = end + 1;

        size_t pos = skipSpaces(text, 0);
        if (pos >= text.size()) {
            if (end == source.size()) break;
            continue;
        }

        Line line;
        line.sourceLine = sourceLine;
        if (std::isdigit(static_cast<unsigned char>(text[pos]))) {
            size_t digitsEnd = pos;
            while (digitsEnd < text.size() && std::isdigit(static_cast<unsigned char>(text[digitsEnd]))) ++digitsEnd;
            std::string digits = text.substr(pos, digitsEnd - pos);
            if (digits.size() > 9) {
                throw ParseError(sourceLine, static_cast<int>(pos) + 1, "Line number too large");
            }
            line.number = std::stoi(digits);
            auto dup = seenNumbers.find(line.number);
            if (dup != seenNumbers.end()) {
                throw ParseError(sourceLine, static_cast<int>(pos) + 1,
                                 "Duplicate line number " + digits + " (first used on line " +
                                     std::to_string(dup->second) + ")");
            }
            seenNumbers[line.number] = sourceLine;
            lastNumber = line.number;
            pos = skipSpaces(text, digitsEnd);
        }

        if (pos < text.size()) parseLine(text, pos, sourceLine, line);

        Pending p;
        p.key = line.number >= 0 ? line.number : lastNumber;
        p.order = line.number >= 0 ? 0 : 1;
        p.seq = pending.size();
        p.line = std::move(line);
        pending.push_back(std::move(p));

        if (end == source.size()) break;
    }

    std::stable_sort(pending.begin(), pending.end(), [](const Pending& a, const Pending& b) {
        return std::tie(a.key, a.order, a.seq) < std::tie(b.key, b.order, b.seq);
    });

    for (auto& p : pending) {
        size_t index = program->lines.size();
        if (p.line.number >= 0) program->lineIndex[p.line.number] = index;
        for (const auto& stmt : p.line.statements) {
            if (auto* label = std::get_if<LabelStmt>(&stmt->node)) {
                if (program->labelIndex.count(label->name)) {
                    throw ParseError(stmt->line, stmt->column, "Duplicate label *" + label->name);
                }
                program->labelIndex[label->name] = index;
            }
        }
        program->lines.push_back(std::move(p.line));
    }

    program_ = nullptr;
    return program;
}

void BasicParser::parseLine(const std::string& text, size_t offset, int sourceLine, Line& out) {
    // *LABEL
    if (text[offset] == '*') {
        size_t p = offset + 1;
        size_t nameStart = p;
        while (p < text.size() && (std::isalnum(static_cast<unsigned char>(text[p])) || text[p] == '_')) ++p;
        if (p == nameStart) {
            throw ParseError(sourceLine, static_cast<int>(offset) + 1, "Missing label name after '*'");
        }
        std::string rest = trim(text.substr(p));
        if (!rest.empty() && rest[0] != '\'') {
            throw ParseError(sourceLine, static_cast<int>(p) + 1, "Unexpected text after label");
        }
        out.statements.push_back(
            makeStmt(LabelStmt{toUpper(text.substr(nameStart, p - nameStart))}, sourceLine, static_cast<int>(offset) + 1));
        return;
    }

    if (parsePilot(text, offset, sourceLine, out)) return;

    TokenCursor c(lexer_.tokenize(text.substr(offset), sourceLine, static_cast<int>(offset) + 1));
    out.statements = parseStatements(c, false);
    if (!c.atEnd()) c.error("Unexpected " + std::string(c.checkKeyword("ELSE") ? "ELSE" : "'" + c.peek().raw + "'"));
}

bool BasicParser::parsePilot(const std::string& text, size_t offset, int sourceLine, Line& out) {
    static const std::string commands = "TAMYNJUECR";
    char cmd = static_cast<char>(std::toupper(static_cast<unsigned char>(text[offset])));
    if (commands.find(cmd) == std::string::npos) return false;

    size_t p = offset + 1;
    PilotGuard guard;
    if (p < text.size()) {
        char g = static_cast<char>(std::toupper(static_cast<unsigned char>(text[p])));
        if (g == 'Y' || g == 'N') {
            size_t after = skipSpaces(text, p + 1);
            if (after < text.size() && (text[after] == ':' || text[after] == '(')) {
                guard.kind = g == 'Y' ? PilotGuard::Kind::Yes : PilotGuard::Kind::No;
                p = p + 1;
            }
        }
    }
    p = skipSpaces(text, p);
    size_t condStart = std::string::npos;
    size_t condEnd = std::string::npos;
    if (p < text.size() && text[p] == '(') {
        int depth = 0;
        size_t q = p;
        bool inString = false;
        for (; q < text.size(); ++q) {
            char ch = text[q];
            if (ch == '"') inString = !inString;
            if (inString) continue;
            if (ch == '(') ++depth;
            if (ch == ')' && --depth == 0) break;
        }
        if (q >= text.size()) return false;
        condStart = p + 1;
        condEnd = q;
        p = skipSpaces(text, q + 1);
    }
    if (p >= text.size() || text[p] != ':') return false;

    // It is a PILOT line from here on; "T:" cannot start a BASIC statement.
    const int column = static_cast<int>(offset) + 1;
    if (condStart != std::string::npos) {
        if (guard.kind != PilotGuard::Kind::None) {
            throw ParseError(sourceLine, static_cast<int>(condStart), "A PILOT command takes one guard");
        }
        guard.kind = PilotGuard::Kind::Condition;
        guard.condition = parseFragmentExpr(text.substr(condStart, condEnd - condStart), sourceLine,
                                            static_cast<int>(condStart) + 1);
    }
    if (cmd == 'Y' || cmd == 'N') {
        if (guard.kind != PilotGuard::Kind::None) {
            throw ParseError(sourceLine, column, std::string(1, cmd) + ": already carries a guard");
        }
        guard.kind = cmd == 'Y' ? PilotGuard::Kind::Yes : PilotGuard::Kind::No;
    }

    const size_t bodyStart = p + 1;
    const std::string body = text.substr(bodyStart);
    StmtPtr stmt;

    switch (cmd) {
        case 'T':
        case 'Y':
        case 'N': {
            size_t b = skipSpaces(body, 0);
            stmt = makeStmt(PilotTypeStmt{body.substr(b)}, sourceLine, column);
            break;
        }
        case 'A': {
            PilotAcceptStmt accept;
            std::string name = trim(body);
            if (!name.empty()) {
                std::string target;
                if (name[0] == '$') {
                    target = toUpper(name.substr(1)) + "$";
                } else if (name[0] == '#') {
                    target = toUpper(name.substr(1));
                } else {
                    target = toUpper(name);
                }
                std::string base = isTextName(target) ? target.substr(0, target.size() - 1) : target;
                bool valid = !base.empty() && std::isalpha(static_cast<unsigned char>(base[0]));
                for (char ch : base) {
                    if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '_') valid = false;
                }
                if (!valid) {
                    throw ParseError(sourceLine, static_cast<int>(bodyStart) + 1, "Invalid A: variable '" + name + "'");
                }
                noteName(target);
                accept.target = Target{target, nullptr};
            }
            stmt = makeStmt(std::move(accept), sourceLine, column);
            break;
        }
        case 'M': {
            PilotMatchStmt match;
            size_t from = 0;
            while (from <= body.size()) {
                size_t comma = body.find(',', from);
                if (comma == std::string::npos) comma = body.size();
                std::string alt = trim(body.substr(from, comma - from));
                if (!alt.empty()) match.alternatives.push_back(toUpper(alt));
                from = comma + 1;
            }
            stmt = makeStmt(std::move(match), sourceLine, column);
            break;
        }
        case 'J':
        case 'U': {
            std::string label = trim(body);
            if (!label.empty() && label[0] == '*') label = trim(label.substr(1));
            if (label.empty()) {
                throw ParseError(sourceLine, static_cast<int>(bodyStart) + 1, "Missing label");
            }
            stmt = makeStmt(PilotJumpStmt{toUpper(label), cmd == 'U'}, sourceLine, column);
            break;
        }
        case 'E':
            stmt = makeStmt(PilotEndStmt{}, sourceLine, column);
            break;
        case 'C': {
            TokenCursor c(lexer_.tokenize(body, sourceLine, static_cast<int>(bodyStart) + 1));
            const Token at = c.peek();
            c.matchKeyword("LET");
            stmt = parseLet(c, at);
            if (!c.atEnd()) c.error("Unexpected '" + c.peek().raw + "' in C:");
            break;
        }
        case 'R':
        default:
            return true; // remark
    }

    stmt->guard = std::move(guard);
    out.statements.push_back(std::move(stmt));
    return true;
}

ExprPtr BasicParser::parseFragmentExpr(const std::string& text, int line, int column) {
    TokenCursor c(lexer_.tokenize(text, line, column));
    if (c.atEnd()) c.error("Missing condition");
    ExprPtr e = parseExpr(c);
    if (!c.atEnd()) c.error("Unexpected '" + c.peek().raw + "' in condition");
    return e;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

bool BasicParser::atStatementEnd(const TokenCursor& c) const {
    return c.atEnd() || (c.checkSymbol(":") && !atLogoVariable(c)) || c.checkSymbol("]") || c.checkKeyword("ELSE");
}

StmtList BasicParser::parseStatements(TokenCursor& c, bool stopAtElse) {
    StmtList list;
    for (;;) {
        while (c.matchSymbol(":")) {}
        if (c.atEnd() || c.checkSymbol("]")) break;
        if (c.checkKeyword("ELSE")) {
            if (stopAtElse) break;
            c.error("ELSE without IF");
        }
        list.push_back(parseStatement(c));
    }
    return list;
}

StmtPtr BasicParser::parseStatement(TokenCursor& c) {
    const Token at = c.peek();

    if (at.kind == TokenKind::Symbol && at.text == "?") {
        c.advance();
        return parsePrint(c, at);
    }
    if (at.kind == TokenKind::Identifier) {
        return parseLet(c, at);
    }
    if (at.kind != TokenKind::Keyword) {
        c.error("Expected a statement but found '" + at.raw + "'");
    }

    const std::string& word = at.text;
    if (turtleWords().count(word)) {
        c.advance();
        return parseTurtle(c, at);
    }
    c.advance();
    if (word == "PRINT") return parsePrint(c, at);
    if (word == "LET") return parseLet(c, at);
    if (word == "INPUT") return parseInput(c, at);
    if (word == "GOTO") return makeStmt(GotoStmt{parseLineNumber(c)}, at);
    if (word == "GOSUB") return makeStmt(GosubStmt{parseLineNumber(c)}, at);
    if (word == "RETURN") return makeStmt(ReturnStmt{}, at);
    if (word == "END" || word == "STOP") return makeStmt(EndStmt{}, at);
    if (word == "IF") return parseIf(c, at);
    if (word == "FOR") return parseFor(c, at);
    if (word == "NEXT") {
        NextStmt next;
        if (c.check(TokenKind::Identifier)) next.var = c.advance().text;
        return makeStmt(std::move(next), at);
    }
    if (word == "DIM") return parseDim(c, at);
    if (word == "REPEAT") return parseRepeat(c, at);

    TokenCursor::errorAt(at, "Unexpected " + word);
}

StmtPtr BasicParser::parsePrint(TokenCursor& c, const Token& at) {
    PrintStmt print;
    bool trailingSeparator = false;
    for (;;) {
        if (atStatementEnd(c)) break;
        if (c.check(TokenKind::Keyword) && !isClauseKeyword(c.peek().text)) break; // Logo: next command
        if (c.checkSymbol(";") || c.checkSymbol(",")) {
            char sep = c.advance().text[0];
            if (print.items.empty() || print.items.back().separator != '\0') {
                // leading or doubled separator: an empty item keeps the zone/spacing
                PrintStmt::Item empty;
                empty.expr = makeExpr(TextLit{""}, c.previous());
                print.items.push_back(std::move(empty));
            }
            print.items.back().separator = sep;
            trailingSeparator = true;
            continue;
        }
        PrintStmt::Item item;
        item.expr = parseExpr(c);
        print.items.push_back(std::move(item));
        trailingSeparator = false;
    }
    print.newline = !trailingSeparator;
    return makeStmt(std::move(print), at);
}

StmtPtr BasicParser::parseInput(TokenCursor& c, const Token& at) {
    InputStmt input;
    if (c.check(TokenKind::String)) {
        input.prompt = c.advance().text;
        if (!c.matchSymbol(";") && !c.matchSymbol(",")) c.error("Expected ';' after INPUT prompt");
    }
    input.targets.push_back(parseTarget(c));
    while (c.matchSymbol(",")) input.targets.push_back(parseTarget(c));
    return makeStmt(std::move(input), at);
}

StmtPtr BasicParser::parseIf(TokenCursor& c, const Token& at) {
    IfStmt stmt;
    stmt.condition = parseExpr(c);

    auto branch = [&](StmtList& out) {
        if (c.check(TokenKind::Number)) {
            const Token& n = c.peek();
            out.push_back(makeStmt(GotoStmt{parseLineNumber(c)}, n));
        } else {
            out = parseStatements(c, true);
        }
    };

    if (c.matchKeyword("THEN")) {
        branch(stmt.thenBranch);
    } else if (c.checkKeyword("GOTO")) {
        const Token g = c.advance();
        stmt.thenBranch.push_back(makeStmt(GotoStmt{parseLineNumber(c)}, g));
    } else {
        c.error("Expected THEN");
    }
    if (c.matchKeyword("ELSE")) branch(stmt.elseBranch);
    return makeStmt(std::move(stmt), at);
}

StmtPtr BasicParser::parseFor(TokenCursor& c, const Token& at) {
    ForStmt stmt;
    const Token& var = c.expect(TokenKind::Identifier, "loop variable");
    if (isTextName(var.text)) TokenCursor::errorAt(var, "FOR needs a numeric variable");
    stmt.var = var.text;
    noteName(stmt.var);
    c.expectSymbol("=");
    stmt.start = parseExpr(c);
    c.expectKeyword("TO");
    stmt.limit = parseExpr(c);
    if (c.matchKeyword("STEP")) stmt.step = parseExpr(c);
    return makeStmt(std::move(stmt), at);
}

StmtPtr BasicParser::parseDim(TokenCursor& c, const Token& at) {
    DimStmt stmt;
    do {
        DimStmt::Decl decl;
        decl.name = c.expect(TokenKind::Identifier, "array name").text;
        noteName(decl.name);
        c.expectSymbol("(");
        decl.size = parseExpr(c);
        c.expectSymbol(")");
        stmt.arrays.push_back(std::move(decl));
    } while (c.matchSymbol(","));
    return makeStmt(std::move(stmt), at);
}

StmtPtr BasicParser::parseRepeat(TokenCursor& c, const Token& at) {
    RepeatStmt stmt;
    stmt.count = parseExpr(c);
    c.expectSymbol("[");
    stmt.body = parseStatements(c, false);
    c.expectSymbol("]");
    return makeStmt(std::move(stmt), at);
}

StmtPtr BasicParser::parseTurtle(TokenCursor& c, const Token& at) {
    const TurtleWord& word = turtleWords().at(at.text);
    TurtleStmt stmt;
    stmt.command = word.kind;

    if (word.args == -1) {
        // SETCOLOR RED | SETCOLOR 4 | SETCOLOR C$
        if (c.check(TokenKind::Identifier) && isColorWord(toLower(c.peek().text))) {
            stmt.colorName = toLower(c.advance().text);
        } else {
            stmt.args.push_back(parseExpr(c));
        }
        return makeStmt(std::move(stmt), at);
    }
    for (int i = 0; i < word.args; ++i) {
        if (i > 0) c.matchSymbol(",");
        if (atStatementEnd(c)) c.error(at.text + " needs " + std::to_string(word.args) + " argument(s)");
        stmt.args.push_back(parseExpr(c));
    }
    return makeStmt(std::move(stmt), at);
}

StmtPtr BasicParser::parseLet(TokenCursor& c, const Token& at) {
    LetStmt stmt;
    stmt.target = parseTarget(c);
    c.expectSymbol("=");
    stmt.value = parseExpr(c);
    return makeStmt(std::move(stmt), at);
}

Target BasicParser::parseTarget(TokenCursor& c) {
    Target target;
    const Token& name = c.expect(TokenKind::Identifier, "variable");
    if (isBuiltinFunction(name.text)) TokenCursor::errorAt(name, "Cannot assign to function " + name.text);
    target.name = name.text;
    noteName(target.name);
    if (c.matchSymbol("(")) {
        target.index = parseExpr(c);
        c.expectSymbol(")");
    }
    return target;
}

int BasicParser::parseLineNumber(TokenCursor& c) {
    const Token& n = c.expect(TokenKind::Number, "line number");
    if (n.number < 0 || n.number != std::floor(n.number) || n.number > 999999999.0) {
        TokenCursor::errorAt(n, "Invalid line number " + n.raw);
    }
    return static_cast<int>(n.number);
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

ExprPtr BasicParser::parseExpr(TokenCursor& c) {
    ExprPtr left = parseAnd(c);
    while (c.checkKeyword("OR")) {
        const Token op = c.advance();
        ExprPtr right = parseAnd(c);
        left = makeExpr(BinaryExpr{"OR", std::move(left), std::move(right)}, op);
    }
    return left;
}

ExprPtr BasicParser::parseAnd(TokenCursor& c) {
    ExprPtr left = parseNot(c);
    while (c.checkKeyword("AND")) {
        const Token op = c.advance();
        ExprPtr right = parseNot(c);
        left = makeExpr(BinaryExpr{"AND", std::move(left), std::move(right)}, op);
    }
    return left;
}

ExprPtr BasicParser::parseNot(TokenCursor& c) {
    if (c.checkKeyword("NOT")) {
        const Token op = c.advance();
        return makeExpr(UnaryExpr{"NOT", parseNot(c)}, op);
    }
    return parseComparison(c);
}

ExprPtr BasicParser::parseComparison(TokenCursor& c) {
    static const char* const ops[] = {"=", "<>", "<", ">", "<=", ">="};
    ExprPtr left = parseAdditive(c);
    for (;;) {
        const char* matched = nullptr;
        for (const char* op : ops) {
            if (c.checkSymbol(op)) { matched = op; break; }
        }
        if (!matched) return left;
        const Token op = c.advance();
        ExprPtr right = parseAdditive(c);
        left = makeExpr(BinaryExpr{matched, std::move(left), std::move(right)}, op);
    }
}

ExprPtr BasicParser::parseAdditive(TokenCursor& c) {
    ExprPtr left = parseTerm(c);
    while (c.checkSymbol("+") || c.checkSymbol("-")) {
        const Token op = c.advance();
        ExprPtr right = parseTerm(c);
        left = makeExpr(BinaryExpr{op.text, std::move(left), std::move(right)}, op);
    }
    return left;
}

ExprPtr BasicParser::parseTerm(TokenCursor& c) {
    ExprPtr left = parsePower(c);
    while (c.checkSymbol("*") || c.checkSymbol("/") || c.checkKeyword("MOD")) {
        const Token op = c.advance();
        ExprPtr right = parsePower(c);
        left = makeExpr(BinaryExpr{op.text, std::move(left), std::move(right)}, op);
    }
    return left;
}

ExprPtr BasicParser::parsePower(TokenCursor& c) {
    ExprPtr left = parseUnary(c);
    while (c.checkSymbol("^")) {
        const Token op = c.advance();
        ExprPtr right = parseUnary(c);
        left = makeExpr(BinaryExpr{"^", std::move(left), std::move(right)}, op);
    }
    return left;
}

// Unary minus binds tighter than '^': -2^2 is 4.
ExprPtr BasicParser::parseUnary(TokenCursor& c) {
    if (c.checkSymbol("-")) {
        const Token op = c.advance();
        return makeExpr(UnaryExpr{"-", parseUnary(c)}, op);
    }
    if (c.matchSymbol("+")) return parseUnary(c);
    return parsePrimary(c);
}

ExprPtr BasicParser::parsePrimary(TokenCursor& c) {
    const Token t = c.peek();
    switch (t.kind) {
        case TokenKind::Number:
            c.advance();
            return makeExpr(NumberLit{t.number}, t);
        case TokenKind::String:
            c.advance();
            return makeExpr(TextLit{t.text}, t);
        case TokenKind::Symbol:
            if (t.text == "(") {
                c.advance();
                ExprPtr inner = parseExpr(c);
                c.expectSymbol(")");
                return inner;
            }
            // Logo variable reference :SIZE
            if (t.text == ":" && c.peek(1).kind == TokenKind::Identifier && !c.peek(1).spaceBefore) {
                c.advance();
                const Token& name = c.advance();
                noteName(name.text);
                return makeExpr(VarRef{name.text}, t);
            }
            break;
        case TokenKind::Identifier: {
            c.advance();
            auto builtin = builtinTable().find(t.text);
            if (builtin != builtinTable().end()) {
                CallExpr call;
                call.name = t.text;
                if (c.matchSymbol("(")) {
                    if (!c.checkSymbol(")")) {
                        do {
                            call.args.push_back(parseExpr(c));
                        } while (c.matchSymbol(","));
                    }
                    c.expectSymbol(")");
                }
                const int n = static_cast<int>(call.args.size());
                if (n < builtin->second.minArgs || n > builtin->second.maxArgs) {
                    TokenCursor::errorAt(t, "Wrong number of arguments to " + t.text);
                }
                return makeExpr(std::move(call), t);
            }
            noteName(t.text);
            if (c.matchSymbol("(")) {
                ExprPtr index = parseExpr(c);
                c.expectSymbol(")");
                return makeExpr(ElementRef{t.text, std::move(index)}, t);
            }
            return makeExpr(VarRef{t.text}, t);
        }
        default:
            break;
    }
    if (t.kind == TokenKind::EndOfInput) c.error("Expected an expression");
    c.error("Unexpected '" + t.raw + "' in expression");
}

void BasicParser::noteName(const std::string& name) {
    if (!program_) return;
    if (isTextName(name)) {
        program_->textNames.insert(name);
    } else {
        program_->numericNames.insert(name);
    }
}

} // namespace timewarp
