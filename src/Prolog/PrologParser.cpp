#include "PrologParser.hpp"

#include <algorithm>
#include <cctype>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace prolog;

namespace {

const char* kPrelude = R"(
append([], L, L).
append([H|T], L, [H|R]) :- append(T, L, R).
member(X, [X|_]).
member(X, [_|T]) :- member(X, T).
reverse(L, R) :- '$reverse'(L, [], R).
'$reverse'([], A, A).
'$reverse'([H|T], A, R) :- '$reverse'(T, [H|A], R).
between(L, H, L) :- L =< H.
between(L, H, X) :- L < H, L1 is L + 1, between(L1, H, X).
)";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool isSectionWord(const std::string& word) {
    const std::string w = lower(word);
    return w == "domains" || w == "predicates" || w == "clauses" || w == "goal";
}

} // namespace

LexerSpec PrologParser::lexerSpec() {
    LexerSpec spec;
    spec.caseInsensitive = false;
    spec.upperCaseVariables = true;
    spec.operators = {":-", "?-", "-->", "->", "\\+", "\\==", "\\=", "==", "=:=", "=\\=", "=<", ">=", "=..",
                      "//", "**", "<", ">", "=", "+", "-", "*", "/", "^", ",", ";", "|", "!",
                      "(", ")", "[", "]", "{", "}", "."};
    spec.lineComments = {"%"};
    spec.blockComments = {{"/*", "*/"}};
    spec.stringQuotes = "\"";
    spec.atomQuotes = "'";
    return spec;
}

std::shared_ptr<const Program> PrologParser::parse(const std::string& source) {
    auto program = std::make_shared<Program>();
    parseInto(source, *program, false);

    Program library;
    parseInto(kPrelude, library, true);
    for (auto& entry : library.predicates) {
        if (!program->predicates.count(entry.first)) program->predicates.emplace(entry.first, std::move(entry.second));
    }
    return program;
}

TermPtr PrologParser::parseTerm(const std::string& text) {
    Lexer lexer(lexerSpec());
    cursor_ = std::make_unique<TokenCursor>(lexer.tokenize(text));
    varNames_.clear();
    varCount_ = 0;
    TermPtr term = parseExpr(1200);
    if (!cursor_->atEnd()) cursor_->error("Unexpected text after term");
    return term;
}

void PrologParser::parseInto(const std::string& source, Program& program, bool library) {
    Lexer lexer(lexerSpec());
    cursor_ = std::make_unique<TokenCursor>(lexer.tokenize(source));
    std::string section = "clauses";
    while (!cursor_->atEnd()) {
        if (atSectionHeader()) {
            section = lower(cursor_->advance().text);
            if (section == "domains" || section == "predicates") {
                while (!cursor_->atEnd() && !atSectionHeader()) cursor_->advance();
            }
            continue;
        }
        parseClause(program, section == "goal", library);
    }
}

// A section word alone on its line.
bool PrologParser::atSectionHeader() const {
    const Token& t = cursor_->peek();
    if (t.kind != TokenKind::Identifier && t.kind != TokenKind::Variable) return false;
    if (!isSectionWord(t.text)) return false;
    const Token& next = cursor_->peek(1);
    return next.kind == TokenKind::EndOfInput || next.line > t.line;
}

void PrologParser::parseClause(Program& program, bool goalSection, bool library) {
    varNames_.clear();
    varCount_ = 0;
    const Token start = cursor_->peek();
    TermPtr term = parseExpr(1200);
    cursor_->expectSymbol(".");
    const int line = library ? 0 : start.line;

    if (goalSection) {
        program.queries.push_back(Query{term, varCount_, line});
        return;
    }
    if (term->is(":-", 1) || term->is("?-", 1)) {
        program.queries.push_back(Query{term->args[0], varCount_, line});
        return;
    }
    if (term->is("-->", 2)) {
        TokenCursor::errorAt(start, "Grammar rules are not supported");
    }

    Clause clause;
    if (term->is(":-", 2)) {
        clause.head = term->args[0];
        clause.body = term->args[1];
    } else {
        clause.head = term;
        clause.body = Term::makeAtom("true");
    }
    if (!clause.head->isCallable()) {
        TokenCursor::errorAt(start, "Clause head must be an atom or a compound term");
    }
    if (clause.head->is(",", 2) || clause.head->is(";", 2) || clause.head->is("->", 2)) {
        TokenCursor::errorAt(start, "Cannot redefine control construct " + predicateKey(*clause.head));
    }
    clause.varCount = varCount_;
    clause.line = line;
    program.predicates[predicateKey(*clause.head)].push_back(std::move(clause));
}

TermPtr PrologParser::parseExpr(int maxPriority) {
    int leftPriority = 0;
    TermPtr left = parsePrimary(maxPriority, leftPriority);
    for (;;) {
        const Token& t = cursor_->peek();
        std::string name;
        if (t.kind == TokenKind::Symbol) {
            name = t.text;
        } else if (t.kind == TokenKind::Identifier) {
            name = t.text;
        } else {
            break;
        }
        const OperatorDef* op = infixOperator(name);
        if (!op || op->priority > maxPriority) break;
        const int leftMax = op->type == OperatorDef::Type::YFX ? op->priority : op->priority - 1;
        if (leftPriority > leftMax) break;
        cursor_->advance();
        const int rightMax = op->type == OperatorDef::Type::XFY ? op->priority : op->priority - 1;
        TermPtr right = parseExpr(rightMax);
        if (name == "|") name = ";";
        left = Term::makeCompound(name, {left, right});
        leftPriority = op->priority;
    }
    return left;
}

TermPtr PrologParser::parsePrimary(int maxPriority, int& priority) {
    priority = 0;
    const Token& t = cursor_->advance();
    switch (t.kind) {
        case TokenKind::Number:
            return Term::makeNumber(t.number);
        case TokenKind::String:
            return Term::makeString(t.text);
        case TokenKind::Variable:
            return variable(t.text);
        case TokenKind::QuotedAtom:
        case TokenKind::Identifier:
        case TokenKind::Keyword:
            return parseName(t.text, maxPriority, priority);
        case TokenKind::Symbol:
            break;
        case TokenKind::EndOfInput:
            TokenCursor::errorAt(t, "Unexpected end of input");
        default:
            TokenCursor::errorAt(t, "Unexpected token");
    }

    if (t.text == "(") {
        TermPtr inner = parseExpr(1200);
        cursor_->expectSymbol(")");
        return inner;
    }
    if (t.text == "[") {
        if (cursor_->matchSymbol("]")) return parseName("[]", maxPriority, priority);
        return parseList();
    }
    if (t.text == "{") {
        TermPtr inner = parseExpr(1200);
        cursor_->expectSymbol("}");
        return Term::makeCompound("{}", {inner});
    }
    if (t.text == "-" && cursor_->check(TokenKind::Number) && !cursor_->peek().spaceBefore) {
        return Term::makeNumber(-cursor_->advance().number);
    }
    if (t.text == ")" || t.text == "]" || t.text == "}" || t.text == "." || t.text == "," || t.text == "|") {
        TokenCursor::errorAt(t, "Unexpected '" + t.text + "'");
    }
    return parseName(t.text, maxPriority, priority);
}

TermPtr PrologParser::parseName(const std::string& name, int maxPriority, int& priority) {
    if (cursor_->checkSymbol("(") && !cursor_->peek().spaceBefore) {
        cursor_->advance();
        std::vector<TermPtr> args;
        do {
            args.push_back(parseExpr(999));
        } while (cursor_->matchSymbol(","));
        cursor_->expectSymbol(")");
        return Term::makeCompound(name, std::move(args));
    }
    const OperatorDef* op = prefixOperator(name);
    if (op && canStartTerm(cursor_->peek())) {
        int p = op->priority;
        int argMax = op->type == OperatorDef::Type::FY ? p : p - 1;
        if (p > maxPriority) {
            p = 999;
            argMax = 999;
        }
        TermPtr arg = parseExpr(argMax);
        priority = p;
        return Term::makeCompound(name, {arg});
    }
    return Term::makeAtom(name);
}

TermPtr PrologParser::parseList() {
    std::vector<TermPtr> items;
    do {
        items.push_back(parseExpr(999));
    } while (cursor_->matchSymbol(","));
    TermPtr tail;
    if (cursor_->matchSymbol("|")) tail = parseExpr(999);
    cursor_->expectSymbol("]");
    return makeList(items, tail);
}

TermPtr PrologParser::variable(const std::string& name) {
    if (name == "_") return Term::makeVar(varCount_++, "_");
    auto it = varNames_.find(name);
    if (it == varNames_.end()) it = varNames_.emplace(name, varCount_++).first;
    return Term::makeVar(it->second, name);
}

bool PrologParser::canStartTerm(const Token& token) const {
    switch (token.kind) {
        case TokenKind::Number:
        case TokenKind::String:
        case TokenKind::Variable:
        case TokenKind::QuotedAtom:
            return true;
        case TokenKind::Identifier:
        case TokenKind::Keyword:
            return infixOperator(token.text) == nullptr;
        case TokenKind::Symbol:
            return token.text == "(" || token.text == "[" || token.text == "{" || token.text == "!" ||
                   prefixOperator(token.text) != nullptr;
        default:
            return false;
    }
}

} // namespace timewarp
