#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "PrologTerm.hpp"
#include "../Lexer/Lexer.hpp"
#include "../Lexer/TokenCursor.hpp"

namespace timewarp {
namespace prolog {

// Stored clause; variables are numbered 0..varCount-1.
struct Clause {
    TermPtr head;
    TermPtr body;      // atom true for a fact
    size_t varCount{0};
    int line{0};
};

// A ?- / :- directive or a goal-section entry.
struct Query {
    TermPtr goal;
    size_t varCount{0};
    int line{0};
};

struct Program {
    std::map<std::string, std::vector<Clause>> predicates;   // keyed by name/arity
    std::vector<Query> queries;                              // in source order
};

} // namespace prolog

/**
 * PrologParser
 *
 * Operator-precedence reader for clauses and directives. Understands the
 * Turbo Prolog section layout (domains, predicates, clauses, goal); the
 * domains and predicates sections are skipped. Library predicates such as
 * append/3 are added from a prelude unless the program defines them itself.
 */
class PrologParser {
public:
    std::shared_ptr<const prolog::Program> parse(const std::string& source);

    // Parses a single term (no terminating '.'); used by tests and the host.
    prolog::TermPtr parseTerm(const std::string& text);

    static LexerSpec lexerSpec();

private:
    std::unique_ptr<TokenCursor> cursor_;
    std::map<std::string, size_t> varNames_;
    size_t varCount_{0};

    void parseInto(const std::string& source, prolog::Program& program, bool library);
    bool atSectionHeader() const;
    void parseClause(prolog::Program& program, bool goalSection, bool library);

    prolog::TermPtr parseExpr(int maxPriority);
    prolog::TermPtr parsePrimary(int maxPriority, int& priority);
    prolog::TermPtr parseName(const std::string& name, int maxPriority, int& priority);
    prolog::TermPtr parseList();
    prolog::TermPtr variable(const std::string& name);
    bool canStartTerm(const Token& token) const;
};

} // namespace timewarp
