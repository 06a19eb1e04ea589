#include <catch2/catch_all.hpp>
#include "test_support.hpp"
#include "../src/Prolog/PrologParser.hpp"
#include "../src/Prolog/PrologTerm.hpp"

using namespace timewarp;
using namespace timewarp::prolog;
using namespace timewarp::testing;
using Catch::Matchers::ContainsSubstring;
using Kind = ExecutionEvent::Kind;

namespace {

std::string prologOutput(const std::string& source, std::vector<std::string> inputs = {}) {
    auto events = runSource(LanguageKind::Prolog, source, std::move(inputs));
    REQUIRE(lastEvent(events).kind == Kind::Completed);
    return transcript(events);
}

ExecutionEvent prologError(const std::string& source) {
    auto events = runSource(LanguageKind::Prolog, source);
    const ExecutionEvent& last = lastEvent(events);
    REQUIRE(last.kind == Kind::RuntimeError);
    return last;
}

void requireJohnThenMary(const std::vector<ExecutionEvent>& events) {
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].kind == Kind::Output);
    REQUIRE(events[0].text == "john");
    REQUIRE(events[1].kind == Kind::Output);
    REQUIRE(events[1].text == "mary");
    REQUIRE(events[2].kind == Kind::Completed);
    REQUIRE(events[2].text == "No more solutions");
}

} // namespace

TEST_CASE("All solutions of a query are printed in clause order", "[prolog]") {
    requireJohnThenMary(runSource(LanguageKind::Prolog,
                                  "person(john).\nperson(mary).\n?- person(X), write(X), nl.\n"));
}

TEST_CASE("Sectioned programs run their goal section", "[prolog]") {
    const std::string program =
        "domains\n"
        "  name = symbol\n"
        "predicates\n"
        "  person(name)\n"
        "clauses\n"
        "  person(john).\n"
        "  person(mary).\n"
        "goal\n"
        "  person(X), write(X), nl.\n";
    requireJohnThenMary(runSource(LanguageKind::Prolog, program));
}

TEST_CASE("Queries run in source order", "[prolog]") {
    REQUIRE(prologOutput("?- write(a), nl.\n?- write(b), nl.") == "a\nb\n");
    REQUIRE(prologOutput("?- write(a), nl, halt.\n?- write(b), nl.") == "a\n");
    REQUIRE(prologOutput("?- fail.\n?- write(after), nl.") == "after\n");
}

TEST_CASE("Rules and recursion", "[prolog]") {
    const std::string program =
        "parent(tom, bob).\n"
        "parent(bob, ann).\n"
        "parent(ann, joe).\n"
        "ancestor(X, Y) :- parent(X, Y).\n"
        "ancestor(X, Y) :- parent(X, Z), ancestor(Z, Y).\n"
        "?- ancestor(tom, D), write(D), nl.\n";
    REQUIRE(prologOutput(program) == "bob\nann\njoe\n");
}

TEST_CASE("Cut commits to the first matching clause", "[prolog]") {
    const std::string program =
        "max(X, Y, X) :- X >= Y, !.\n"
        "max(_, Y, Y).\n"
        "?- max(3, 7, M), write(M), nl.\n"
        "?- max(9, 2, M), write(M), nl.\n";
    REQUIRE(prologOutput(program) == "7\n9\n");
    REQUIRE(prologOutput("n(1). n(2). n(3).\n?- n(X), X >= 2, !, write(X), nl.") == "2\n");
}

TEST_CASE("Negation and if-then-else", "[prolog]") {
    REQUIRE(prologOutput("?- \\+ member(4, [1,2,3]), write(yes), nl.") == "yes\n");
    REQUIRE(prologOutput("?- \\+ member(2, [1,2,3]), write(yes), nl.").empty());
    REQUIRE(prologOutput("?- not(1 = 2), write(ok), nl.") == "ok\n");
    REQUIRE(prologOutput("?- (1 > 2 -> write(a) ; write(b)), nl.") == "b\n");
    REQUIRE(prologOutput("?- (member(X, [1,2,3]), X > 1 -> write(X) ; write(none)), nl.") == "2\n");
    REQUIRE(prologOutput("?- (write(a) ; write(b)), nl.") == "a\nb\n");
}

TEST_CASE("Arithmetic", "[prolog]") {
    REQUIRE(prologOutput("?- X is 2 + 3 * 4, write(X), nl.") == "14\n");
    REQUIRE(prologOutput("?- X is 7 / 2, write(X), nl.") == "3.5\n");
    REQUIRE(prologOutput("?- X is 7 // 2, Y is 7 mod -2, write(X/Y), nl.") == "3/-1\n");
    REQUIRE(prologOutput("?- X is max(3, 8) - abs(-2), write(X), nl.") == "6\n");
    REQUIRE(prologOutput("?- 1 + 2 =:= 3, 2 =\\= 3, 2 =< 2, write(ok), nl.") == "ok\n");
}

TEST_CASE("Library predicates", "[prolog]") {
    REQUIRE(prologOutput("?- append(X, Y, [1,2]), write(X-Y), nl.") == "[]-[1,2]\n[1]-[2]\n[1,2]-[]\n");
    REQUIRE(prologOutput("?- member(X, [a,b]), write(X), nl.") == "a\nb\n");
    REQUIRE(prologOutput("?- reverse([1,2,3], R), write(R), nl.") == "[3,2,1]\n");
    REQUIRE(prologOutput("?- between(1, 3, X), write(X), fail.") == "123");
    REQUIRE(prologOutput("?- length([a,b,c], N), write(N), nl.") == "3\n");
    // A program's own definition replaces the library one.
    REQUIRE(prologOutput("member(x, y).\n?- member(A, B), write(A), nl.") == "x\n");
}

TEST_CASE("Term comparison and type checks", "[prolog]") {
    REQUIRE(prologOutput("?- f(X) = f(1), X == 1, write(X), nl.") == "1\n");
    REQUIRE(prologOutput("?- a \\= b, f(a) \\== f(b), atom(a), number(2), var(_), write(ok), nl.") == "ok\n");
    REQUIRE(prologOutput("?- X = point(1, 2), write(X), nl.") == "point(1,2)\n");
}

TEST_CASE("Long lists do not exhaust the native stack", "[prolog]") {
    const std::string program =
        "mk(0, []) :- !.\n"
        "mk(N, [N|T]) :- M is N - 1, mk(M, T).\n"
        "len([], 0).\n"
        "len([_|T], N) :- len(T, M), N is M + 1.\n"
        "?- mk(100000, L), len(L, N), write(N), nl.\n"
        "?- mk(100000, A), mk(100000, B), A == B, write(same), nl.\n";
    REQUIRE(prologOutput(program) == "100000\nsame\n");
}

TEST_CASE("Cyclic bindings print with an ellipsis", "[prolog]") {
    REQUIRE(prologOutput("?- X = f(X), write(hello), nl, write(X), nl.") == "hello\nf(...)\n");
}

TEST_CASE("write output arrives before the next nl", "[prolog]") {
    ExecutionState state = startSource(LanguageKind::Prolog, "a :- write(x), a.\n?- a.");
    for (int i = 0; i < 3; ++i) {
        ExecutionEvent out = state.step();
        REQUIRE(out.kind == Kind::Output);
        REQUIRE(out.text == "x");
        REQUIRE_FALSE(out.newline);
    }
    state.abort();
    REQUIRE(state.step().aborted);
}

TEST_CASE("readint re-prompts until a number arrives", "[prolog]") {
    ExecutionState state = startSource(LanguageKind::Prolog, "?- write('n? '), readint(X), Y is X * 2, write(Y), nl.");
    ExecutionEvent prompt = state.step();
    REQUIRE(prompt.kind == Kind::Output);
    REQUIRE(prompt.text == "n? ");
    REQUIRE_FALSE(prompt.newline);
    REQUIRE(state.step().kind == Kind::InputRequested);
    REQUIRE(state.resume("abc").kind == Kind::InputRequested);
    ExecutionEvent out = state.resume("21");
    REQUIRE(out.text == "42");
}

TEST_CASE("readln binds the whole line", "[prolog]") {
    REQUIRE(prologOutput("?- readln(L), write(L), nl.", {"hello there"}) == "hello there\n");
}

TEST_CASE("Prolog runtime errors", "[prolog]") {
    ExecutionEvent undefined = prologError("?- foo(1).");
    REQUIRE(undefined.errorKind() == "UndefinedPredicate");
    REQUIRE_THAT(undefined.text, ContainsSubstring("foo/1"));
    REQUIRE(undefined.location->line == 1);

    REQUIRE(prologError("?- X is Y + 1.").errorKind() == "InstantiationError");
    REQUIRE(prologError("?- X is 1 / 0.").errorKind() == "DivisionByZero");
    REQUIRE(prologError("?- X is foo + 1.").errorKind() == "TypeMismatch");
}

TEST_CASE("Text written before an error is delivered", "[prolog]") {
    auto events = runSource(LanguageKind::Prolog, "?- write(hello), foo.");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].text == "hello");
    REQUIRE(events[1].kind == Kind::RuntimeError);
}

TEST_CASE("Prolog load errors", "[prolog]") {
    LoadResult missingDot = load(LanguageKind::Prolog, "person(john).\nperson(mary)");
    REQUIRE_FALSE(missingDot.ok());
    REQUIRE(missingDot.error->line == 2);

    REQUIRE_FALSE(load(LanguageKind::Prolog, "foo(.").ok());
    REQUIRE_FALSE(load(LanguageKind::Prolog, "X :- true.").ok());
    REQUIRE_FALSE(load(LanguageKind::Prolog, "greeting --> [hello].").ok());
}

TEST_CASE("Unification binds both ways", "[prolog][unify]") {
    TermPtr x = Term::makeVar(0, "X");
    TermPtr y = Term::makeVar(1, "Y");
    TermPtr left = Term::makeCompound("f", {Term::makeAtom("a"), x});
    TermPtr right = Term::makeCompound("f", {y, Term::makeNumber(1)});

    Bindings forward;
    forward.allocate(2);
    REQUIRE(forward.unify(left, right, false));
    Bindings backward;
    backward.allocate(2);
    REQUIRE(backward.unify(right, left, false));

    REQUIRE(formatTerm(forward.resolve(left)) == "f(a,1)");
    REQUIRE(formatTerm(backward.resolve(left)) == "f(a,1)");
    REQUIRE(formatTerm(forward.resolve(y)) == "a");

    Bindings clash;
    clash.allocate(2);
    REQUIRE_FALSE(clash.unify(Term::makeCompound("f", {Term::makeAtom("a")}),
                              Term::makeCompound("f", {Term::makeAtom("b")}), false));
    REQUIRE_FALSE(clash.unify(Term::makeCompound("f", {x}), Term::makeCompound("g", {x}), false));
}

TEST_CASE("Occurs check and undo", "[prolog][unify]") {
    TermPtr x = Term::makeVar(0, "X");
    TermPtr cyclic = Term::makeCompound("f", {x});

    Bindings checked;
    checked.allocate(1);
    REQUIRE_FALSE(checked.unify(x, cyclic, true));

    Bindings unchecked;
    unchecked.allocate(1);
    const size_t trail = unchecked.trailSize();
    REQUIRE(unchecked.unify(x, Term::makeAtom("a"), false));
    REQUIRE(unchecked.deref(x)->isAtom("a"));
    unchecked.undo(trail, 1);
    REQUIRE(unchecked.deref(x)->isVar());
    REQUIRE(unchecked.unify(x, cyclic, false));
}

TEST_CASE("Occurs check option reaches =/2", "[prolog][unify]") {
    REQUIRE(prologOutput("?- X = f(X), write(unified), nl.") == "unified\n");

    EngineOptions options;
    options.occursCheck = true;
    ExecutionState state = startSource(LanguageKind::Prolog, "?- X = f(X), write(unified), nl.", options);
    REQUIRE(transcript(drive(state)).empty());
}

TEST_CASE("Terms print in operator notation", "[prolog][term]") {
    PrologParser parser;
    REQUIRE(formatTerm(parser.parseTerm("[1,2|T]")) == "[1,2|_G0]");
    REQUIRE(formatTerm(parser.parseTerm("a+b*c")) == "a+b*c");
    REQUIRE(formatTerm(parser.parseTerm("(a+b)*c")) == "(a+b)*c");
    REQUIRE(formatTerm(parser.parseTerm("1-(2-3)")) == "1-(2-3)");
    REQUIRE(formatTerm(parser.parseTerm("X is 1 mod 2")) == "_G0 is 1 mod 2");
    REQUIRE(formatTerm(parser.parseTerm("f(x, 'hello world', [])")) == "f(x,hello world,[])");
    REQUIRE(formatTerm(parser.parseTerm("-3")) == "-3");
}

TEST_CASE("Standard order of terms", "[prolog][term]") {
    PrologParser parser;
    REQUIRE(compareTerms(parser.parseTerm("1"), parser.parseTerm("a")) < 0);
    REQUIRE(compareTerms(parser.parseTerm("a"), parser.parseTerm("f(a)")) < 0);
    REQUIRE(compareTerms(parser.parseTerm("f(a)"), parser.parseTerm("f(a)")) == 0);
    REQUIRE(compareTerms(parser.parseTerm("b"), parser.parseTerm("a")) > 0);
}
