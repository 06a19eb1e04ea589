#include <catch2/catch_all.hpp>
#include "test_support.hpp"
#include "../src/Runtime/TWError.hpp"

using namespace timewarp;
using namespace timewarp::testing;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using Kind = ExecutionEvent::Kind;

namespace {

std::string basicOutput(const std::string& source, std::vector<std::string> inputs = {}) {
    auto events = runSource(LanguageKind::Basic, source, std::move(inputs));
    REQUIRE(lastEvent(events).kind == Kind::Completed);
    return transcript(events);
}

ExecutionEvent basicError(const std::string& source) {
    auto events = runSource(LanguageKind::Basic, source);
    const ExecutionEvent& last = lastEvent(events);
    REQUIRE(last.kind == Kind::RuntimeError);
    return last;
}

} // namespace

TEST_CASE("PRINT of a literal emits one Output then Completed", "[basic]") {
    auto events = runSource(LanguageKind::Basic, "10 PRINT \"HI\"");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == Kind::Output);
    REQUIRE(events[0].text == "HI");
    REQUIRE(events[0].newline);
    REQUIRE(events[1].kind == Kind::Completed);
    REQUIRE_FALSE(events[1].aborted);
}

TEST_CASE("LET then PRINT of an expression", "[basic]") {
    auto events = runSource(LanguageKind::Basic, "LET X = 2\nPRINT X * 3");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].text == "6");
    REQUIRE(events[1].kind == Kind::Completed);
}

TEST_CASE("INPUT suspends until resume", "[basic]") {
    ExecutionState state = startSource(LanguageKind::Basic, "INPUT X\nPRINT X");
    ExecutionEvent req = state.step();
    REQUIRE(req.kind == Kind::InputRequested);
    REQUIRE_FALSE(req.prompt.has_value());
    REQUIRE(state.awaitingInput());

    ExecutionEvent out = state.resume("7");
    REQUIRE(out.kind == Kind::Output);
    REQUIRE(out.text == "7");
    REQUIRE(state.step().kind == Kind::Completed);
}

TEST_CASE("INPUT re-prompts when a numeric answer does not parse", "[basic]") {
    ExecutionState state = startSource(LanguageKind::Basic, "INPUT \"AGE\"; A\nPRINT A + 1");
    ExecutionEvent req = state.step();
    REQUIRE(req.prompt == std::string("AGE"));

    ExecutionEvent again = state.resume("old");
    REQUIRE(again.kind == Kind::InputRequested);
    REQUIRE(again.prompt == std::string("AGE"));

    REQUIRE(state.resume("41").text == "42");
}

TEST_CASE("INPUT with several targets asks once per target", "[basic]") {
    REQUIRE(basicOutput("INPUT A$, B\nPRINT A$; B", {"N", "3"}) == "N3\n");
}

TEST_CASE("Numeric precedence", "[basic]") {
    REQUIRE(basicOutput("PRINT 2 + 3 * 4") == "14\n");
    REQUIRE(basicOutput("PRINT (2 + 3) * 4") == "20\n");
    REQUIRE(basicOutput("PRINT -2 ^ 2") == "4\n");
    REQUIRE(basicOutput("PRINT 7 MOD 3") == "1\n");
    REQUIRE(basicOutput("PRINT 2 ^ 3 ^ 2") == "64\n");
}

TEST_CASE("Comparisons print as -1 and 0", "[basic]") {
    REQUIRE(basicOutput("PRINT 2 > 1") == "-1\n");
    REQUIRE(basicOutput("PRINT 1 > 2") == "0\n");
    REQUIRE(basicOutput("PRINT (3 = 3) * 5") == "-5\n");
}

TEST_CASE("Numbers may start with a point", "[basic]") {
    REQUIRE(basicOutput("10 X = .5\n20 PRINT X * 2") == "1\n");
}

TEST_CASE("PRINT separators", "[basic]") {
    REQUIRE(basicOutput("PRINT \"A\";\"B\"") == "AB\n");
    REQUIRE(basicOutput("PRINT \"A\";\nPRINT \"B\"") == "AB\n");
    REQUIRE(basicOutput("PRINT \"A\",\"B\"") == "A             B\n");
    REQUIRE(basicOutput("? 1") == "1\n");
}

TEST_CASE("Text builtins", "[basic]") {
    REQUIRE(basicOutput("PRINT LEN(\"HELLO\")") == "5\n");
    REQUIRE(basicOutput("PRINT LEFT$(\"HELLO\", 2); RIGHT$(\"HELLO\", 3)") == "HELLO\n");
    REQUIRE(basicOutput("PRINT MID$(\"HELLO\", 2, 3)") == "ELL\n");
    REQUIRE(basicOutput("PRINT CHR$(65); ASC(\"B\")") == "A66\n");
    REQUIRE(basicOutput("A$ = \"AB\" + \"CD\"\nPRINT UCASE$(LCASE$(A$))") == "ABCD\n");
}

TEST_CASE("Numeric builtins", "[basic]") {
    REQUIRE(basicOutput("PRINT INT(-2.5)") == "-3\n");
    REQUIRE(basicOutput("PRINT ABS(-4); SGN(-9); SQR(16)") == "4-14\n");
    REQUIRE(basicOutput("PRINT VAL(\"12\") + 1") == "13\n");
}

TEST_CASE("FOR/NEXT loops", "[basic]") {
    REQUIRE(basicOutput("FOR I = 1 TO 3\nPRINT I\nNEXT I") == "1\n2\n3\n");
    REQUIRE(basicOutput("FOR I = 3 TO 1 STEP -1: PRINT I;: NEXT") == "321");
    REQUIRE(basicOutput("FOR I = 1 TO 0\nPRINT I\nNEXT I\nPRINT \"DONE\"") == "DONE\n");
    REQUIRE(basicOutput("FOR I = 1 TO 2\nFOR J = 1 TO 2\nPRINT I * 10 + J\nNEXT J\nNEXT I") ==
            "11\n12\n21\n22\n");
}

TEST_CASE("GOTO, GOSUB and RETURN", "[basic]") {
    REQUIRE(basicOutput("10 GOSUB 100\n20 PRINT \"BACK\"\n30 END\n100 PRINT \"SUB\"\n110 RETURN") ==
            "SUB\nBACK\n");
    REQUIRE(basicOutput("10 GOTO 30\n20 PRINT \"SKIPPED\"\n30 PRINT \"HERE\"") == "HERE\n");
    // Lines run in line-number order, not source order.
    REQUIRE(basicOutput("20 PRINT \"B\"\n10 PRINT \"A\"") == "A\nB\n");
}

TEST_CASE("IF THEN ELSE", "[basic]") {
    const std::string program = "INPUT X\nIF X > 1 THEN PRINT \"BIG\" ELSE PRINT \"SMALL\"\nPRINT \"END\"";
    REQUIRE(basicOutput(program, {"5"}) == "BIG\nEND\n");
    REQUIRE(basicOutput(program, {"0"}) == "SMALL\nEND\n");
    REQUIRE(basicOutput("10 X = 5\n20 IF X > 1 THEN 40\n30 PRINT \"NO\"\n40 PRINT \"YES\"") == "YES\n");
    REQUIRE(basicOutput("IF 1 = 1 AND 2 > 1 THEN PRINT \"BOTH\"") == "BOTH\n");
}

TEST_CASE("Arrays", "[basic]") {
    REQUIRE(basicOutput("DIM A(3)\nFOR I = 0 TO 3: A(I) = I * I: NEXT\nPRINT A(3)") == "9\n");
    REQUIRE(basicOutput("B(10) = 4\nPRINT B(10)") == "4\n");
    REQUIRE(basicError("DIM A(3)\nPRINT A(4)").errorKind() == "SubscriptOutOfRange");
}

TEST_CASE("Runtime errors carry kind and line", "[basic]") {
    ExecutionEvent undefinedVar = basicError("LET X = 1\nPRINT Y");
    REQUIRE(undefinedVar.errorKind() == "UndefinedVariable");
    REQUIRE(undefinedVar.location.has_value());
    REQUIRE(undefinedVar.location->line == 2);

    REQUIRE(basicError("A$ = 5").errorKind() == "TypeMismatch");
    REQUIRE(basicError("PRINT \"A\" * 2").errorKind() == "TypeMismatch");
    REQUIRE(basicError("PRINT 1 / 0").errorKind() == "DivisionByZero");
    REQUIRE(basicError("RETURN").errorKind() == "ReturnWithoutGosub");
    REQUIRE(basicError("NEXT I").errorKind() == "NextWithoutFor");
}

TEST_CASE("GOTO a missing line is reported with the line number", "[basic]") {
    ExecutionEvent e = basicError("10 PRINT \"A\"\n20 GOTO 100");
    REQUIRE(e.errorKind() == "UndefinedLineNumber");
    REQUIRE(e.errorCode == ErrorCodes::UNDEFINED_LINE_NUMBER);
    REQUIRE_THAT(e.text, ContainsSubstring("100"));
    REQUIRE(e.location->line == 2);
}

TEST_CASE("Output before a runtime error is still delivered", "[basic]") {
    auto events = runSource(LanguageKind::Basic, "PRINT \"BEFORE\"\nPRINT 1 / 0\nPRINT \"AFTER\"");
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].text == "BEFORE");
    REQUIRE(events[1].kind == Kind::RuntimeError);
}

TEST_CASE("Runs are deterministic for the same seed", "[basic]") {
    const std::string program = "FOR I = 1 TO 5\nPRINT RND(100)\nNEXT";
    REQUIRE(basicOutput(program) == basicOutput(program));
}

TEST_CASE("Logo moves draw line segments", "[basic][logo]") {
    ExecutionState state = startSource(LanguageKind::Basic, "FORWARD 100\nRIGHT 90\nFORWARD 50");
    auto events = drive(state);
    auto draws = ofKind(events, Kind::Draw);
    REQUIRE(draws.size() == 2);
    const DrawPrimitive& first = draws[0].primitive;
    const DrawPrimitive& second = draws[1].primitive;
    REQUIRE(first.kind == DrawPrimitive::Kind::Line);
    REQUIRE_THAT(first.from.y, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(first.to.x, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(first.to.y, WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(second.from.y, WithinAbs(100.0, 1e-9));
    REQUIRE_THAT(second.to.x, WithinAbs(50.0, 1e-9));
    REQUIRE_THAT(second.to.y, WithinAbs(100.0, 1e-9));
    REQUIRE(state.turtle().heading == 90.0);
    REQUIRE(lastEvent(events).kind == Kind::Completed);
}

TEST_CASE("Logo REPEAT and variables", "[basic][logo]") {
    auto events = runSource(LanguageKind::Basic, "REPEAT 4 [FORWARD 10 RIGHT 90]");
    REQUIRE(ofKind(events, Kind::Draw).size() == 4);

    ExecutionState state = startSource(LanguageKind::Basic, "LET SIZE = 30\nFD :SIZE\nPENUP\nFD :SIZE");
    auto moved = drive(state);
    REQUIRE(ofKind(moved, Kind::Draw).size() == 1);
    REQUIRE_THAT(state.turtle().position.y, WithinAbs(60.0, 1e-9));
    REQUIRE_FALSE(state.turtle().penDown);
}

TEST_CASE("Logo colours, circles and clearing", "[basic][logo]") {
    auto events = runSource(LanguageKind::Basic, "SETCOLOR RED\nFORWARD 5\nCIRCLE 20\nCLS");
    auto draws = ofKind(events, Kind::Draw);
    REQUIRE(draws.size() == 3);
    REQUIRE(draws[0].primitive.color == "red");
    REQUIRE(draws[1].primitive.kind == DrawPrimitive::Kind::Circle);
    REQUIRE(draws[1].primitive.radius == 20.0);
    REQUIRE(draws[2].primitive.kind == DrawPrimitive::Kind::Clear);
}

TEST_CASE("Pen can start up", "[basic][logo]") {
    EngineOptions options;
    options.initialPenDown = false;
    ExecutionState state = startSource(LanguageKind::Basic, "FORWARD 10\nPENDOWN\nFORWARD 10", options);
    REQUIRE(ofKind(drive(state), Kind::Draw).size() == 1);
}

TEST_CASE("PILOT T: and A: question and answer", "[basic][pilot]") {
    ExecutionState state = startSource(LanguageKind::Basic, "T:What is your name?\nA:$NAME\nT:Hello $NAME");
    ExecutionEvent question = state.step();
    REQUIRE(question.text == "What is your name?");
    ExecutionEvent req = state.step();
    REQUIRE(req.kind == Kind::InputRequested);
    REQUIRE(req.prompt == std::string("What is your name?"));
    ExecutionEvent greeting = state.resume("Ada");
    REQUIRE(greeting.text == "Hello Ada");
    REQUIRE(state.step().kind == Kind::Completed);
}

TEST_CASE("PILOT M: sets the match flag for TY: and TN:", "[basic][pilot]") {
    const std::string program = "T:Do you like turtles?\nA:\nM:YES,Y\nTY:Great\nTN:Too bad";
    REQUIRE(basicOutput(program, {"yes please"}) == "Do you like turtles?\nGreat\n");
    REQUIRE(basicOutput(program, {"no"}) == "Do you like turtles?\nToo bad\n");
}

TEST_CASE("PILOT J:, U: and E:", "[basic][pilot]") {
    REQUIRE(basicOutput("J:*SKIP\nT:skipped\n*SKIP\nT:landed") == "landed\n");
    REQUIRE(basicOutput("U:*GREET\nT:back\nE:\n*GREET\nT:hello\nE:") == "hello\nback\n");
    REQUIRE(basicOutput("C:N = 2\nT(N > 1):many\nT(N < 1):none") == "many\n");
    REQUIRE(basicError("J:*NOWHERE").errorKind() == "UndefinedLabel");
}

TEST_CASE("BASIC load errors", "[basic]") {
    LoadResult dup = load(LanguageKind::Basic, "10 PRINT 1\n10 PRINT 2");
    REQUIRE_FALSE(dup.ok());
    REQUIRE(dup.error->line == 2);
    REQUIRE(dup.error->column == 1);

    LoadResult syntax = load(LanguageKind::Basic, "PRINT 1\nPRINT (1");
    REQUIRE_FALSE(syntax.ok());
    REQUIRE(syntax.error->line == 2);

    REQUIRE_FALSE(load(LanguageKind::Basic, "*A\n*A").ok());
    REQUIRE_FALSE(load(LanguageKind::Basic, "FORWARD").ok());
}
