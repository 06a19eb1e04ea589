#include <catch2/catch_all.hpp>
#include "test_support.hpp"

using namespace timewarp;
using namespace timewarp::testing;
using Kind = ExecutionEvent::Kind;

namespace {

std::string pascalOutput(const std::string& source, std::vector<std::string> inputs = {}) {
    auto events = runSource(LanguageKind::Pascal, source, std::move(inputs));
    REQUIRE(lastEvent(events).kind == Kind::Completed);
    return transcript(events);
}

ExecutionEvent pascalError(const std::string& source, const EngineOptions& options = EngineOptions{}) {
    ExecutionState state = startSource(LanguageKind::Pascal, source, options);
    auto events = drive(state);
    const ExecutionEvent& last = lastEvent(events);
    REQUIRE(last.kind == Kind::RuntimeError);
    return last;
}

const char* const kFactorial =
    "program Fact;\n"
    "function factorial(n: integer): integer;\n"
    "begin\n"
    "  if n <= 1 then\n"
    "    factorial := 1\n"
    "  else\n"
    "    factorial := n * factorial(n - 1)\n"
    "end;\n"
    "begin\n"
    "  writeln(factorial(4))\n"
    "end.\n";

} // namespace

TEST_CASE("Recursive function result printed by writeln", "[pascal]") {
    auto events = runSource(LanguageKind::Pascal, kFactorial);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].kind == Kind::Output);
    REQUIRE(events[0].text == "24");
    REQUIRE(events[0].newline);
    REQUIRE(events[1].kind == Kind::Completed);
}

TEST_CASE("var parameters alias the caller's variables", "[pascal]") {
    const std::string program =
        "program Swapper;\n"
        "var a, b: integer;\n"
        "procedure swap(var x, y: integer);\n"
        "var t: integer;\n"
        "begin\n"
        "  t := x; x := y; y := t\n"
        "end;\n"
        "begin\n"
        "  a := 1; b := 2;\n"
        "  swap(a, b);\n"
        "  writeln(a, ' ', b)\n"
        "end.\n";
    REQUIRE(pascalOutput(program) == "2 1\n");
}

TEST_CASE("Value parameters are copies", "[pascal]") {
    const std::string program =
        "var a: integer;\n"
        "procedure bump(x: integer);\n"
        "begin x := x + 1 end;\n"
        "begin a := 5; bump(a); writeln(a) end.\n";
    REQUIRE(pascalOutput(program) == "5\n");
}

TEST_CASE("for loops over a char variable", "[pascal]") {
    const std::string program =
        "var c: char;\n"
        "begin\n"
        "  for c := 'a' to 'c' do write(c);\n"
        "  for c := 'c' downto 'a' do write(c);\n"
        "  writeln\n"
        "end.\n";
    REQUIRE(pascalOutput(program) == "abccba\n");
}

TEST_CASE("Arrays use their declared bounds", "[pascal]") {
    const std::string program =
        "var a: array[1..3] of integer; i: integer;\n"
        "begin\n"
        "  for i := 1 to 3 do a[i] := i * 10;\n"
        "  writeln(a[2]);\n"
        "  writeln(a[4])\n"
        "end.\n";
    auto events = runSource(LanguageKind::Pascal, program);
    REQUIRE(events[0].text == "20");
    const ExecutionEvent& last = lastEvent(events);
    REQUIRE(last.kind == Kind::RuntimeError);
    REQUIRE(last.errorKind() == "SubscriptOutOfRange");
    REQUIRE(last.location->line == 5);
}

TEST_CASE("A function that never assigns its result fails", "[pascal]") {
    const std::string program =
        "function f(n: integer): integer;\n"
        "begin\n"
        "  if n > 100 then f := 1\n"
        "end;\n"
        "begin writeln(f(1)) end.\n";
    REQUIRE(pascalError(program).errorKind() == "FunctionWithoutResult");
}

TEST_CASE("Typed variables reject values of the wrong type", "[pascal]") {
    REQUIRE(pascalError("var x: integer;\nbegin\n  x := 2.5\nend.").errorKind() == "TypeMismatch");
    REQUIRE(pascalError("var x: integer;\nbegin\n  x := 'a'\nend.").errorKind() == "TypeMismatch");
    REQUIRE(pascalError("var x: integer;\nbegin\n  x := 7 / 2\nend.").errorKind() == "TypeMismatch");
    REQUIRE(pascalOutput("var r: real;\nbegin\n  r := 7 / 2;\n  writeln(r)\nend.") == "3.5\n");
}

TEST_CASE("Runtime arithmetic errors", "[pascal]") {
    ExecutionEvent e = pascalError("begin\n  writeln(1 / 0)\nend.");
    REQUIRE(e.errorKind() == "DivisionByZero");
    REQUIRE(e.location->line == 2);
    REQUIRE(pascalError("var i: integer;\nbegin i := 0; writeln(5 mod i) end.").errorKind() == "DivisionByZero");
}

TEST_CASE("write and writeln formatting", "[pascal]") {
    REQUIRE(pascalOutput("begin writeln(3.14159:8:2) end.") == "    3.14\n");
    REQUIRE(pascalOutput("begin writeln('ab':5, 7:3) end.") == "   ab  7\n");
    REQUIRE(pascalOutput("begin write('a'); write('b'); writeln end.") == "ab\n");
    REQUIRE(pascalOutput("begin writeln(7 div 2, ' ', 7 mod 2) end.") == "3 1\n");
    REQUIRE(pascalOutput("var s: string;\nbegin s := 'ab' + 'cd'; writeln(length(s), s[2]) end.") == "4b\n");
}

TEST_CASE("readln re-prompts until the answer fits the variable", "[pascal]") {
    ExecutionState state = startSource(LanguageKind::Pascal, "var n: integer;\nbegin\n  readln(n);\n  writeln(n * 2)\nend.");
    REQUIRE(state.step().kind == Kind::InputRequested);
    REQUIRE(state.resume("x").kind == Kind::InputRequested);
    REQUIRE(state.resume("2.5").kind == Kind::InputRequested);
    ExecutionEvent out = state.resume("21");
    REQUIRE(out.text == "42");
    REQUIRE(state.step().kind == Kind::Completed);
}

TEST_CASE("readln of several variables asks once per variable", "[pascal]") {
    const std::string program = "var name: string; age: integer;\nbegin readln(name, age); writeln(name, age + 1) end.";
    REQUIRE(pascalOutput(program, {"Ada", "36"}) == "Ada37\n");
}

TEST_CASE("Control structures", "[pascal]") {
    const std::string caseProgram =
        "var i: integer;\n"
        "begin\n"
        "  for i := 1 to 4 do\n"
        "    case i of\n"
        "      1: writeln('one');\n"
        "      2, 3: writeln('few');\n"
        "    else\n"
        "      writeln('many')\n"
        "    end\n"
        "end.\n";
    REQUIRE(pascalOutput(caseProgram) == "one\nfew\nfew\nmany\n");

    const std::string repeatProgram =
        "var i: integer;\n"
        "begin\n"
        "  i := 0;\n"
        "  repeat\n"
        "    i := i + 1;\n"
        "    write(i)\n"
        "  until i >= 3;\n"
        "  writeln\n"
        "end.\n";
    REQUIRE(pascalOutput(repeatProgram) == "123\n");

    REQUIRE(pascalOutput("var i: integer;\nbegin for i := 3 downto 1 do write(i); writeln end.") == "321\n");
    REQUIRE(pascalOutput("var i: integer;\nbegin i := 1; while i < 50 do i := i * 3; writeln(i) end.") == "81\n");
    REQUIRE(pascalOutput("begin if (1 < 2) and not (2 < 1) then writeln('yes') else writeln('no') end.") == "yes\n");
}

TEST_CASE("Constants", "[pascal]") {
    REQUIRE(pascalOutput("const n = 3; greeting = 'hi';\nvar i: integer;\n"
                         "begin for i := 1 to n do write(greeting); writeln end.") == "hihihi\n");
}

TEST_CASE("Call depth is bounded", "[pascal]") {
    EngineOptions options;
    options.maxCallDepth = 50;
    const std::string program =
        "procedure down(n: integer);\n"
        "begin down(n + 1) end;\n"
        "begin down(1) end.\n";
    REQUIRE(pascalError(program, options).errorKind() == "OutOfMemory");
}

TEST_CASE("Static errors are reported at load time", "[pascal]") {
    LoadResult undeclared = load(LanguageKind::Pascal, "begin\n  x := 1\nend.");
    REQUIRE_FALSE(undeclared.ok());
    REQUIRE(undeclared.error->line == 2);
    REQUIRE(undeclared.error->column == 3);

    REQUIRE_FALSE(load(LanguageKind::Pascal, "begin writeln(1) end").ok());
    REQUIRE_FALSE(load(LanguageKind::Pascal, "var x: integer; x: real;\nbegin end.").ok());
    REQUIRE_FALSE(load(LanguageKind::Pascal, "procedure p; begin end;\nbegin writeln(p) end.").ok());
    REQUIRE_FALSE(load(LanguageKind::Pascal, "var x: widget;\nbegin end.").ok());
}
