#include <catch2/catch_all.hpp>
#include "test_support.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace timewarp;
using namespace timewarp::testing;
using Kind = ExecutionEvent::Kind;

TEST_CASE("Language detection by extension", "[engine]") {
    REQUIRE(detectLanguage("square.logo", "") == LanguageKind::Basic);
    REQUIRE(detectLanguage("quiz.PILOT", "") == LanguageKind::Basic);
    REQUIRE(detectLanguage("dir/hello.twb", "") == LanguageKind::Basic);
    REQUIRE(detectLanguage("fact.pas", "") == LanguageKind::Pascal);
    REQUIRE(detectLanguage("fact.twp", "") == LanguageKind::Pascal);
    REQUIRE(detectLanguage("family.pl", "") == LanguageKind::Prolog);
    REQUIRE(detectLanguage("family.tpr", "") == LanguageKind::Prolog);
    // The extension wins over the contents.
    REQUIRE(detectLanguage("odd.bas", "program x; begin end.") == LanguageKind::Basic);
}

TEST_CASE("Language detection by content", "[engine]") {
    REQUIRE(detectLanguage("", "program Hello;\nbegin\n  writeln('hi')\nend.") == LanguageKind::Pascal);
    REQUIRE(detectLanguage("untitled", "begin\n  writeln(1)\nend.") == LanguageKind::Pascal);
    REQUIRE(detectLanguage("", "likes(mary, wine).\n?- likes(mary, X).") == LanguageKind::Prolog);
    REQUIRE(detectLanguage("", "person(john).\nperson(mary).\n") == LanguageKind::Prolog);
    REQUIRE(detectLanguage("", "clauses\n  p(1).\n") == LanguageKind::Prolog);
    REQUIRE(detectLanguage("", "10 PRINT \"HELLO\"\n20 END") == LanguageKind::Basic);
    REQUIRE(detectLanguage("", "T:Hello\nA:$NAME") == LanguageKind::Basic);
    REQUIRE(detectLanguage("", "x = 1.") == LanguageKind::Basic);
    REQUIRE(detectLanguage("", "") == LanguageKind::Basic);
}

TEST_CASE("Language names", "[engine]") {
    REQUIRE(languageFromName("Pascal") == LanguageKind::Pascal);
    REQUIRE(languageFromName("PROLOG") == LanguageKind::Prolog);
    REQUIRE(languageFromName("logo") == LanguageKind::Basic);
    REQUIRE(languageFromName("pilot") == LanguageKind::Basic);
    REQUIRE_FALSE(languageFromName("cobol").has_value());
    REQUIRE(std::string(languageName(LanguageKind::Pascal)) == "pascal");
}

TEST_CASE("Load failures carry a location and no program", "[engine]") {
    LoadResult result = load(LanguageKind::Basic, "10 PRINT 1\n20 PRINT (1 +\n");
    REQUIRE_FALSE(result.ok());
    REQUIRE_FALSE(result.program.has_value());
    REQUIRE(result.error->line == 2);
    REQUIRE(result.error->column > 0);
    REQUIRE_FALSE(result.error->message.empty());
}

TEST_CASE("A loaded program can be started more than once", "[engine]") {
    LoadResult loaded = load(LanguageKind::Basic, "10 PRINT 6 * 7");
    REQUIRE(loaded.ok());
    ExecutionState first = start(*loaded.program);
    ExecutionState second = start(*loaded.program);
    REQUIRE(transcript(drive(first)) == "42\n");
    REQUIRE(transcript(drive(second)) == "42\n");
}

TEST_CASE("The terminal event repeats", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 PRINT 1");
    REQUIRE(state.step().kind == Kind::Output);
    REQUIRE(state.step().kind == Kind::Completed);
    REQUIRE(state.finished());
    REQUIRE(state.step().kind == Kind::Completed);
    REQUIRE_THROWS_AS(state.resume("x"), std::logic_error);

    ExecutionState failing = startSource(LanguageKind::Basic, "10 PRINT 1 / 0");
    ExecutionEvent error = failing.step();
    REQUIRE(error.kind == Kind::RuntimeError);
    ExecutionEvent again = failing.step();
    REQUIRE(again.kind == Kind::RuntimeError);
    REQUIRE(again.text == error.text);
}

TEST_CASE("resume needs an outstanding input request", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 INPUT A\n20 PRINT A");
    REQUIRE_THROWS_AS(state.resume("5"), std::logic_error);

    ExecutionEvent request = state.step();
    REQUIRE(request.kind == Kind::InputRequested);
    // Stepping again without answering reports the same request.
    ExecutionEvent repeated = state.step();
    REQUIRE(repeated.kind == Kind::InputRequested);
    REQUIRE(repeated.prompt == request.prompt);
    REQUIRE(state.awaitingInput());

    ExecutionEvent out = state.resume("5");
    REQUIRE(out.kind == Kind::Output);
    REQUIRE(out.text == "5");
    REQUIRE_FALSE(state.awaitingInput());
}

TEST_CASE("abort ends the run", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 PRINT 1\n20 GOTO 10");
    REQUIRE(state.step().kind == Kind::Output);
    state.abort();
    state.abort();
    ExecutionEvent done = state.step();
    REQUIRE(done.kind == Kind::Completed);
    REQUIRE(done.aborted);
    ExecutionEvent again = state.step();
    REQUIRE(again.kind == Kind::Completed);
    REQUIRE(again.aborted);
}

TEST_CASE("abort from another thread stops a loop that never emits", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 GOTO 10");
    std::thread stopper([&state] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        state.abort();
    });
    ExecutionEvent done = state.step();
    stopper.join();
    REQUIRE(done.kind == Kind::Completed);
    REQUIRE(done.aborted);
}

TEST_CASE("stepFor hands control back from silent loops", "[engine]") {
    const std::pair<LanguageKind, std::string> loops[] = {
        {LanguageKind::Basic, "10 GOTO 10"},
        {LanguageKind::Pascal, "begin while true do ; end."},
        {LanguageKind::Prolog, "loop :- loop.\n?- loop."},
    };
    for (const auto& [language, source] : loops) {
        ExecutionState state = startSource(language, source);
        REQUIRE_FALSE(state.stepFor(1000).has_value());
        REQUIRE_FALSE(state.stepFor(1000).has_value());
        state.abort();
        std::optional<ExecutionEvent> done = state.stepFor(1000);
        REQUIRE(done.has_value());
        REQUIRE(done->kind == Kind::Completed);
        REQUIRE(done->aborted);
    }
}

TEST_CASE("abort while waiting for input", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Pascal, "var n: integer;\nbegin readln(n); writeln(n) end.");
    REQUIRE(state.step().kind == Kind::InputRequested);
    state.abort();
    ExecutionEvent done = state.step();
    REQUIRE(done.kind == Kind::Completed);
    REQUIRE(done.aborted);
    REQUIRE_THROWS_AS(state.resume("3"), std::logic_error);
}

TEST_CASE("Snapshots are independent of the original", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 INPUT N\n20 PRINT N * 2");
    REQUIRE(state.step().kind == Kind::InputRequested);

    ExecutionState saved = state.snapshot();
    REQUIRE(state.resume("4").text == "8");
    REQUIRE(state.step().kind == Kind::Completed);

    REQUIRE(saved.awaitingInput());
    REQUIRE(saved.resume("10").text == "20");
    REQUIRE(saved.step().kind == Kind::Completed);
}

TEST_CASE("Snapshots copy the turtle", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "FORWARD 50\nRIGHT 90\nFORWARD 50");
    REQUIRE(state.step().kind == Kind::Draw);
    ExecutionState saved = state.snapshot();
    drive(state);
    REQUIRE(state.turtle().heading == 90.0);
    REQUIRE(state.turtle().position.x == Catch::Approx(50.0));
    REQUIRE(saved.turtle().heading == 0.0);
    REQUIRE(saved.turtle().position.y == Catch::Approx(50.0));
}

TEST_CASE("run stops at the first input request", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 PRINT \"A\"\n20 PRINT \"B\"\n30 INPUT X\n40 PRINT X");
    auto events = state.run();
    REQUIRE(events.size() == 3);
    REQUIRE(events[0].text == "A");
    REQUIRE(events[1].text == "B");
    REQUIRE(events[2].kind == Kind::InputRequested);

    state.resume("7");
    auto rest = state.run();
    REQUIRE(lastEvent(rest).kind == Kind::Completed);
}

TEST_CASE("Trace callback sees each statement when tracing is on", "[engine]") {
    ExecutionState state = startSource(LanguageKind::Basic, "10 LET A = 1\n20 PRINT A");
    std::vector<int> lines;
    state.setTraceCallback([&lines](int line, const std::string&) { lines.push_back(line); });
    REQUIRE_FALSE(state.getTrace());
    state.step();
    REQUIRE(lines.empty());

    ExecutionState traced = startSource(LanguageKind::Basic, "10 LET A = 1\n20 PRINT A");
    traced.setTraceCallback([&lines](int line, const std::string&) { lines.push_back(line); });
    traced.setTrace(true);
    drive(traced);
    REQUIRE(lines == std::vector<int>{1, 2});
}

TEST_CASE("Each language runs behind the same interface", "[engine]") {
    const std::pair<LanguageKind, std::string> programs[] = {
        {LanguageKind::Basic, "10 PRINT \"hi\""},
        {LanguageKind::Pascal, "begin writeln('hi') end."},
        {LanguageKind::Prolog, "?- write(hi), nl."},
    };
    for (const auto& [language, source] : programs) {
        ExecutionState state = startSource(language, source);
        REQUIRE(state.language() == language);
        REQUIRE(transcript(drive(state)) == "hi\n");
    }
}
