#include <catch2/catch_all.hpp>
#include <stdexcept>
#include "../src/IO/IOChannel.hpp"
#include "../src/Runtime/TWError.hpp"

using namespace timewarp;

TEST_CASE("Events come out in emission order", "[io]") {
    IOChannel io;
    io.output("A", false);
    DrawPrimitive line;
    io.draw(line);
    io.output("B", true);
    io.requestInput(std::string("? "));

    REQUIRE(io.next().text == "A");
    REQUIRE(io.next().kind == ExecutionEvent::Kind::Draw);
    ExecutionEvent b = io.next();
    REQUIRE(b.text == "B");
    REQUIRE(b.newline);
    REQUIRE(io.awaitingInput());
    REQUIRE_FALSE(io.requestDelivered());

    ExecutionEvent req = io.next();
    REQUIRE(req.kind == ExecutionEvent::Kind::InputRequested);
    REQUIRE(req.prompt == std::string("? "));
    REQUIRE(io.requestDelivered());
    REQUIRE_FALSE(io.hasEvents());
}

TEST_CASE("Nothing may be emitted while input is outstanding", "[io]") {
    IOChannel io;
    io.requestInput(std::nullopt);
    REQUIRE_THROWS_AS(io.output("x", true), std::logic_error);
    REQUIRE_THROWS_AS(io.requestInput(std::nullopt), std::logic_error);
}

TEST_CASE("Input is accepted only after the request was delivered", "[io]") {
    IOChannel io;
    REQUIRE_THROWS_AS(io.acceptInput("7"), std::logic_error);

    io.requestInput(std::nullopt);
    REQUIRE_THROWS_AS(io.acceptInput("7"), std::logic_error);

    ExecutionEvent req = io.next();
    REQUIRE_FALSE(req.prompt.has_value());
    REQUIRE(io.acceptInput("7") == "7");
    REQUIRE_FALSE(io.awaitingInput());
    io.output("ok", true);
    REQUIRE(io.hasEvents());
}

TEST_CASE("Clear drops queued events and the request", "[io]") {
    IOChannel io;
    io.output("lost", true);
    io.requestInput(std::string("name"));
    io.clear();
    REQUIRE_FALSE(io.hasEvents());
    REQUIRE_FALSE(io.awaitingInput());
    REQUIRE_FALSE(io.pendingPrompt().has_value());
    REQUIRE_THROWS_AS(io.next(), std::logic_error);
}

TEST_CASE("Runtime error events name their kind", "[io]") {
    ExecutionEvent e = ExecutionEvent::runtimeError(ErrorCodes::TYPE_MISMATCH, "bad", SourceLocation{4, 1});
    REQUIRE(e.errorKind() == "TypeMismatch");
    REQUIRE(e.location->line == 4);
    REQUIRE(ExecutionEvent::output("x", false).errorKind().empty());
    REQUIRE(std::string(eventKindName(ExecutionEvent::Kind::InputRequested)) == "InputRequested");
}
