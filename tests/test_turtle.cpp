#include <catch2/catch_all.hpp>
#include "../src/Graphics/TurtleGraphics.hpp"

using namespace timewarp;
using Catch::Matchers::WithinAbs;

TEST_CASE("Forward from the origin draws one line upwards", "[turtle]") {
    TurtleGraphics turtle;
    auto prims = turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 100));
    REQUIRE(prims.size() == 1);
    REQUIRE(prims[0].kind == DrawPrimitive::Kind::Line);
    REQUIRE_THAT(prims[0].from.x, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(prims[0].from.y, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(prims[0].to.x, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(prims[0].to.y, WithinAbs(100.0, 1e-9));
    REQUIRE(prims[0].color == "black");
    REQUIRE_THAT(turtle.state().position.y, WithinAbs(100.0, 1e-9));
}

TEST_CASE("Forward then back returns to the start", "[turtle]") {
    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Right, 30));
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 57));
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Back, 57));
    REQUIRE_THAT(turtle.state().position.x, WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(turtle.state().position.y, WithinAbs(0.0, 1e-9));
    REQUIRE(turtle.state().heading == 30.0);
}

TEST_CASE("Headings stay in [0, 360)", "[turtle]") {
    REQUIRE(normalizeHeading(-90) == 270.0);
    REQUIRE(normalizeHeading(360) == 0.0);
    REQUIRE(normalizeHeading(725) == 5.0);

    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Left, 90));
    REQUIRE(turtle.state().heading == 270.0);
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Right, 180));
    REQUIRE(turtle.state().heading == 90.0);
}

TEST_CASE("Pen up moves without drawing", "[turtle]") {
    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::PenUp));
    REQUIRE(turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 20)).empty());
    REQUIRE(turtle.execute(TurtleCommand::setXY(5, 5)).empty());
    REQUIRE_THAT(turtle.state().position.x, WithinAbs(5.0, 1e-9));

    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::PenDown));
    auto prims = turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Home));
    REQUIRE(prims.size() == 1);
    REQUIRE(turtle.state().heading == 0.0);
}

TEST_CASE("Colour and pen size apply to later lines", "[turtle]") {
    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::setColor("red"));
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::SetPenSize, 3));
    auto prims = turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 10));
    REQUIRE(prims[0].color == "red");
    REQUIRE(prims[0].width == 3.0);
    REQUIRE(paletteColorName(4) == "red");
    REQUIRE(paletteColorName(15) == "white");
}

TEST_CASE("Circle and clear primitives", "[turtle]") {
    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 10));
    auto circle = turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Circle, 25));
    REQUIRE(circle.size() == 1);
    REQUIRE(circle[0].kind == DrawPrimitive::Kind::Circle);
    REQUIRE(circle[0].radius == 25.0);
    REQUIRE_THAT(circle[0].from.y, WithinAbs(10.0, 1e-9));

    auto cleared = turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Clear));
    REQUIRE(cleared.size() == 1);
    REQUIRE(cleared[0].kind == DrawPrimitive::Kind::Clear);
    REQUIRE(turtle.state().position.y == 0.0);
}

TEST_CASE("applyCommand leaves the input state untouched", "[turtle]") {
    TurtleState s;
    TurtleResult r = applyCommand(s, TurtleCommand::make(TurtleCommand::Kind::Forward, 10));
    REQUIRE(s.position.y == 0.0);
    REQUIRE_THAT(r.state.position.y, WithinAbs(10.0, 1e-9));
}

TEST_CASE("Reset restores the canonical start", "[turtle]") {
    TurtleGraphics turtle;
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::Forward, 10));
    turtle.execute(TurtleCommand::make(TurtleCommand::Kind::HideTurtle));
    turtle.reset(false);
    REQUIRE(turtle.state().position.y == 0.0);
    REQUIRE_FALSE(turtle.state().penDown);
    REQUIRE(turtle.state().visible);
    REQUIRE(turtle.state().color == "black");
}
