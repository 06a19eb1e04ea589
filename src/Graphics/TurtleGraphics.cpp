#include "TurtleGraphics.hpp"

#include <cmath>

namespace timewarp {

namespace {

constexpr double kPi = 3.14159265358979323846;

DrawPrimitive makeLine(const TurtleState& s, Point from, Point to) {
    DrawPrimitive p;
    p.kind = DrawPrimitive::Kind::Line;
    p.from = from;
    p.to = to;
    p.color = s.color;
    p.width = s.penWidth;
    return p;
}

// Moves to a new position, drawing a segment when the pen is down.
void moveTo(TurtleResult& r, Point target) {
    Point from = r.state.position;
    r.state.position = target;
    if (r.state.penDown) {
        r.primitives.push_back(makeLine(r.state, from, target));
    }
}

} // namespace

double normalizeHeading(double degrees) {
    double h = std::fmod(degrees, 360.0);
    if (h < 0) h += 360.0;
    // fmod of tiny negatives can round to exactly 360
    if (h >= 360.0) h -= 360.0;
    return h;
}

std::string paletteColorName(int index) {
    static const char* names[16] = {
        "black", "blue", "green", "cyan", "red", "magenta", "brown", "lightgray",
        "darkgray", "lightblue", "lightgreen", "lightcyan", "lightred", "lightmagenta", "yellow", "white"
    };
    if (index < 0) index = 0;
    return names[index % 16];
}

TurtleResult applyCommand(const TurtleState& state, const TurtleCommand& command) {
    TurtleResult r{state, {}};
    using Kind = TurtleCommand::Kind;

    switch (command.kind) {
        case Kind::Forward:
        case Kind::Back: {
            double distance = command.kind == Kind::Back ? -command.amount : command.amount;
            double rad = state.heading * kPi / 180.0;
            Point target{state.position.x + distance * std::sin(rad),
                         state.position.y + distance * std::cos(rad)};
            moveTo(r, target);
            break;
        }
        case Kind::Right:
            r.state.heading = normalizeHeading(state.heading + command.amount);
            break;
        case Kind::Left:
            r.state.heading = normalizeHeading(state.heading - command.amount);
            break;
        case Kind::PenUp:
            r.state.penDown = false;
            break;
        case Kind::PenDown:
            r.state.penDown = true;
            break;
        case Kind::Home:
            moveTo(r, Point{0.0, 0.0});
            r.state.heading = 0.0;
            break;
        case Kind::SetXY:
            moveTo(r, Point{command.x, command.y});
            break;
        case Kind::SetHeading:
            r.state.heading = normalizeHeading(command.amount);
            break;
        case Kind::SetColor:
            r.state.color = command.color;
            break;
        case Kind::SetPenSize:
            r.state.penWidth = command.amount > 0 ? command.amount : 1.0;
            break;
        case Kind::Circle: {
            DrawPrimitive p;
            p.kind = DrawPrimitive::Kind::Circle;
            p.from = state.position;
            p.radius = std::fabs(command.amount);
            p.color = state.color;
            p.width = state.penWidth;
            r.primitives.push_back(p);
            break;
        }
        case Kind::Clear: {
            DrawPrimitive p;
            p.kind = DrawPrimitive::Kind::Clear;
            r.primitives.push_back(p);
            r.state.position = Point{0.0, 0.0};
            r.state.heading = 0.0;
            break;
        }
        case Kind::ShowTurtle:
            r.state.visible = true;
            break;
        case Kind::HideTurtle:
            r.state.visible = false;
            break;
    }
    return r;
}

void TurtleGraphics::reset(bool penDown) {
    state_ = TurtleState{};
    state_.penDown = penDown;
}

std::vector<DrawPrimitive> TurtleGraphics::execute(const TurtleCommand& command) {
    TurtleResult r = applyCommand(state_, command);
    state_ = r.state;
    return std::move(r.primitives);
}

} // namespace timewarp
