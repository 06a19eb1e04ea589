#pragma once

#include <string>
#include <utility>
#include <vector>

namespace timewarp {

// Unbounded logical coordinates; y grows upwards, heading 0 faces "up".
struct Point {
    double x{0.0};
    double y{0.0};
};

struct DrawPrimitive {
    enum class Kind { Line, Circle, Clear };

    Kind kind{Kind::Line};
    Point from{};       // Line start, Circle centre
    Point to{};         // Line end
    double radius{0.0}; // Circle only
    std::string color{"black"};
    double width{1.0};
};

struct TurtleState {
    Point position{};
    double heading{0.0};   // degrees clockwise from "up", in [0, 360)
    bool penDown{true};
    std::string color{"black"};
    double penWidth{1.0};
    bool visible{true};
};

struct TurtleCommand {
    enum class Kind {
        Forward, Back, Right, Left,
        PenUp, PenDown,
        Home, SetXY, SetHeading,
        SetColor, SetPenSize,
        Circle, Clear,
        ShowTurtle, HideTurtle
    };

    Kind kind{Kind::Forward};
    double amount{0.0};   // distance, angle, radius or pen size
    double x{0.0};        // SetXY
    double y{0.0};
    std::string color{};  // SetColor

    static TurtleCommand make(Kind k, double amount = 0.0) {
        TurtleCommand c; c.kind = k; c.amount = amount; return c;
    }
    static TurtleCommand setXY(double x, double y) {
        TurtleCommand c; c.kind = Kind::SetXY; c.x = x; c.y = y; return c;
    }
    static TurtleCommand setColor(std::string color) {
        TurtleCommand c; c.kind = Kind::SetColor; c.color = std::move(color); return c;
    }
};

struct TurtleResult {
    TurtleState state;
    std::vector<DrawPrimitive> primitives;
};

// Pure transition: new state plus the primitives the command draws, in order.
TurtleResult applyCommand(const TurtleState& state, const TurtleCommand& command);

double normalizeHeading(double degrees);

// Maps SETCOLOR arguments given as numbers onto the 16-colour palette names.
std::string paletteColorName(int index);

/**
 * TurtleGraphics
 *
 * The live turtle of one running program. Interpreters feed it commands and
 * forward the returned primitives to the IO channel; the host renderer reads
 * state() only between steps.
 */
class TurtleGraphics {
public:
    TurtleGraphics() = default;

    // Canonical start: origin, heading 0, given pen state, default colour and width.
    void reset(bool penDown = true);

    std::vector<DrawPrimitive> execute(const TurtleCommand& command);

    const TurtleState& state() const { return state_; }

private:
    TurtleState state_{};
};

} // namespace timewarp
