#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "../Graphics/TurtleGraphics.hpp"
#include "../IO/IOChannel.hpp"

namespace timewarp {

// Called before each statement / instruction / resolution step when set.
using TraceCallback = std::function<void(int line, const std::string& detail)>;

struct EngineOptions {
    bool initialPenDown{true};
    bool occursCheck{false};          // Prolog unification
    std::size_t maxCallDepth{10000};  // GOSUB / U: / Pascal routine nesting
    uint32_t randomSeed{1};           // BASIC RND
};

/**
 * Interpreter - execution contract shared by the three languages.
 *
 * An interpreter never blocks: advance() performs one unit of work (a BASIC
 * statement, a Pascal instruction, a Prolog resolution step) and reports
 * what it produced through channel(). Input is requested on the channel and
 * delivered later through provideInput(), so all execution state lives in the
 * object and can be copied with clone().
 */
class Interpreter {
public:
    virtual ~Interpreter() = default;

    // Resets to the canonical start state (empty environment, fresh turtle).
    virtual void start() = 0;

    // One unit of work. Throws TWError on a runtime error.
    virtual void advance() = 0;

    virtual bool finished() const = 0;

    // Text attached to the Completed event ("No more solutions" for Prolog).
    virtual std::string completionDetail() const { return {}; }

    // Value for the outstanding input request. A text that does not parse into
    // the target's type re-issues the same request on the channel.
    virtual void provideInput(const std::string& text) = 0;

    virtual std::unique_ptr<Interpreter> clone() const = 0;

    // Location of the statement / instruction / goal being executed.
    virtual std::optional<SourceLocation> currentLocation() const = 0;

    IOChannel& channel() { return channel_; }
    const IOChannel& channel() const { return channel_; }
    const TurtleState& turtle() const { return turtle_.state(); }

    void setTraceCallback(TraceCallback callback) { trace_ = std::move(callback); }

protected:
    explicit Interpreter(const EngineOptions& options) : options_(options) {}
    Interpreter(const Interpreter&) = default;
    Interpreter& operator=(const Interpreter&) = default;

    void trace(int line, const std::string& detail) const {
        if (trace_) trace_(line, detail);
    }

    // Runs a turtle command and forwards its primitives to the channel.
    void drawCommand(const TurtleCommand& command) {
        for (const auto& p : turtle_.execute(command)) channel_.draw(p);
    }

    EngineOptions options_;
    IOChannel channel_;
    TurtleGraphics turtle_;
    TraceCallback trace_;
};

} // namespace timewarp
