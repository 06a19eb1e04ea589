#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "Interpreter.hpp"

namespace timewarp {

namespace basic { struct Program; }
namespace pascal { struct CompiledProgram; }
namespace prolog { struct Program; }

enum class LanguageKind { Basic, Pascal, Prolog };

const char* languageName(LanguageKind language);

// "basic" (or "logo", "pilot"), "pascal", "prolog", case-insensitive; nullopt otherwise.
std::optional<LanguageKind> languageFromName(const std::string& name);

// Picks a language from the file extension, then from the text itself.
LanguageKind detectLanguage(const std::string& path, const std::string& source);

/**
 * Program - a loaded, immutable program ready to be started any number of
 * times. Holds the parsed tree (BASIC, Prolog) or the compiled stack code
 * (Pascal).
 */
struct Program {
    using Code = std::variant<std::shared_ptr<const basic::Program>,
                              std::shared_ptr<const pascal::CompiledProgram>,
                              std::shared_ptr<const prolog::Program>>;

    LanguageKind language{LanguageKind::Basic};
    Code code;
};

struct LoadError {
    int line{0};
    int column{0};
    std::string message;
};

struct LoadResult {
    std::optional<Program> program;
    std::optional<LoadError> error;

    bool ok() const { return program.has_value(); }
};

// Lexes and parses (and for Pascal compiles) source text. Never returns a
// partial program: any failure is reported in LoadResult::error.
LoadResult load(LanguageKind language, const std::string& source);

/**
 * ExecutionState
 *
 * One run of a program. The host drives it with step() / resume() and reads
 * the turtle between steps. Copying an ExecutionState (or snapshot()) copies
 * the whole interpreter state: variables, stacks, turtle and the pending
 * input request.
 */
class ExecutionState {
public:
    ExecutionState(std::unique_ptr<Interpreter> interpreter, LanguageKind language);
    ExecutionState(const ExecutionState& other);
    ExecutionState& operator=(const ExecutionState& other);
    ExecutionState(ExecutionState&& other);
    ExecutionState& operator=(ExecutionState&& other);
    ~ExecutionState() = default;

    // Advances until the next event. After Completed or RuntimeError every
    // further call returns that same event.
    ExecutionEvent step();

    // Like step(), but gives control back after maxUnits units of work
    // without an event. Hosts that must keep a frame loop going call this.
    std::optional<ExecutionEvent> stepFor(std::size_t maxUnits);

    // Answers the InputRequested just returned by step(). Throws
    // std::logic_error when no request is outstanding.
    ExecutionEvent resume(const std::string& inputText);

    // Idempotent. Queued events are dropped and the next step() reports
    // Completed with aborted set. Safe to call from a signal handler or
    // another thread while step() is running; the flag is read before
    // every unit of work.
    void abort() { abortRequested_.store(true); }
    bool abortRequested() const { return abortRequested_.load(); }

    // Steps until InputRequested, Completed or RuntimeError; returns every
    // event produced, the stopping one last.
    std::vector<ExecutionEvent> run();

    ExecutionState snapshot() const { return *this; }

    // Tracing
    void setTrace(bool enabled);
    bool getTrace() const { return traceEnabled_; }
    void setTraceCallback(TraceCallback cb);

    LanguageKind language() const { return language_; }
    const TurtleState& turtle() const { return interpreter_->turtle(); }
    bool awaitingInput() const { return interpreter_->channel().requestDelivered(); }
    bool finished() const { return terminal_.has_value(); }
    const Interpreter& interpreter() const { return *interpreter_; }

private:
    std::unique_ptr<Interpreter> interpreter_;
    LanguageKind language_;
    std::atomic<bool> abortRequested_{false};
    std::optional<ExecutionEvent> terminal_;
    std::optional<ExecutionEvent> failure_;   // runtime error waiting for queued events to drain
    bool traceEnabled_{false};
    TraceCallback traceCallback_;

    void recordFailure(uint16_t code, const std::string& message, std::optional<SourceLocation> location);
    void installTrace();
};

// Builds the interpreter for program; turtle and environment start fresh.
ExecutionState start(const Program& program, const EngineOptions& options = EngineOptions{});

} // namespace timewarp
