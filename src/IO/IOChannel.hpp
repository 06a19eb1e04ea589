#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "../Graphics/TurtleGraphics.hpp"

namespace timewarp {

struct SourceLocation {
    int line{0};
    int column{0};
};

/**
 * ExecutionEvent - one unit handed to the host by step()/resume().
 *
 * Output carries a text fragment and whether a line break follows it;
 * Draw carries one turtle primitive; InputRequested suspends the program
 * until resume(); Completed and RuntimeError are terminal.
 */
struct ExecutionEvent {
    enum class Kind { Output, Draw, InputRequested, Completed, RuntimeError };

    Kind kind{Kind::Completed};
    std::string text;                    // Output text, error message, completion detail
    bool newline{false};                 // Output: a line break follows the text
    DrawPrimitive primitive{};           // Draw
    std::optional<std::string> prompt;   // InputRequested
    uint16_t errorCode{0};               // RuntimeError
    std::optional<SourceLocation> location;
    bool aborted{false};                 // Completed because the host aborted

    static ExecutionEvent output(std::string text, bool newline) {
        ExecutionEvent e; e.kind = Kind::Output; e.text = std::move(text); e.newline = newline; return e;
    }
    static ExecutionEvent draw(const DrawPrimitive& p) {
        ExecutionEvent e; e.kind = Kind::Draw; e.primitive = p; return e;
    }
    static ExecutionEvent inputRequested(std::optional<std::string> prompt) {
        ExecutionEvent e; e.kind = Kind::InputRequested; e.prompt = std::move(prompt); return e;
    }
    static ExecutionEvent completed(std::string detail = {}) {
        ExecutionEvent e; e.kind = Kind::Completed; e.text = std::move(detail); return e;
    }
    static ExecutionEvent runtimeError(uint16_t code, std::string message, std::optional<SourceLocation> loc) {
        ExecutionEvent e; e.kind = Kind::RuntimeError; e.errorCode = code; e.text = std::move(message);
        e.location = loc; return e;
    }

    // Kind name of a RuntimeError ("TypeMismatch", ...).
    std::string errorKind() const;
};

const char* eventKindName(ExecutionEvent::Kind kind);

/**
 * IOChannel
 *
 * Ordered queue between an interpreter and the host. Output and Draw events
 * are delivered in emission order; a RequestInput queues behind them, so the
 * host cannot answer a request before it has seen everything printed before
 * it. While a request is outstanding nothing else may be emitted.
 */
class IOChannel {
public:
    // Interpreter -> host
    void output(const std::string& text, bool newline);
    void draw(const DrawPrimitive& primitive);
    void requestInput(std::optional<std::string> prompt);

    bool hasEvents() const { return !queue_.empty(); }
    ExecutionEvent next();

    // State of the outstanding request
    bool awaitingInput() const { return awaiting_; }
    bool requestDelivered() const { return awaiting_ && delivered_; }
    const std::optional<std::string>& pendingPrompt() const { return prompt_; }

    // Host -> interpreter. Valid only once the InputRequested event was delivered.
    std::string acceptInput(const std::string& text);

    // Drops undelivered events and any outstanding request (abort).
    void clear();

private:
    std::deque<ExecutionEvent> queue_;
    bool awaiting_{false};
    bool delivered_{false};
    std::optional<std::string> prompt_;

    void ensureNotAwaiting(const char* what) const;
};

} // namespace timewarp
