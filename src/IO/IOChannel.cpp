#include "IOChannel.hpp"

#include <stdexcept>

#include "../Runtime/TWError.hpp"

namespace timewarp {

std::string ExecutionEvent::errorKind() const {
    return kind == Kind::RuntimeError ? ErrorCodes::name(errorCode) : "";
}

const char* eventKindName(ExecutionEvent::Kind kind) {
    switch (kind) {
        case ExecutionEvent::Kind::Output: return "Output";
        case ExecutionEvent::Kind::Draw: return "Draw";
        case ExecutionEvent::Kind::InputRequested: return "InputRequested";
        case ExecutionEvent::Kind::Completed: return "Completed";
        case ExecutionEvent::Kind::RuntimeError: return "RuntimeError";
    }
    return "Event";
}

void IOChannel::ensureNotAwaiting(const char* what) const {
    if (awaiting_) {
        throw std::logic_error(std::string(what) + " while an input request is outstanding");
    }
}

void IOChannel::output(const std::string& text, bool newline) {
    ensureNotAwaiting("Output");
    queue_.push_back(ExecutionEvent::output(text, newline));
}

void IOChannel::draw(const DrawPrimitive& primitive) {
    ensureNotAwaiting("Draw");
    queue_.push_back(ExecutionEvent::draw(primitive));
}

void IOChannel::requestInput(std::optional<std::string> prompt) {
    ensureNotAwaiting("RequestInput");
    awaiting_ = true;
    delivered_ = false;
    prompt_ = prompt;
    queue_.push_back(ExecutionEvent::inputRequested(std::move(prompt)));
}

ExecutionEvent IOChannel::next() {
    if (queue_.empty()) {
        throw std::logic_error("IOChannel::next on an empty queue");
    }
    ExecutionEvent e = std::move(queue_.front());
    queue_.pop_front();
    if (e.kind == ExecutionEvent::Kind::InputRequested) delivered_ = true;
    return e;
}

std::string IOChannel::acceptInput(const std::string& text) {
    if (!awaiting_ || !delivered_) {
        throw std::logic_error("resume called without an outstanding InputRequested");
    }
    awaiting_ = false;
    delivered_ = false;
    prompt_.reset();
    return text;
}

void IOChannel::clear() {
    queue_.clear();
    awaiting_ = false;
    delivered_ = false;
    prompt_.reset();
}

} // namespace timewarp
