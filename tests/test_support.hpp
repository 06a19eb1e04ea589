// Helpers shared by the language and engine tests.
#pragma once

#include <catch2/catch_all.hpp>

#include <deque>
#include <string>
#include <vector>

#include "../src/Engine/Engine.hpp"

namespace timewarp {
namespace testing {

inline ExecutionState startSource(LanguageKind language, const std::string& source,
                                  const EngineOptions& options = EngineOptions{}) {
    LoadResult loaded = load(language, source);
    if (!loaded.ok()) {
        FAIL("load failed at " << loaded.error->line << ":" << loaded.error->column << ": "
                               << loaded.error->message);
    }
    return start(*loaded.program, options);
}

// Steps to Completed / RuntimeError, answering input requests from `inputs`.
// Stops early (returning the InputRequested) when the answers run out.
inline std::vector<ExecutionEvent> drive(ExecutionState& state, std::vector<std::string> inputs = {}) {
    std::deque<std::string> pending(inputs.begin(), inputs.end());
    std::vector<ExecutionEvent> events;
    ExecutionEvent e = state.step();
    for (int guard = 0; guard < 200000; ++guard) {
        events.push_back(e);
        switch (e.kind) {
            case ExecutionEvent::Kind::Completed:
            case ExecutionEvent::Kind::RuntimeError:
                return events;
            case ExecutionEvent::Kind::InputRequested:
                if (pending.empty()) return events;
                e = state.resume(pending.front());
                pending.pop_front();
                break;
            default:
                e = state.step();
                break;
        }
    }
    FAIL("program did not finish");
    return events;
}

inline std::vector<ExecutionEvent> runSource(LanguageKind language, const std::string& source,
                                             std::vector<std::string> inputs = {}) {
    ExecutionState state = startSource(language, source);
    return drive(state, std::move(inputs));
}

// Output events rendered as the console would show them.
inline std::string transcript(const std::vector<ExecutionEvent>& events) {
    std::string out;
    for (const auto& e : events) {
        if (e.kind != ExecutionEvent::Kind::Output) continue;
        out += e.text;
        if (e.newline) out += "\n";
    }
    return out;
}

inline std::vector<ExecutionEvent> ofKind(const std::vector<ExecutionEvent>& events, ExecutionEvent::Kind kind) {
    std::vector<ExecutionEvent> out;
    for (const auto& e : events) {
        if (e.kind == kind) out.push_back(e);
    }
    return out;
}

inline const ExecutionEvent& lastEvent(const std::vector<ExecutionEvent>& events) {
    REQUIRE_FALSE(events.empty());
    return events.back();
}

} // namespace testing
} // namespace timewarp
