#include "Engine.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "../Basic/BasicInterpreter.hpp"
#include "../Basic/BasicParser.hpp"
#include "../Pascal/PascalCompiler.hpp"
#include "../Pascal/PascalInterpreter.hpp"
#include "../Pascal/PascalParser.hpp"
#include "../Prolog/PrologInterpreter.hpp"
#include "../Prolog/PrologParser.hpp"
#include "../Runtime/TWError.hpp"

namespace timewarp {

namespace {

// Units of work step() runs between returns to its own loop.
constexpr std::size_t kUnitsPerSlice = 4096;

std::string toLowerCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

bool containsWord(const std::string& text, const std::string& word) {
    size_t pos = 0;
    while ((pos = text.find(word, pos)) != std::string::npos) {
        bool before = pos == 0 || !std::isalnum(static_cast<unsigned char>(text[pos - 1]));
        size_t end = pos + word.size();
        bool after = end >= text.size() || !std::isalnum(static_cast<unsigned char>(text[end]));
        if (before && after) return true;
        pos = end;
    }
    return false;
}

bool looksLikePascal(const std::string& lowered) {
    std::istringstream in(lowered);
    std::string word;
    if (in >> word && (word == "program" || word.rfind("program", 0) == 0)) return true;
    return containsWord(lowered, "begin") && lowered.find("end.") != std::string::npos;
}

bool looksLikeProlog(const std::string& source) {
    if (source.find(":-") != std::string::npos || source.find("?-") != std::string::npos) return true;
    std::istringstream in(source);
    std::string line;
    bool sawClause = false;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '%') continue;
        std::string lowered = toLowerCase(t);
        if (lowered == "clauses" || lowered == "predicates" || lowered == "domains") return true;
        // Every remaining line must look like a fact: name(...)  ending in '.'.
        if (!std::islower(static_cast<unsigned char>(t[0])) || t.back() != '.' || t.find('=') != std::string::npos) {
            return false;
        }
        sawClause = true;
    }
    return sawClause;
}

} // namespace

const char* languageName(LanguageKind language) {
    switch (language) {
        case LanguageKind::Basic: return "basic";
        case LanguageKind::Pascal: return "pascal";
        case LanguageKind::Prolog: return "prolog";
    }
    return "unknown";
}

std::optional<LanguageKind> languageFromName(const std::string& name) {
    const std::string n = toLowerCase(name);
    if (n == "basic" || n == "pilot" || n == "logo") return LanguageKind::Basic;
    if (n == "pascal") return LanguageKind::Pascal;
    if (n == "prolog") return LanguageKind::Prolog;
    return std::nullopt;
}

LanguageKind detectLanguage(const std::string& path, const std::string& source) {
    const size_t dot = path.find_last_of('.');
    const size_t slash = path.find_last_of("/\\");
    if (dot != std::string::npos && (slash == std::string::npos || dot > slash)) {
        const std::string ext = toLowerCase(path.substr(dot));
        if (ext == ".twb" || ext == ".bas" || ext == ".logo" || ext == ".pilot" || ext == ".tw") {
            return LanguageKind::Basic;
        }
        if (ext == ".twp" || ext == ".pas") return LanguageKind::Pascal;
        if (ext == ".tpr" || ext == ".plg" || ext == ".pl") return LanguageKind::Prolog;
    }
    if (looksLikePascal(toLowerCase(source))) return LanguageKind::Pascal;
    if (looksLikeProlog(source)) return LanguageKind::Prolog;
    return LanguageKind::Basic;
}

LoadResult load(LanguageKind language, const std::string& source) {
    LoadResult result;
    try {
        Program program;
        program.language = language;
        switch (language) {
            case LanguageKind::Basic: {
                BasicParser parser;
                program.code = parser.parse(source);
                break;
            }
            case LanguageKind::Pascal: {
                PascalParser parser;
                PascalCompiler compiler;
                program.code = compiler.compile(parser.parse(source));
                break;
            }
            case LanguageKind::Prolog: {
                PrologParser parser;
                program.code = parser.parse(source);
                break;
            }
        }
        result.program = std::move(program);
    } catch (const ParseError& e) {
        result.error = LoadError{e.getLine(), e.getColumn(), e.what()};
    }
    return result;
}

ExecutionState start(const Program& program, const EngineOptions& options) {
    std::unique_ptr<Interpreter> interpreter = std::visit(
        [&options](const auto& code) -> std::unique_ptr<Interpreter> {
            using T = std::decay_t<decltype(code)>;
            if constexpr (std::is_same_v<T, std::shared_ptr<const basic::Program>>) {
                return std::make_unique<BasicInterpreter>(code, options);
            } else if constexpr (std::is_same_v<T, std::shared_ptr<const pascal::CompiledProgram>>) {
                return std::make_unique<PascalInterpreter>(code, options);
            } else {
                return std::make_unique<PrologInterpreter>(code, options);
            }
        },
        program.code);
    return ExecutionState(std::move(interpreter), program.language);
}

ExecutionState::ExecutionState(std::unique_ptr<Interpreter> interpreter, LanguageKind language)
    : interpreter_(std::move(interpreter)), language_(language) {}

ExecutionState::ExecutionState(const ExecutionState& other)
    : interpreter_(other.interpreter_->clone()),
      language_(other.language_),
      abortRequested_(other.abortRequested_.load()),
      terminal_(other.terminal_),
      failure_(other.failure_),
      traceEnabled_(other.traceEnabled_),
      traceCallback_(other.traceCallback_) {
    installTrace();
}

ExecutionState::ExecutionState(ExecutionState&& other)
    : interpreter_(std::move(other.interpreter_)),
      language_(other.language_),
      abortRequested_(other.abortRequested_.load()),
      terminal_(std::move(other.terminal_)),
      failure_(std::move(other.failure_)),
      traceEnabled_(other.traceEnabled_),
      traceCallback_(std::move(other.traceCallback_)) {}

ExecutionState& ExecutionState::operator=(ExecutionState&& other) {
    if (this != &other) {
        interpreter_ = std::move(other.interpreter_);
        language_ = other.language_;
        abortRequested_.store(other.abortRequested_.load());
        terminal_ = std::move(other.terminal_);
        failure_ = std::move(other.failure_);
        traceEnabled_ = other.traceEnabled_;
        traceCallback_ = std::move(other.traceCallback_);
    }
    return *this;
}

ExecutionState& ExecutionState::operator=(const ExecutionState& other) {
    if (this != &other) {
        ExecutionState copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void ExecutionState::setTrace(bool enabled) {
    traceEnabled_ = enabled;
    installTrace();
}

void ExecutionState::setTraceCallback(TraceCallback cb) {
    traceCallback_ = std::move(cb);
    installTrace();
}

void ExecutionState::installTrace() {
    interpreter_->setTraceCallback(traceEnabled_ ? traceCallback_ : TraceCallback{});
}

void ExecutionState::recordFailure(uint16_t code, const std::string& message,
                                   std::optional<SourceLocation> location) {
    failure_ = ExecutionEvent::runtimeError(code, message, location);
}

ExecutionEvent ExecutionState::step() {
    for (;;) {
        if (std::optional<ExecutionEvent> event = stepFor(kUnitsPerSlice)) return *event;
    }
}

std::optional<ExecutionEvent> ExecutionState::stepFor(std::size_t maxUnits) {
    if (terminal_) return terminal_;
    IOChannel& channel = interpreter_->channel();

    for (std::size_t units = 0;; ++units) {
        if (abortRequested_.load()) {
            channel.clear();
            failure_.reset();
            ExecutionEvent done = ExecutionEvent::completed();
            done.aborted = true;
            terminal_ = done;
            return done;
        }
        // The request already handed out is still outstanding.
        if (channel.requestDelivered()) {
            return ExecutionEvent::inputRequested(channel.pendingPrompt());
        }
        if (channel.hasEvents()) return channel.next();
        if (failure_) {
            terminal_ = std::move(failure_);
            failure_.reset();
            return terminal_;
        }
        if (interpreter_->finished()) {
            terminal_ = ExecutionEvent::completed(interpreter_->completionDetail());
            return terminal_;
        }
        if (units >= maxUnits) return std::nullopt;
        try {
            interpreter_->advance();
        } catch (const TWError& e) {
            std::optional<SourceLocation> location;
            if (e.getLine() != 0) {
                location = SourceLocation{e.getLine(), e.getColumn()};
            } else {
                location = interpreter_->currentLocation();
            }
            recordFailure(e.getErrorCode(), e.what(), location);
        } catch (const std::exception& e) {
            recordFailure(ErrorCodes::INTERNAL_ERROR, std::string("Internal error: ") + e.what(),
                          interpreter_->currentLocation());
        }
    }
}

ExecutionEvent ExecutionState::resume(const std::string& inputText) {
    if (terminal_) throw std::logic_error("resume called after the program finished");
    interpreter_->channel().acceptInput(inputText);
    try {
        interpreter_->provideInput(inputText);
    } catch (const TWError& e) {
        recordFailure(e.getErrorCode(), e.what(), interpreter_->currentLocation());
    }
    return step();
}

std::vector<ExecutionEvent> ExecutionState::run() {
    std::vector<ExecutionEvent> events;
    for (;;) {
        events.push_back(step());
        const ExecutionEvent::Kind kind = events.back().kind;
        if (kind == ExecutionEvent::Kind::InputRequested || kind == ExecutionEvent::Kind::Completed ||
            kind == ExecutionEvent::Kind::RuntimeError) {
            return events;
        }
    }
}

} // namespace timewarp
