#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include "Engine/Engine.hpp"
#include "Runtime/Value.hpp"

using namespace timewarp;

namespace {

volatile std::sig_atomic_t g_interrupted = 0;
std::atomic<ExecutionState*> g_running{nullptr};

// abort() only stores an atomic flag.
void onInterrupt(int) {
    g_interrupted = 1;
    if (ExecutionState* state = g_running.load()) state->abort();
}

struct HostOptions {
    std::optional<LanguageKind> language;
    bool checkOnly{false};
    bool trace{false};
    bool draw{false};
    bool occursCheck{false};
    std::string file;
};

void printUsage(const char* argv0) {
    std::cout << "Time Warp interpreter\n";
    std::cout << "Usage: " << argv0 << " [--lang basic|pascal|prolog] [--check] [--trace] [--draw]"
              << " [--occurs-check] [file]\n";
    std::cout << "\n";
    std::cout << "Runs a TW BASIC/PILOT/Logo, TW Pascal or TW Prolog program.\n";
    std::cout << "Without a file the program text is read from standard input.\n";
    std::cout << "\n";
    std::cout << "  --lang NAME      language (default: from the file extension or the text)\n";
    std::cout << "  --check          only check the program for syntax errors\n";
    std::cout << "  --trace          print every executed line to stderr\n";
    std::cout << "  --draw           print turtle drawing commands to stdout\n";
    std::cout << "  --occurs-check   Prolog unification with occurs check\n";
}

// Returns 0 to continue, otherwise the exit code.
int parseArguments(int argc, char* argv[], HostOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return -1;
        } else if (arg == "--lang") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --lang needs a language name" << std::endl;
                return 2;
            }
            options.language = languageFromName(argv[++i]);
            if (!options.language) {
                std::cerr << "Error: unknown language '" << argv[i] << "'" << std::endl;
                return 2;
            }
        } else if (arg == "--check") {
            options.checkOnly = true;
        } else if (arg == "--trace") {
            options.trace = true;
        } else if (arg == "--draw") {
            options.draw = true;
        } else if (arg == "--occurs-check") {
            options.occursCheck = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: unknown option '" << arg << "'" << std::endl;
            return 2;
        } else if (options.file.empty()) {
            options.file = arg;
        } else {
            std::cerr << "Error: only one program file may be given" << std::endl;
            return 2;
        }
    }
    return 0;
}

std::string describe(const DrawPrimitive& p) {
    std::ostringstream os;
    switch (p.kind) {
        case DrawPrimitive::Kind::Line:
            os << "LINE " << formatNumber(p.from.x) << " " << formatNumber(p.from.y) << " "
               << formatNumber(p.to.x) << " " << formatNumber(p.to.y);
            break;
        case DrawPrimitive::Kind::Circle:
            os << "CIRCLE " << formatNumber(p.from.x) << " " << formatNumber(p.from.y) << " "
               << formatNumber(p.radius);
            break;
        case DrawPrimitive::Kind::Clear:
            return "CLEAR";
    }
    os << " " << p.color << " " << formatNumber(p.width);
    return os.str();
}

int runProgram(const HostOptions& options, const std::string& source) {
    const LanguageKind language = options.language ? *options.language : detectLanguage(options.file, source);
    LoadResult loaded = load(language, source);
    if (!loaded.ok()) {
        const LoadError& err = *loaded.error;
        std::cerr << (options.file.empty() ? "<stdin>" : options.file) << ":" << err.line << ":" << err.column
                  << ": syntax error: " << err.message << std::endl;
        return 2;
    }
    if (options.checkOnly) {
        std::cout << "OK (" << languageName(language) << ")" << std::endl;
        return 0;
    }

    EngineOptions engineOptions;
    engineOptions.occursCheck = options.occursCheck;
    ExecutionState state = start(*loaded.program, engineOptions);
    state.setTraceCallback([](int line, const std::string& detail) {
        std::cerr << "TRACE " << line << ": " << detail << "\n";
    });
    state.setTrace(options.trace);
    g_running.store(&state);
    if (g_interrupted) state.abort();

    // Text written since the last line break, used to avoid echoing a
    // prompt that was just printed.
    std::string partialLine;
    std::string lastLine;
    ExecutionEvent event = state.step();
    for (;;) {
        switch (event.kind) {
            case ExecutionEvent::Kind::Output:
                std::cout << event.text;
                partialLine += event.text;
                if (event.newline) {
                    std::cout << "\n";
                    lastLine = partialLine;
                    partialLine.clear();
                }
                event = state.step();
                break;
            case ExecutionEvent::Kind::Draw:
                if (options.draw) std::cout << describe(event.primitive) << "\n";
                event = state.step();
                break;
            case ExecutionEvent::Kind::InputRequested: {
                if (event.prompt) {
                    if (!(partialLine.empty() && *event.prompt == lastLine)) std::cout << *event.prompt;
                } else if (language == LanguageKind::Basic) {
                    std::cout << "? ";
                }
                std::cout.flush();
                std::string answer;
                if (!std::getline(std::cin, answer)) {
                    std::cerr << "Error: input requested but none is available" << std::endl;
                    state.abort();
                    event = state.step();
                    break;
                }
                partialLine.clear();
                event = state.resume(answer);
                break;
            }
            case ExecutionEvent::Kind::Completed:
                if (!partialLine.empty()) std::cout << "\n";
                std::cout.flush();
                g_running.store(nullptr);
                if (event.aborted) {
                    std::cerr << "Break" << std::endl;
                    return 130;
                }
                return 0;
            case ExecutionEvent::Kind::RuntimeError:
                g_running.store(nullptr);
                if (!partialLine.empty()) std::cout << "\n";
                std::cout.flush();
                std::cerr << event.errorKind() << " (" << event.errorCode << ")";
                if (event.location) std::cerr << " in line " << event.location->line;
                std::cerr << ": " << event.text << std::endl;
                return 1;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    HostOptions options;
    int rc = parseArguments(argc, argv, options);
    if (rc == -1) return 0;
    if (rc != 0) return rc;

    std::string source;
    if (options.file.empty()) {
        source.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        std::cin.clear();
    } else {
        std::ifstream file(options.file);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open file '" << options.file << "'" << std::endl;
            return 2;
        }
        source.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    std::signal(SIGINT, onInterrupt);
    return runProgram(options, source);
}
