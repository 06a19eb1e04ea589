#include <SDL3/SDL.h>

#include <cmath>
#include <cstddef>
#include <deque>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "Engine/Engine.hpp"

using namespace timewarp;

// SDL3 canvas host: turtle drawing on top, program text below, keyboard input
// collected on the bottom line while the program waits for it.
class TimeWarpCanvas {
private:
    struct Rgb {
        Uint8 r, g, b;
    };

    SDL_Window* window{nullptr};
    SDL_Renderer* renderer{nullptr};

    int screenWidth = 800;
    int screenHeight = 600;
    static constexpr int TEXT_ROWS = 12;
    static constexpr int CHAR_W = 8;   // SDL debug font cell
    static constexpr int CHAR_H = 10;
    static constexpr int EVENTS_PER_FRAME = 500;
    static constexpr std::size_t UNITS_PER_FRAME = 20000;

    std::optional<ExecutionState> state;
    std::vector<DrawPrimitive> drawing;
    std::deque<std::string> lines{""};
    std::string inputLine;
    bool waitingForInput = false;
    bool done = false;
    bool running = true;

    static const std::map<std::string, Rgb>& palette() {
        static const std::map<std::string, Rgb> colors = {
            {"black", {0, 0, 0}},          {"blue", {0, 0, 170}},          {"green", {0, 170, 0}},
            {"cyan", {0, 170, 170}},       {"red", {170, 0, 0}},           {"magenta", {170, 0, 170}},
            {"brown", {170, 85, 0}},       {"lightgray", {170, 170, 170}}, {"darkgray", {85, 85, 85}},
            {"lightblue", {85, 85, 255}},  {"lightgreen", {85, 255, 85}},  {"lightcyan", {85, 255, 255}},
            {"lightred", {255, 85, 85}},   {"lightmagenta", {255, 85, 255}}, {"yellow", {255, 255, 85}},
            {"white", {255, 255, 255}},    {"orange", {255, 165, 0}},      {"purple", {128, 0, 128}},
            {"gray", {128, 128, 128}},     {"pink", {255, 192, 203}},
        };
        return colors;
    }

    void setColor(const std::string& name) {
        auto it = palette().find(name);
        Rgb c = it == palette().end() ? Rgb{0, 0, 0} : it->second;
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, 255);
    }

    void appendText(const std::string& text, bool newline) {
        lines.back() += text;
        if (newline) lines.emplace_back();
        while (static_cast<int>(lines.size()) > TEXT_ROWS) lines.pop_front();
    }

    // Logical turtle coordinates: origin at the canvas centre, y upwards.
    float toScreenX(double x) const { return static_cast<float>(screenWidth / 2.0 + x); }
    float toScreenY(double y) const { return static_cast<float>(canvasHeight() / 2.0 - y); }
    int canvasHeight() const { return screenHeight - TEXT_ROWS * CHAR_H - 8; }

    void handleEvent(const ExecutionEvent& event) {
        switch (event.kind) {
            case ExecutionEvent::Kind::Output:
                appendText(event.text, event.newline);
                break;
            case ExecutionEvent::Kind::Draw:
                if (event.primitive.kind == DrawPrimitive::Kind::Clear) {
                    drawing.clear();
                } else {
                    drawing.push_back(event.primitive);
                }
                break;
            case ExecutionEvent::Kind::InputRequested:
                if (event.prompt && lines.back().empty()) appendText(*event.prompt, false);
                waitingForInput = true;
                inputLine.clear();
                SDL_StartTextInput(window);
                break;
            case ExecutionEvent::Kind::Completed:
                if (!lines.back().empty()) appendText("", true);
                appendText(event.aborted ? "Break" : (event.text.empty() ? "Ok" : event.text), true);
                done = true;
                break;
            case ExecutionEvent::Kind::RuntimeError: {
                if (!lines.back().empty()) appendText("", true);
                std::string msg = event.errorKind();
                if (event.location) msg += " in line " + std::to_string(event.location->line);
                appendText(msg + ": " + event.text, true);
                done = true;
                break;
            }
        }
    }

    void pump() {
        if (!state || done || waitingForInput) return;
        for (int i = 0; i < EVENTS_PER_FRAME && !done && !waitingForInput; ++i) {
            std::optional<ExecutionEvent> event = state->stepFor(UNITS_PER_FRAME);
            // Out of budget: hand the frame back so input stays responsive.
            if (!event) break;
            handleEvent(*event);
        }
    }

    void submitInput() {
        appendText(inputLine, true);
        waitingForInput = false;
        SDL_StopTextInput(window);
        handleEvent(state->resume(inputLine));
        inputLine.clear();
    }

    void handleSdlEvent(const SDL_Event& event) {
        switch (event.type) {
            case SDL_EVENT_QUIT:
                running = false;
                break;
            case SDL_EVENT_WINDOW_RESIZED:
                screenWidth = event.window.data1;
                screenHeight = event.window.data2;
                break;
            case SDL_EVENT_TEXT_INPUT:
                if (waitingForInput) inputLine += event.text.text;
                break;
            case SDL_EVENT_KEY_DOWN: {
                SDL_Keycode keycode = event.key.key;
                if (keycode == SDLK_ESCAPE && state && !done) {
                    state->abort();
                    if (waitingForInput) {
                        waitingForInput = false;
                        SDL_StopTextInput(window);
                    }
                    handleEvent(state->step());
                } else if (waitingForInput && (keycode == SDLK_RETURN || keycode == SDLK_KP_ENTER)) {
                    submitInput();
                } else if (waitingForInput && keycode == SDLK_BACKSPACE && !inputLine.empty()) {
                    inputLine.pop_back();
                }
                break;
            }
            default:
                break;
        }
    }

    void drawCircle(const DrawPrimitive& p) {
        const int segments = 48;
        const double step = 2.0 * 3.14159265358979323846 / segments;
        for (int i = 0; i < segments; ++i) {
            double a0 = i * step;
            double a1 = (i + 1) * step;
            SDL_RenderLine(renderer,
                           toScreenX(p.from.x + p.radius * std::cos(a0)), toScreenY(p.from.y + p.radius * std::sin(a0)),
                           toScreenX(p.from.x + p.radius * std::cos(a1)), toScreenY(p.from.y + p.radius * std::sin(a1)));
        }
    }

    void render() {
        SDL_SetRenderDrawColor(renderer, 255, 255, 255, 255);
        SDL_RenderClear(renderer);

        for (const auto& p : drawing) {
            setColor(p.color);
            if (p.kind == DrawPrimitive::Kind::Line) {
                SDL_RenderLine(renderer, toScreenX(p.from.x), toScreenY(p.from.y), toScreenX(p.to.x), toScreenY(p.to.y));
            } else if (p.kind == DrawPrimitive::Kind::Circle) {
                drawCircle(p);
            }
        }

        if (state && state->turtle().visible) {
            const TurtleState& t = state->turtle();
            const double rad = t.heading * 3.14159265358979323846 / 180.0;
            const double tipX = t.position.x + 10 * std::sin(rad);
            const double tipY = t.position.y + 10 * std::cos(rad);
            SDL_SetRenderDrawColor(renderer, 0, 128, 0, 255);
            SDL_RenderLine(renderer, toScreenX(t.position.x), toScreenY(t.position.y), toScreenX(tipX), toScreenY(tipY));
        }

        // Text panel
        const float top = static_cast<float>(canvasHeight());
        SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
        SDL_FRect panel = {0.0f, top, static_cast<float>(screenWidth), static_cast<float>(screenHeight) - top};
        SDL_RenderFillRect(renderer, &panel);
        SDL_SetRenderDrawColor(renderer, 170, 170, 170, 255);
        float y = top + 4.0f;
        for (size_t i = 0; i < lines.size(); ++i) {
            std::string text = lines[i];
            if (i + 1 == lines.size() && waitingForInput) text += inputLine + "_";
            SDL_RenderDebugText(renderer, 4.0f, y, text.c_str());
            y += CHAR_H;
        }

        SDL_RenderPresent(renderer);
    }

public:
    TimeWarpCanvas() = default;
    ~TimeWarpCanvas() {
        if (renderer) SDL_DestroyRenderer(renderer);
        if (window) SDL_DestroyWindow(window);
        SDL_Quit();
    }

    bool initialize() {
        if (!SDL_Init(SDL_INIT_VIDEO)) {
            std::cerr << "SDL initialization failed: " << SDL_GetError() << std::endl;
            return false;
        }
        window = SDL_CreateWindow("Time Warp", screenWidth, screenHeight, SDL_WINDOW_RESIZABLE);
        if (!window) {
            std::cerr << "Window creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        renderer = SDL_CreateRenderer(window, nullptr);
        if (!renderer) {
            std::cerr << "Renderer creation failed: " << SDL_GetError() << std::endl;
            return false;
        }
        return true;
    }

    bool loadFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            std::cerr << "Error: Cannot open file '" << path << "'" << std::endl;
            return false;
        }
        std::string source((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        LoadResult loaded = load(detectLanguage(path, source), source);
        if (!loaded.ok()) {
            appendText("Syntax error in line " + std::to_string(loaded.error->line) + ", column " +
                           std::to_string(loaded.error->column) + ": " + loaded.error->message,
                       true);
            done = true;
            return false;
        }
        state.emplace(start(*loaded.program));
        return true;
    }

    void run() {
        while (running) {
            SDL_Event event;
            while (SDL_PollEvent(&event)) handleSdlEvent(event);
            pump();
            render();
            SDL_Delay(16); // ~60 FPS
        }
    }
};

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " program.twb|program.twp|program.tpr\n";
        return argc == 1 ? 0 : 2;
    }
    TimeWarpCanvas canvas;
    if (!canvas.initialize()) return 1;
    canvas.loadFile(argv[1]);
    canvas.run();
    return 0;
}
