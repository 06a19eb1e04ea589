#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "BasicAst.hpp"
#include "../Engine/Interpreter.hpp"
#include "../Runtime/RuntimeStack.hpp"
#include "../Runtime/Value.hpp"
#include "../Runtime/VariableTable.hpp"

namespace timewarp {

/**
 * BasicInterpreter
 *
 * Executes a basic::Program one statement per advance(). The position is a
 * (line, statement) cursor plus a stack of open REPEAT / IF blocks, so a
 * program suspended on INPUT or A: resumes exactly where it stopped.
 */
class BasicInterpreter : public Interpreter {
public:
    BasicInterpreter(std::shared_ptr<const basic::Program> program, const EngineOptions& options);

    void start() override;
    void advance() override;
    bool finished() const override { return ended_; }
    void provideInput(const std::string& text) override;
    std::unique_ptr<Interpreter> clone() const override;
    std::optional<SourceLocation> currentLocation() const override;

    const VariableTable& variables() const { return vars_; }

    // Expression evaluation against the current variables.
    Value evaluate(const basic::Expr& expr);

private:
    // Input the program is waiting for (INPUT variables are asked one by one).
    struct PendingInput {
        const basic::InputStmt* input{nullptr};   // INPUT statement, or null for A:
        const basic::PilotAcceptStmt* accept{nullptr};
        size_t next{0};
        std::optional<std::string> prompt;
    };

    std::shared_ptr<const basic::Program> program_;
    VariableTable vars_;
    RuntimeStack stack_;
    ProgramPosition pos_;
    bool ended_{false};
    std::optional<PendingInput> pending_;

    int line_{0};
    int column_{0};
    size_t printColumn_{0};

    // PILOT state
    std::string lastAnswer_;
    bool matched_{false};
    std::optional<std::string> lastTyped_; // T: text directly before an A:

    uint32_t rngState_{1};

    const basic::Stmt* fetch();
    void execute(const basic::Stmt& stmt);
    bool guardPasses(const basic::PilotGuard& guard);

    void execLet(const basic::LetStmt& s);
    void execPrint(const basic::PrintStmt& s);
    void execInput(const basic::InputStmt& s);
    void execIf(const basic::IfStmt& s);
    void execFor(const basic::ForStmt& s);
    void execNext(const basic::NextStmt& s);
    void execTurtle(const basic::TurtleStmt& s);
    void execRepeat(const basic::RepeatStmt& s);
    void execPilotType(const basic::PilotTypeStmt& s);
    void execPilotAccept(const basic::PilotAcceptStmt& s);
    void execPilotMatch(const basic::PilotMatchStmt& s);
    void execPilotJump(const basic::PilotJumpStmt& s);

    void jumpToLine(int lineNumber);
    void jumpToLabel(const std::string& label);
    void pushReturn();
    void skipPastNext(const std::string& var);
    void requestNextInput();
    void assign(const basic::Target& target, const Value& value);
    void emit(const std::string& text, bool newline);

    std::string interpolate(const std::string& text) const;
    Value callBuiltin(const basic::CallExpr& call);
    Value binary(const std::string& op, const Value& left, const Value& right);
    double nextRandom();
};

} // namespace timewarp
