#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "PascalCompiler.hpp"
#include "../Engine/Interpreter.hpp"
#include "../Runtime/Value.hpp"

namespace timewarp {

/**
 * PascalInterpreter
 *
 * Stack machine over pascal::CompiledProgram. advance() executes one
 * instruction. Every variable lives in a shared cell so that a var parameter
 * can alias the caller's variable (or one element of the caller's array).
 */
class PascalInterpreter : public Interpreter {
public:
    PascalInterpreter(std::shared_ptr<const pascal::CompiledProgram> program, const EngineOptions& options);

    void start() override;
    void advance() override;
    bool finished() const override { return ended_; }
    void provideInput(const std::string& text) override;
    std::unique_ptr<Interpreter> clone() const override;
    std::optional<SourceLocation> currentLocation() const override;

    size_t callDepth() const { return frames_.size(); }

private:
    struct VarRef {
        std::shared_ptr<Value> cell;
        long index{-1}; // element of the list in cell, -1 for the whole cell
    };

    struct Frame {
        const pascal::CodeUnit* unit{nullptr};
        size_t pc{0};
        std::vector<VarRef> slots;
        bool resultAssigned{false};
    };

    struct PendingRead {
        VarRef target;
        pascal::BaseType type{pascal::BaseType::String};
        bool discard{false};
    };

    std::shared_ptr<const pascal::CompiledProgram> program_;
    std::vector<Frame> frames_;
    std::vector<Value> stack_;
    std::vector<VarRef> refs_;
    std::optional<PendingRead> pending_;
    bool ended_{false};
    int line_{0};
    int column_{0};
    int tracedLine_{0};

    void pushFrame(const pascal::CodeUnit& unit);
    VarRef& slot(const pascal::Instr& in);
    Value pop();
    static Value& deref(const VarRef& ref);
    static void store(const VarRef& ref, const Value& value);
    static Value checkType(const Value& value, int type, const std::string& what);
    static Value defaultValue(const pascal::TypeSpec& type);
    static size_t elementIndex(const Value& array, const Value& index, long low);

    void execute(const pascal::Instr& in);
    void binary(pascal::OpCode op);
    void callBuiltin(pascal::BuiltinId id, int argc);
    void write(int argc, bool newline);
};

} // namespace timewarp
