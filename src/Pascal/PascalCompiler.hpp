#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "PascalAst.hpp"
#include "../Runtime/Value.hpp"

namespace timewarp {
namespace pascal {

enum class OpCode : uint8_t {
    PushConst,    // a: constant index
    Load,         // a: slot, b: scope (0 frame, 1 globals)
    Store,        // a: slot, b: scope, c: BaseType
    LoadElem,     // pops index; a/b: array slot, low: lower bound
    StoreElem,    // pops value, index; c: element BaseType
    PushRef,      // pushes a variable reference (var parameter / read target)
    PushElemRef,  // pops index
    StrIndex,     // pops index, string: 1-based character
    Neg, Not,
    Add, Sub, Mul, Div, IntDiv, Mod, And, Or,
    Eq, Ne, Lt, Gt, Le, Ge,
    Jump,         // a: target pc
    JumpIfFalse,
    JumpIfTrue,
    Pop,
    Call,         // a: unit index, b: argument count
    Return,
    Builtin,      // a: builtin id, b: argument count
    Write,        // a: argument count (value, width, decimals each), b: newline
    Read,         // pops reference; c: BaseType
    ReadLine,     // waits for a line and discards it
    StoreResult,  // pops function result; c: BaseType
    Halt
};

enum class BuiltinId : uint8_t {
    Abs, Sqr, Sqrt, Sin, Cos, Arctan, Ln, Exp, Round, Trunc, Odd, Ord, Chr, Length, Upcase, Pred, Succ
};

struct Instr {
    OpCode op{OpCode::Halt};
    int a{0};
    int b{0};
    int c{0};
    long low{0};
    int line{0};
    int column{0};
};

struct ParamInfo {
    int slot{0};
    BaseType type{BaseType::Integer};
    bool byRef{false};
};

// Stack code of the main program or one routine.
struct CodeUnit {
    std::string name;
    bool isFunction{false};
    BaseType returnType{BaseType::Integer};
    std::vector<ParamInfo> params;
    std::vector<TypeSpec> slots;   // slot 0 holds the result of a function
    std::vector<Instr> code;
    int line{0};
};

struct CompiledProgram {
    std::shared_ptr<const Program> tree;
    std::vector<Value> constants;
    std::vector<CodeUnit> units;   // units[0] is the main program
};

} // namespace pascal

/**
 * PascalCompiler
 *
 * Resolves every name of a parsed pascal::Program and lowers each routine to
 * stack code. Undeclared identifiers, misused routines and other static
 * errors are reported as ParseError, so a compiled program only fails at run
 * time on value-dependent conditions.
 */
class PascalCompiler {
public:
    std::shared_ptr<const pascal::CompiledProgram> compile(std::unique_ptr<pascal::Program> program);

private:
    struct Symbol {
        enum class Kind { Var, Const } kind{Kind::Var};
        int slot{0};
        bool global{false};
        pascal::TypeSpec type{};
        int constIndex{0};
    };

    std::shared_ptr<pascal::CompiledProgram> out_;
    std::map<std::string, Symbol> globals_;
    std::map<std::string, Symbol> locals_;
    std::map<std::string, int> routines_;
    const pascal::Routine* routine_{nullptr};
    pascal::CodeUnit* unit_{nullptr};
    bool inMain_{true};

    void declareBlock(const pascal::Block& block, std::map<std::string, Symbol>& scope, bool global);

    int addConstant(const Value& v);
    Value constantValue(const pascal::Expr& expr);
    int allocTemp(const pascal::TypeSpec& type);
    const Symbol* lookup(const std::string& name) const;
    const pascal::Routine* findRoutine(const std::string& name, int* index = nullptr) const;
    int scopeOf(const Symbol& s) const { return s.global && !inMain_ ? 1 : 0; }

    size_t emit(pascal::OpCode op, int a, int b, int c, int line, int column, long low = 0);
    size_t here() const { return unit_->code.size(); }
    void patch(size_t at, size_t target) { unit_->code[at].a = static_cast<int>(target); }

    void compileStmt(const pascal::Stmt& stmt);
    void compileStmts(const pascal::StmtList& list);
    void compileAssign(const pascal::AssignStmt& s, const pascal::Stmt& at);
    void compileCall(const std::string& name, const std::vector<pascal::ExprPtr>& args, int line, int column,
                     bool asStatement);
    void compileFor(const pascal::ForStmt& s, const pascal::Stmt& at);
    void compileCase(const pascal::CaseStmt& s, const pascal::Stmt& at);
    void compileRef(const std::string& name, const pascal::Expr* index, int line, int column);
    void compileExpr(const pascal::Expr& expr);

    [[noreturn]] static void fail(int line, int column, const std::string& message);
};

} // namespace timewarp
