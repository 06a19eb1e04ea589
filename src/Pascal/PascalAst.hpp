// Parsed form of a TW Pascal program.
#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace timewarp {
namespace pascal {

enum class BaseType { Integer, Real, Boolean, String, Char };

struct TypeSpec {
    BaseType base{BaseType::Integer};
    bool isArray{false};
    long low{0};   // array bounds, inclusive
    long high{0};
};

const char* baseTypeName(BaseType type);

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct NumberLit { double value{0.0}; bool integral{true}; };
struct StringLit { std::string value; };
struct BoolLit { bool value{false}; };
struct NameRef { std::string name; };                              // variable, constant or parameterless function
struct IndexRef { std::string name; ExprPtr index; };              // array element or string character
struct CallExpr { std::string name; std::vector<ExprPtr> args; };  // function / builtin call
struct UnaryExpr { std::string op; ExprPtr operand; };            // "-", "NOT"
struct BinaryExpr { std::string op; ExprPtr left; ExprPtr right; };

struct Expr {
    std::variant<NumberLit, StringLit, BoolLit, NameRef, IndexRef, CallExpr, UnaryExpr, BinaryExpr> node;
    int line{0};
    int column{0};
};

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

struct VarTarget {
    std::string name;
    ExprPtr index; // null for whole variables
    int line{0};
    int column{0};
};

struct CompoundStmt { StmtList body; };
struct AssignStmt { VarTarget target; ExprPtr value; };
struct CallStmt { std::string name; std::vector<ExprPtr> args; };

struct WriteArg {
    ExprPtr value;
    ExprPtr width;    // optional ":w"
    ExprPtr decimals; // optional ":d"
};
struct WriteStmt { std::vector<WriteArg> args; bool newline{false}; };
struct ReadStmt { std::vector<VarTarget> targets; bool newline{false}; };

struct IfStmt { ExprPtr condition; StmtPtr thenBranch; StmtPtr elseBranch; };
struct WhileStmt { ExprPtr condition; StmtPtr body; };
struct RepeatStmt { StmtList body; ExprPtr condition; };
struct ForStmt { std::string var; ExprPtr start; ExprPtr finish; bool downto{false}; StmtPtr body; };

struct CaseArm {
    std::vector<ExprPtr> labels;
    StmtPtr body;
};
struct CaseStmt { ExprPtr selector; std::vector<CaseArm> arms; StmtList elseBody; bool hasElse{false}; };

struct ExitStmt {};
struct HaltStmt {};
struct EmptyStmt {};

struct Stmt {
    std::variant<CompoundStmt, AssignStmt, CallStmt, WriteStmt, ReadStmt, IfStmt, WhileStmt,
                 RepeatStmt, ForStmt, CaseStmt, ExitStmt, HaltStmt, EmptyStmt> node;
    int line{0};
    int column{0};
};

struct ConstDecl {
    std::string name;
    ExprPtr value;
    int line{0};
    int column{0};
};

struct VarDecl {
    std::string name;
    TypeSpec type;
    int line{0};
    int column{0};
};

struct Param {
    std::string name;
    TypeSpec type;
    bool byRef{false};
};

// Declarations and body of the main program or of one routine.
struct Block {
    std::vector<ConstDecl> consts;
    std::vector<VarDecl> vars;
    StmtList body;
};

struct Routine {
    std::string name;        // upper case lookup key
    std::string displayName; // as written at the declaration
    bool isFunction{false};
    std::vector<Param> params;
    TypeSpec returnType{};
    Block block;
    int line{0};
    int column{0};
};

struct Program {
    std::string name;
    Block main;
    std::vector<Routine> routines;
};

} // namespace pascal
} // namespace timewarp
