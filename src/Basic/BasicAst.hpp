// Parsed form of a TW BASIC / PILOT / Logo program.
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "../Graphics/TurtleGraphics.hpp"

namespace timewarp {
namespace basic {

struct Expr;
using ExprPtr = std::unique_ptr<Expr>;

struct NumberLit { double value{0.0}; };
struct TextLit { std::string value; };
struct VarRef { std::string name; };                      // upper case, '$' suffix for text
struct ElementRef { std::string name; ExprPtr index; };    // DIM'd array element
struct CallExpr { std::string name; std::vector<ExprPtr> args; };
struct UnaryExpr { std::string op; ExprPtr operand; };     // "-" or "NOT"
struct BinaryExpr { std::string op; ExprPtr left; ExprPtr right; };

struct Expr {
    std::variant<NumberLit, TextLit, VarRef, ElementRef, CallExpr, UnaryExpr, BinaryExpr> node;
    int line{0};
    int column{0};
};

// Assignment / input destination: scalar or array element.
struct Target {
    std::string name;
    ExprPtr index; // null for scalars
};

inline bool isTextName(const std::string& name) {
    return !name.empty() && name.back() == '$';
}

struct Stmt;
using StmtPtr = std::unique_ptr<Stmt>;
using StmtList = std::vector<StmtPtr>;

struct LetStmt { Target target; ExprPtr value; };

struct PrintStmt {
    struct Item {
        ExprPtr expr;
        char separator{'\0'}; // ';' or ',' following the item, '\0' for none
    };
    std::vector<Item> items;
    bool newline{true};       // false when the statement ends with a separator
};

struct InputStmt {
    std::optional<std::string> prompt;
    std::vector<Target> targets;
};

struct GotoStmt { int lineNumber{0}; };
struct GosubStmt { int lineNumber{0}; };
struct ReturnStmt {};
struct EndStmt {};

struct IfStmt {
    ExprPtr condition;
    StmtList thenBranch;
    StmtList elseBranch;
};

struct ForStmt {
    std::string var;
    ExprPtr start;
    ExprPtr limit;
    ExprPtr step; // null: STEP 1
};

struct NextStmt { std::string var; }; // empty: innermost loop

struct DimStmt {
    struct Decl { std::string name; ExprPtr size; };
    std::vector<Decl> arrays;
};

struct TurtleStmt {
    TurtleCommand::Kind command{TurtleCommand::Kind::Forward};
    std::vector<ExprPtr> args;
    std::string colorName; // SETCOLOR given as a literal colour word
};

struct RepeatStmt {
    ExprPtr count;
    StmtList body;
};

// PILOT
struct PilotTypeStmt { std::string text; };
struct PilotAcceptStmt { std::optional<Target> target; };
struct PilotMatchStmt { std::vector<std::string> alternatives; };
struct PilotJumpStmt { std::string label; bool use{false}; }; // J: or U:
struct PilotEndStmt {};
struct LabelStmt { std::string name; };

// Guard written after a PILOT command letter: TY:, TN:, T(expr):
struct PilotGuard {
    enum class Kind { None, Yes, No, Condition };
    Kind kind{Kind::None};
    ExprPtr condition;
};

struct Stmt {
    std::variant<LetStmt, PrintStmt, InputStmt, GotoStmt, GosubStmt, ReturnStmt, EndStmt,
                 IfStmt, ForStmt, NextStmt, DimStmt, TurtleStmt, RepeatStmt,
                 PilotTypeStmt, PilotAcceptStmt, PilotMatchStmt, PilotJumpStmt, PilotEndStmt,
                 LabelStmt> node;
    PilotGuard guard;
    int line{0};
    int column{0};
};

struct Line {
    int number{-1};    // explicit line number, -1 for free-form lines
    int sourceLine{0}; // 1-based line in the source buffer
    StmtList statements;
};

/**
 * BasicProgram - immutable after a successful parse.
 *
 * Lines are stored in execution order: numbered lines sorted by number,
 * free-form lines placed after the numbered line that precedes them in the
 * source. lineIndex and labelIndex map GOTO/GOSUB and PILOT J:/U: targets to
 * positions in `lines`.
 */
struct Program {
    std::vector<Line> lines;
    std::map<int, size_t> lineIndex;
    std::map<std::string, size_t> labelIndex;
    std::set<std::string> numericNames;
    std::set<std::string> textNames;
};

} // namespace basic
} // namespace timewarp
