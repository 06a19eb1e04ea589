#include "PascalCompiler.hpp"

#include <cmath>
#include <type_traits>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace pascal;

namespace {

struct BuiltinInfo {
    BuiltinId id;
    int arity;
};

const std::map<std::string, BuiltinInfo>& builtins() {
    static const std::map<std::string, BuiltinInfo> table = {
        {"ABS", {BuiltinId::Abs, 1}}, {"SQR", {BuiltinId::Sqr, 1}}, {"SQRT", {BuiltinId::Sqrt, 1}},
        {"SIN", {BuiltinId::Sin, 1}}, {"COS", {BuiltinId::Cos, 1}}, {"ARCTAN", {BuiltinId::Arctan, 1}},
        {"LN", {BuiltinId::Ln, 1}}, {"EXP", {BuiltinId::Exp, 1}}, {"ROUND", {BuiltinId::Round, 1}},
        {"TRUNC", {BuiltinId::Trunc, 1}}, {"ODD", {BuiltinId::Odd, 1}}, {"ORD", {BuiltinId::Ord, 1}},
        {"CHR", {BuiltinId::Chr, 1}}, {"LENGTH", {BuiltinId::Length, 1}}, {"UPCASE", {BuiltinId::Upcase, 1}},
        {"PRED", {BuiltinId::Pred, 1}}, {"SUCC", {BuiltinId::Succ, 1}},
    };
    return table;
}

OpCode binaryOp(const std::string& op) {
    if (op == "+") return OpCode::Add;
    if (op == "-") return OpCode::Sub;
    if (op == "*") return OpCode::Mul;
    if (op == "/") return OpCode::Div;
    if (op == "DIV") return OpCode::IntDiv;
    if (op == "MOD") return OpCode::Mod;
    if (op == "AND") return OpCode::And;
    if (op == "OR") return OpCode::Or;
    if (op == "=") return OpCode::Eq;
    if (op == "<>") return OpCode::Ne;
    if (op == "<") return OpCode::Lt;
    if (op == ">") return OpCode::Gt;
    if (op == "<=") return OpCode::Le;
    return OpCode::Ge;
}

TypeSpec scalarType(BaseType base) {
    TypeSpec t;
    t.base = base;
    return t;
}

} // namespace

void PascalCompiler::fail(int line, int column, const std::string& message) {
    throw ParseError(line, column, message);
}

std::shared_ptr<const CompiledProgram> PascalCompiler::compile(std::unique_ptr<Program> program) {
    out_ = std::make_shared<CompiledProgram>();
    std::shared_ptr<const Program> tree(std::move(program));
    out_->tree = tree;
    globals_.clear();
    locals_.clear();
    routines_.clear();

    out_->units.resize(1 + tree->routines.size());
    for (size_t i = 0; i < tree->routines.size(); ++i) {
        const Routine& r = tree->routines[i];
        if (routines_.count(r.name) || builtins().count(r.name)) {
            fail(r.line, r.column, "Duplicate identifier " + r.displayName);
        }
        routines_[r.name] = static_cast<int>(i + 1);
    }

    // Main program: globals live in frame 0.
    unit_ = &out_->units[0];
    unit_->name = tree->name.empty() ? "program" : tree->name;
    inMain_ = true;
    routine_ = nullptr;
    declareBlock(tree->main, globals_, true);
    compileStmts(tree->main.body);
    emit(OpCode::Halt, 0, 0, 0, 0, 0);

    inMain_ = false;
    for (size_t i = 0; i < tree->routines.size(); ++i) {
        const Routine& r = tree->routines[i];
        routine_ = &r;
        unit_ = &out_->units[i + 1];
        unit_->name = r.displayName;
        unit_->isFunction = r.isFunction;
        unit_->returnType = r.returnType.base;
        unit_->line = r.line;
        locals_.clear();

        if (r.isFunction) unit_->slots.push_back(r.returnType);
        for (const auto& p : r.params) {
            if (locals_.count(p.name)) fail(r.line, r.column, "Duplicate parameter " + p.name);
            Symbol s;
            s.slot = static_cast<int>(unit_->slots.size());
            s.type = p.type;
            locals_[p.name] = s;
            unit_->params.push_back(ParamInfo{s.slot, p.type.base, p.byRef});
            unit_->slots.push_back(p.type);
        }
        declareBlock(r.block, locals_, false);
        compileStmts(r.block.body);
        emit(OpCode::Return, 0, 0, 0, r.line, r.column);
    }

    unit_ = nullptr;
    routine_ = nullptr;
    std::shared_ptr<const CompiledProgram> result = out_;
    out_.reset();
    return result;
}

void PascalCompiler::declareBlock(const Block& block, std::map<std::string, Symbol>& scope, bool global) {
    for (const auto& k : block.consts) {
        if (scope.count(k.name) || (global && routines_.count(k.name))) {
            fail(k.line, k.column, "Duplicate identifier " + k.name);
        }
        Symbol s;
        s.kind = Symbol::Kind::Const;
        s.global = global;
        Value v = constantValue(*k.value);
        s.constIndex = addConstant(v);
        s.type.base = v.isText() ? BaseType::String : v.isBoolean() ? BaseType::Boolean : BaseType::Real;
        scope[k.name] = s;
    }
    for (const auto& v : block.vars) {
        if (scope.count(v.name) || (global && routines_.count(v.name))) {
            fail(v.line, v.column, "Duplicate identifier " + v.name);
        }
        Symbol s;
        s.slot = static_cast<int>(unit_->slots.size());
        s.global = global;
        s.type = v.type;
        scope[v.name] = s;
        unit_->slots.push_back(v.type);
    }
}

int PascalCompiler::addConstant(const Value& v) {
    out_->constants.push_back(v);
    return static_cast<int>(out_->constants.size() - 1);
}

Value PascalCompiler::constantValue(const Expr& expr) {
    if (const auto* n = std::get_if<NumberLit>(&expr.node)) return Value::makeNumber(n->value);
    if (const auto* s = std::get_if<StringLit>(&expr.node)) return Value::makeText(s->value);
    if (const auto* b = std::get_if<BoolLit>(&expr.node)) return Value::makeBoolean(b->value);
    if (const auto* ref = std::get_if<NameRef>(&expr.node)) {
        const Symbol* s = lookup(ref->name);
        if (s && s->kind == Symbol::Kind::Const) return out_->constants[static_cast<size_t>(s->constIndex)];
    }
    if (const auto* u = std::get_if<UnaryExpr>(&expr.node)) {
        if (u->op == "-") {
            Value v = constantValue(*u->operand);
            if (v.isNumber()) return Value::makeNumber(-v.num);
        }
    }
    fail(expr.line, expr.column, "Constant expression expected");
}

int PascalCompiler::allocTemp(const TypeSpec& type) {
    unit_->slots.push_back(type);
    return static_cast<int>(unit_->slots.size() - 1);
}

const PascalCompiler::Symbol* PascalCompiler::lookup(const std::string& name) const {
    auto it = locals_.find(name);
    if (it != locals_.end()) return &it->second;
    it = globals_.find(name);
    if (it != globals_.end()) return &it->second;
    return nullptr;
}

const Routine* PascalCompiler::findRoutine(const std::string& name, int* index) const {
    auto it = routines_.find(name);
    if (it == routines_.end()) return nullptr;
    if (index) *index = it->second;
    return &out_->tree->routines[static_cast<size_t>(it->second - 1)];
}

size_t PascalCompiler::emit(OpCode op, int a, int b, int c, int line, int column, long low) {
    Instr in;
    in.op = op;
    in.a = a;
    in.b = b;
    in.c = c;
    in.low = low;
    in.line = line;
    in.column = column;
    unit_->code.push_back(in);
    return unit_->code.size() - 1;
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

void PascalCompiler::compileStmts(const StmtList& list) {
    for (const auto& s : list) compileStmt(*s);
}

void PascalCompiler::compileStmt(const Stmt& stmt) {
    const int line = stmt.line;
    const int col = stmt.column;
    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, CompoundStmt>) {
            compileStmts(s.body);
        } else if constexpr (std::is_same_v<T, AssignStmt>) {
            compileAssign(s, stmt);
        } else if constexpr (std::is_same_v<T, CallStmt>) {
            compileCall(s.name, s.args, line, col, true);
        } else if constexpr (std::is_same_v<T, WriteStmt>) {
            for (const auto& arg : s.args) {
                compileExpr(*arg.value);
                if (arg.width) {
                    compileExpr(*arg.width);
                } else {
                    emit(OpCode::PushConst, addConstant(Value::makeNumber(-1)), 0, 0, line, col);
                }
                if (arg.decimals) {
                    compileExpr(*arg.decimals);
                } else {
                    emit(OpCode::PushConst, addConstant(Value::makeNumber(-1)), 0, 0, line, col);
                }
            }
            emit(OpCode::Write, static_cast<int>(s.args.size()), s.newline ? 1 : 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, ReadStmt>) {
            if (s.targets.empty()) {
                emit(OpCode::ReadLine, 0, 0, 0, line, col);
            }
            for (const auto& t : s.targets) {
                compileRef(t.name, t.index.get(), t.line, t.column);
                const Symbol* sym = lookup(t.name);
                emit(OpCode::Read, 0, 0, static_cast<int>(sym->type.base), t.line, t.column);
            }
        } else if constexpr (std::is_same_v<T, IfStmt>) {
            compileExpr(*s.condition);
            size_t toElse = emit(OpCode::JumpIfFalse, 0, 0, 0, line, col);
            compileStmt(*s.thenBranch);
            if (s.elseBranch) {
                size_t toEnd = emit(OpCode::Jump, 0, 0, 0, line, col);
                patch(toElse, here());
                compileStmt(*s.elseBranch);
                patch(toEnd, here());
            } else {
                patch(toElse, here());
            }
        } else if constexpr (std::is_same_v<T, WhileStmt>) {
            size_t top = here();
            compileExpr(*s.condition);
            size_t toEnd = emit(OpCode::JumpIfFalse, 0, 0, 0, line, col);
            compileStmt(*s.body);
            emit(OpCode::Jump, static_cast<int>(top), 0, 0, line, col);
            patch(toEnd, here());
        } else if constexpr (std::is_same_v<T, RepeatStmt>) {
            size_t top = here();
            compileStmts(s.body);
            compileExpr(*s.condition);
            emit(OpCode::JumpIfFalse, static_cast<int>(top), 0, 0, s.condition->line, s.condition->column);
        } else if constexpr (std::is_same_v<T, ForStmt>) {
            compileFor(s, stmt);
        } else if constexpr (std::is_same_v<T, CaseStmt>) {
            compileCase(s, stmt);
        } else if constexpr (std::is_same_v<T, ExitStmt>) {
            emit(inMain_ ? OpCode::Halt : OpCode::Return, 0, 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, HaltStmt>) {
            emit(OpCode::Halt, 0, 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, EmptyStmt>) {
        }
    }, stmt.node);
}

void PascalCompiler::compileAssign(const AssignStmt& s, const Stmt& at) {
    const VarTarget& t = s.target;
    const bool local = locals_.count(t.name) != 0;
    if (!local && routine_ && routine_->isFunction && t.name == routine_->name) {
        if (t.index) fail(t.line, t.column, "Cannot index function result " + routine_->displayName);
        compileExpr(*s.value);
        emit(OpCode::StoreResult, 0, 0, static_cast<int>(routine_->returnType.base), at.line, at.column);
        return;
    }
    const Symbol* sym = lookup(t.name);
    if (!sym) fail(t.line, t.column, "Undeclared identifier " + t.name);
    if (sym->kind == Symbol::Kind::Const) fail(t.line, t.column, "Cannot assign to constant " + t.name);
    if (t.index) {
        if (!sym->type.isArray) fail(t.line, t.column, t.name + " is not an array");
        compileExpr(*t.index);
        compileExpr(*s.value);
        emit(OpCode::StoreElem, sym->slot, scopeOf(*sym), static_cast<int>(sym->type.base), at.line, at.column,
             sym->type.low);
        return;
    }
    if (sym->type.isArray) fail(t.line, t.column, "Cannot assign to a whole array");
    compileExpr(*s.value);
    emit(OpCode::Store, sym->slot, scopeOf(*sym), static_cast<int>(sym->type.base), at.line, at.column);
}

void PascalCompiler::compileCall(const std::string& name, const std::vector<ExprPtr>& args, int line, int column,
                                 bool asStatement) {
    if (asStatement && (name == "INC" || name == "DEC")) {
        if (args.empty() || args.size() > 2) fail(line, column, name + " takes one or two arguments");
        const Expr& target = *args[0];
        const auto* ref = std::get_if<NameRef>(&target.node);
        const auto* elem = std::get_if<IndexRef>(&target.node);
        const std::string varName = ref ? ref->name : elem ? elem->name : std::string();
        const Symbol* sym = varName.empty() ? nullptr : lookup(varName);
        if (!sym || sym->kind != Symbol::Kind::Var) fail(target.line, target.column, name + " needs a variable");
        if (elem && !sym->type.isArray) fail(target.line, target.column, varName + " is not an array");
        if (!elem && sym->type.isArray) fail(target.line, target.column, "Cannot change a whole array");
        const OpCode op = name == "INC" ? OpCode::Add : OpCode::Sub;
        const int type = static_cast<int>(sym->type.base);
        if (elem) {
            compileExpr(*elem->index);
            compileExpr(*elem->index);
            emit(OpCode::LoadElem, sym->slot, scopeOf(*sym), 0, line, column, sym->type.low);
        } else {
            emit(OpCode::Load, sym->slot, scopeOf(*sym), 0, line, column);
        }
        if (args.size() == 2) {
            compileExpr(*args[1]);
        } else {
            emit(OpCode::PushConst, addConstant(Value::makeNumber(1)), 0, 0, line, column);
        }
        emit(op, 0, 0, 0, line, column);
        emit(elem ? OpCode::StoreElem : OpCode::Store, sym->slot, scopeOf(*sym), type, line, column, sym->type.low);
        return;
    }

    int unitIndex = 0;
    if (const Routine* r = findRoutine(name, &unitIndex)) {
        if (!asStatement && !r->isFunction) fail(line, column, "Procedure " + r->displayName + " has no value");
        if (args.size() != r->params.size()) {
            fail(line, column, r->displayName + " expects " + std::to_string(r->params.size()) + " argument(s)");
        }
        for (size_t i = 0; i < args.size(); ++i) {
            const Expr& arg = *args[i];
            if (!r->params[i].byRef) {
                compileExpr(arg);
                continue;
            }
            if (const auto* ref = std::get_if<NameRef>(&arg.node)) {
                compileRef(ref->name, nullptr, arg.line, arg.column);
            } else if (const auto* elem = std::get_if<IndexRef>(&arg.node)) {
                compileRef(elem->name, elem->index.get(), arg.line, arg.column);
            } else {
                fail(arg.line, arg.column, "var parameter " + r->params[i].name + " needs a variable");
            }
        }
        emit(OpCode::Call, unitIndex, static_cast<int>(args.size()), 0, line, column);
        if (asStatement && r->isFunction) emit(OpCode::Pop, 0, 0, 0, line, column);
        return;
    }

    auto b = builtins().find(name);
    if (b != builtins().end()) {
        if (asStatement) fail(line, column, "Function " + name + " used as a statement");
        if (static_cast<int>(args.size()) != b->second.arity) {
            fail(line, column, name + " expects " + std::to_string(b->second.arity) + " argument(s)");
        }
        for (const auto& a : args) compileExpr(*a);
        emit(OpCode::Builtin, static_cast<int>(b->second.id), static_cast<int>(args.size()), 0, line, column);
        return;
    }
    fail(line, column, "Undeclared routine " + name);
}

void PascalCompiler::compileRef(const std::string& name, const Expr* index, int line, int column) {
    const Symbol* sym = lookup(name);
    if (!sym) fail(line, column, "Undeclared identifier " + name);
    if (sym->kind != Symbol::Kind::Var) fail(line, column, "Constant " + name + " is not a variable");
    if (index) {
        if (!sym->type.isArray) fail(line, column, name + " is not an array");
        compileExpr(*index);
        emit(OpCode::PushElemRef, sym->slot, scopeOf(*sym), 0, line, column, sym->type.low);
        return;
    }
    if (sym->type.isArray) fail(line, column, "Array " + name + " needs an index");
    emit(OpCode::PushRef, sym->slot, scopeOf(*sym), 0, line, column);
}

// for v := a to b do body
//   v := a; end := b
//   top: if not (v <= end) goto done; body; v := v + 1; goto top
void PascalCompiler::compileFor(const ForStmt& s, const Stmt& at) {
    const int line = at.line;
    const int col = at.column;
    const Symbol* declared = lookup(s.var);
    bool hidden = false;
    Symbol var;
    if (declared) {
        if (declared->kind != Symbol::Kind::Var || declared->type.isArray) {
            fail(line, col, "Invalid loop variable " + s.var);
        }
        var = *declared;
    } else {
        // Undeclared loop variables exist for the loop only.
        hidden = true;
        var.slot = allocTemp(scalarType(BaseType::Integer));
        var.type = scalarType(BaseType::Integer);
        locals_[s.var] = var;
    }
    const int type = static_cast<int>(var.type.base);
    const int scope = scopeOf(var);
    // The bound takes the loop variable's type (a char bound holds text).
    const int endSlot = allocTemp(var.type);

    compileExpr(*s.start);
    emit(OpCode::Store, var.slot, scope, type, line, col);
    compileExpr(*s.finish);
    emit(OpCode::Store, endSlot, 0, -1, line, col);

    size_t top = here();
    emit(OpCode::Load, var.slot, scope, 0, line, col);
    emit(OpCode::Load, endSlot, 0, 0, line, col);
    emit(s.downto ? OpCode::Ge : OpCode::Le, 0, 0, 0, line, col);
    size_t toEnd = emit(OpCode::JumpIfFalse, 0, 0, 0, line, col);
    compileStmt(*s.body);
    // Stop on the bound itself so a char loop never steps past chr(255).
    emit(OpCode::Load, var.slot, scope, 0, line, col);
    emit(OpCode::Load, endSlot, 0, 0, line, col);
    emit(OpCode::Eq, 0, 0, 0, line, col);
    size_t atBound = emit(OpCode::JumpIfTrue, 0, 0, 0, line, col);
    emit(OpCode::Load, var.slot, scope, 0, line, col);
    if (var.type.base == BaseType::Char) {
        emit(OpCode::Builtin, static_cast<int>(s.downto ? BuiltinId::Pred : BuiltinId::Succ), 1, 0, line, col);
    } else {
        emit(OpCode::PushConst, addConstant(Value::makeNumber(1)), 0, 0, line, col);
        emit(s.downto ? OpCode::Sub : OpCode::Add, 0, 0, 0, line, col);
    }
    emit(OpCode::Store, var.slot, scope, type, line, col);
    emit(OpCode::Jump, static_cast<int>(top), 0, 0, line, col);
    patch(toEnd, here());
    patch(atBound, here());

    if (hidden) locals_.erase(s.var);
}

void PascalCompiler::compileCase(const CaseStmt& s, const Stmt& at) {
    const int line = at.line;
    const int col = at.column;
    const int sel = allocTemp(scalarType(BaseType::Real));
    compileExpr(*s.selector);
    emit(OpCode::Store, sel, 0, -1, line, col);

    std::vector<size_t> toEnd;
    for (const auto& arm : s.arms) {
        std::vector<size_t> toBody;
        for (const auto& label : arm.labels) {
            if (const auto* range = std::get_if<BinaryExpr>(&label->node); range && range->op == "..") {
                emit(OpCode::Load, sel, 0, 0, label->line, label->column);
                emit(OpCode::PushConst, addConstant(constantValue(*range->left)), 0, 0, label->line, label->column);
                emit(OpCode::Ge, 0, 0, 0, label->line, label->column);
                emit(OpCode::Load, sel, 0, 0, label->line, label->column);
                emit(OpCode::PushConst, addConstant(constantValue(*range->right)), 0, 0, label->line, label->column);
                emit(OpCode::Le, 0, 0, 0, label->line, label->column);
                emit(OpCode::And, 0, 0, 0, label->line, label->column);
            } else {
                emit(OpCode::Load, sel, 0, 0, label->line, label->column);
                emit(OpCode::PushConst, addConstant(constantValue(*label)), 0, 0, label->line, label->column);
                emit(OpCode::Eq, 0, 0, 0, label->line, label->column);
            }
            toBody.push_back(emit(OpCode::JumpIfTrue, 0, 0, 0, label->line, label->column));
        }
        size_t toNext = emit(OpCode::Jump, 0, 0, 0, line, col);
        for (size_t j : toBody) patch(j, here());
        compileStmt(*arm.body);
        toEnd.push_back(emit(OpCode::Jump, 0, 0, 0, line, col));
        patch(toNext, here());
    }
    if (s.hasElse) compileStmts(s.elseBody);
    for (size_t j : toEnd) patch(j, here());
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

void PascalCompiler::compileExpr(const Expr& expr) {
    const int line = expr.line;
    const int col = expr.column;
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, NumberLit>) {
            emit(OpCode::PushConst, addConstant(Value::makeNumber(n.value)), 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, StringLit>) {
            emit(OpCode::PushConst, addConstant(Value::makeText(n.value)), 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, BoolLit>) {
            emit(OpCode::PushConst, addConstant(Value::makeBoolean(n.value)), 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, NameRef>) {
            if (const Symbol* sym = lookup(n.name)) {
                if (sym->kind == Symbol::Kind::Const) {
                    emit(OpCode::PushConst, sym->constIndex, 0, 0, line, col);
                    return;
                }
                if (sym->type.isArray) fail(line, col, "Array " + n.name + " needs an index");
                emit(OpCode::Load, sym->slot, scopeOf(*sym), 0, line, col);
                return;
            }
            if (findRoutine(n.name)) {
                compileCall(n.name, {}, line, col, false);
                return;
            }
            fail(line, col, "Undeclared identifier " + n.name);
        } else if constexpr (std::is_same_v<T, IndexRef>) {
            const Symbol* sym = lookup(n.name);
            if (!sym) fail(line, col, "Undeclared identifier " + n.name);
            if (sym->type.isArray) {
                compileExpr(*n.index);
                emit(OpCode::LoadElem, sym->slot, scopeOf(*sym), 0, line, col, sym->type.low);
            } else if (sym->type.base == BaseType::String) {
                if (sym->kind == Symbol::Kind::Const) {
                    emit(OpCode::PushConst, sym->constIndex, 0, 0, line, col);
                } else {
                    emit(OpCode::Load, sym->slot, scopeOf(*sym), 0, line, col);
                }
                compileExpr(*n.index);
                emit(OpCode::StrIndex, 0, 0, 0, line, col);
            } else {
                fail(line, col, n.name + " is not an array");
            }
        } else if constexpr (std::is_same_v<T, CallExpr>) {
            compileCall(n.name, n.args, line, col, false);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            compileExpr(*n.operand);
            emit(n.op == "-" ? OpCode::Neg : OpCode::Not, 0, 0, 0, line, col);
        } else if constexpr (std::is_same_v<T, BinaryExpr>) {
            if (n.op == "..") fail(line, col, "Range is only allowed as a case label");
            compileExpr(*n.left);
            compileExpr(*n.right);
            emit(binaryOp(n.op), 0, 0, 0, line, col);
        }
    }, expr.node);
}

} // namespace timewarp
