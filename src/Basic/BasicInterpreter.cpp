#include "BasicInterpreter.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <type_traits>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace basic;

namespace {

constexpr size_t kPrintZoneWidth = 14;

const char* const kStatementNames[] = {
    "LET", "PRINT", "INPUT", "GOTO", "GOSUB", "RETURN", "END",
    "IF", "FOR", "NEXT", "DIM", "TURTLE", "REPEAT",
    "T:", "A:", "M:", "J:", "E:", "LABEL",
};

double checked(double v) {
    if (!std::isfinite(v)) throw TWError(ErrorCodes::OVERFLOW, "Overflow");
    return v;
}

double toNumber(const Value& v) {
    if (v.isNumber()) return v.num;
    if (v.isBoolean()) return v.flag ? -1.0 : 0.0;
    throw TWError(ErrorCodes::TYPE_MISMATCH, "Expected a number but got " + std::string(typeName(v.type)));
}

const std::string& toText(const Value& v) {
    if (!v.isText()) {
        throw TWError(ErrorCodes::TYPE_MISMATCH, "Expected text but got " + std::string(typeName(v.type)));
    }
    return v.text;
}

// PRINT form: comparisons show as -1 / 0, as in GW-BASIC.
std::string displayText(const Value& v) {
    if (v.isBoolean()) return formatNumber(v.flag ? -1.0 : 0.0);
    return v.toString();
}

bool truthy(const Value& v) {
    if (v.isBoolean()) return v.flag;
    if (v.isNumber()) return v.num != 0.0;
    throw TWError(ErrorCodes::TYPE_MISMATCH, "Condition must be a number or boolean");
}

long toInteger(double v) {
    if (std::fabs(v) > 2147483647.0) throw TWError(ErrorCodes::OVERFLOW, "Overflow");
    return std::lround(v);
}

std::string upper(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return s;
}

std::string lower(std::string s) {
    for (auto& ch : s) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return s;
}

} // namespace

BasicInterpreter::BasicInterpreter(std::shared_ptr<const Program> program, const EngineOptions& options)
    : Interpreter(options), program_(std::move(program)) {
    start();
}

void BasicInterpreter::start() {
    vars_.clear();
    stack_.clear();
    pos_ = ProgramPosition{};
    ended_ = false;
    pending_.reset();
    line_ = 0;
    column_ = 0;
    printColumn_ = 0;
    lastAnswer_.clear();
    matched_ = false;
    lastTyped_.reset();
    rngState_ = options_.randomSeed;
    channel_.clear();
    turtle_.reset(options_.initialPenDown);
}

std::unique_ptr<Interpreter> BasicInterpreter::clone() const {
    return std::make_unique<BasicInterpreter>(*this);
}

std::optional<SourceLocation> BasicInterpreter::currentLocation() const {
    if (line_ == 0) return std::nullopt;
    return SourceLocation{line_, column_};
}

// Normalizes pos_ to the next statement to run; null at the end of the program.
const Stmt* BasicInterpreter::fetch() {
    for (;;) {
        if (!pos_.blocks.empty()) {
            BlockFrame& top = pos_.blocks.back();
            if (top.index < top.body->size()) return (*top.body)[top.index].get();
            if (top.remaining > 1) {
                --top.remaining;
                top.index = 0;
            } else {
                pos_.blocks.pop_back();
            }
            continue;
        }
        if (pos_.line >= program_->lines.size()) return nullptr;
        const StmtList& stmts = program_->lines[pos_.line].statements;
        if (pos_.stmt < stmts.size()) return stmts[pos_.stmt].get();
        ++pos_.line;
        pos_.stmt = 0;
    }
}

void BasicInterpreter::advance() {
    if (ended_ || pending_) return;
    const Stmt* stmt = fetch();
    if (!stmt) {
        ended_ = true;
        return;
    }
    line_ = stmt->line;
    column_ = stmt->column;

    // Step past the statement first; control flow statements overwrite pos_.
    if (!pos_.blocks.empty()) {
        ++pos_.blocks.back().index;
    } else {
        ++pos_.stmt;
    }

    trace(line_, kStatementNames[stmt->node.index()]);
    try {
        execute(*stmt);
    } catch (TWError& e) {
        if (e.getLine() == 0) e.setLine(line_);
        throw;
    }
}

bool BasicInterpreter::guardPasses(const PilotGuard& guard) {
    switch (guard.kind) {
        case PilotGuard::Kind::None: return true;
        case PilotGuard::Kind::Yes: return matched_;
        case PilotGuard::Kind::No: return !matched_;
        case PilotGuard::Kind::Condition: return truthy(evaluate(*guard.condition));
    }
    return true;
}

void BasicInterpreter::execute(const Stmt& stmt) {
    const bool isType = std::holds_alternative<PilotTypeStmt>(stmt.node);
    if (!guardPasses(stmt.guard)) {
        if (!isType) lastTyped_.reset();
        return;
    }

    std::visit([&](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, LetStmt>) {
            execLet(s);
        } else if constexpr (std::is_same_v<T, PrintStmt>) {
            execPrint(s);
        } else if constexpr (std::is_same_v<T, InputStmt>) {
            execInput(s);
        } else if constexpr (std::is_same_v<T, GotoStmt>) {
            jumpToLine(s.lineNumber);
        } else if constexpr (std::is_same_v<T, GosubStmt>) {
            pushReturn();
            jumpToLine(s.lineNumber);
        } else if constexpr (std::is_same_v<T, ReturnStmt>) {
            GosubFrame frame;
            if (!stack_.popGosub(frame)) throw TWError(ErrorCodes::RETURN_WITHOUT_GOSUB, "RETURN without GOSUB");
            pos_ = frame.returnTo;
        } else if constexpr (std::is_same_v<T, EndStmt>) {
            ended_ = true;
        } else if constexpr (std::is_same_v<T, IfStmt>) {
            execIf(s);
        } else if constexpr (std::is_same_v<T, ForStmt>) {
            execFor(s);
        } else if constexpr (std::is_same_v<T, NextStmt>) {
            execNext(s);
        } else if constexpr (std::is_same_v<T, DimStmt>) {
            for (const auto& decl : s.arrays) vars_.dimArray(decl.name, toNumber(evaluate(*decl.size)));
        } else if constexpr (std::is_same_v<T, TurtleStmt>) {
            execTurtle(s);
        } else if constexpr (std::is_same_v<T, RepeatStmt>) {
            execRepeat(s);
        } else if constexpr (std::is_same_v<T, PilotTypeStmt>) {
            execPilotType(s);
        } else if constexpr (std::is_same_v<T, PilotAcceptStmt>) {
            execPilotAccept(s);
        } else if constexpr (std::is_same_v<T, PilotMatchStmt>) {
            execPilotMatch(s);
        } else if constexpr (std::is_same_v<T, PilotJumpStmt>) {
            execPilotJump(s);
        } else if constexpr (std::is_same_v<T, PilotEndStmt>) {
            GosubFrame frame;
            if (stack_.popGosub(frame)) {
                pos_ = frame.returnTo;
            } else {
                ended_ = true;
            }
        } else if constexpr (std::is_same_v<T, LabelStmt>) {
            // jump target only
        }
    }, stmt.node);

    // A: takes its prompt from a T: executed immediately before it.
    if (!isType) lastTyped_.reset();
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

void BasicInterpreter::execLet(const LetStmt& s) {
    assign(s.target, evaluate(*s.value));
}

void BasicInterpreter::assign(const Target& target, const Value& value) {
    if (target.index) {
        vars_.setElement(target.name, toNumber(evaluate(*target.index)), value);
    } else {
        vars_.set(target.name, value);
    }
}

void BasicInterpreter::emit(const std::string& text, bool newline) {
    channel_.output(text, newline);
    printColumn_ = newline ? 0 : printColumn_ + text.size();
}

void BasicInterpreter::execPrint(const PrintStmt& s) {
    std::string text;
    for (const auto& item : s.items) {
        text += displayText(evaluate(*item.expr));
        if (item.separator == ',') {
            size_t col = printColumn_ + text.size();
            text.append(kPrintZoneWidth - col % kPrintZoneWidth, ' ');
        }
    }
    emit(text, s.newline);
}

void BasicInterpreter::execInput(const InputStmt& s) {
    PendingInput p;
    p.input = &s;
    p.prompt = s.prompt;
    pending_ = p;
    requestNextInput();
}

void BasicInterpreter::requestNextInput() {
    printColumn_ = 0;
    channel_.requestInput(pending_->prompt);
}

void BasicInterpreter::provideInput(const std::string& text) {
    if (!pending_) return;
    PendingInput& p = *pending_;

    if (p.accept) {
        lastAnswer_ = text;
        if (p.accept->target) {
            const Target& target = *p.accept->target;
            if (VariableTable::isTextName(target.name)) {
                vars_.set(target.name, Value::makeText(text));
            } else {
                double v = 0.0;
                if (!parseNumber(text, v)) {
                    requestNextInput();
                    return;
                }
                vars_.set(target.name, Value::makeNumber(v));
            }
        }
        pending_.reset();
        return;
    }

    const Target& target = p.input->targets[p.next];
    if (VariableTable::isTextName(target.name)) {
        assign(target, Value::makeText(text));
    } else {
        double v = 0.0;
        if (!parseNumber(text, v)) {
            requestNextInput();
            return;
        }
        assign(target, Value::makeNumber(v));
    }
    if (++p.next < p.input->targets.size()) {
        requestNextInput();
    } else {
        pending_.reset();
    }
}

void BasicInterpreter::execIf(const IfStmt& s) {
    const StmtList& branch = truthy(evaluate(*s.condition)) ? s.thenBranch : s.elseBranch;
    if (!branch.empty()) pos_.blocks.push_back(BlockFrame{&branch, 0, 1});
}

void BasicInterpreter::execFor(const ForStmt& s) {
    double start = toNumber(evaluate(*s.start));
    double limit = toNumber(evaluate(*s.limit));
    double step = s.step ? toNumber(evaluate(*s.step)) : 1.0;
    vars_.set(s.var, Value::makeNumber(start));

    bool runs = step >= 0 ? start <= limit : start >= limit;
    if (!runs) {
        skipPastNext(s.var);
        return;
    }
    ForFrame frame;
    frame.varKey = s.var;
    frame.limit = limit;
    frame.step = step;
    frame.resume = pos_;
    stack_.pushFor(frame);
}

// Moves pos_ past the NEXT that closes a loop whose body must not run.
void BasicInterpreter::skipPastNext(const std::string& var) {
    int depth = 0;
    auto closes = [&](const Stmt& st) {
        if (std::holds_alternative<ForStmt>(st.node)) {
            ++depth;
        } else if (const auto* next = std::get_if<NextStmt>(&st.node)) {
            if (depth == 0) return next->var.empty() || next->var == var;
            --depth;
        }
        return false;
    };

    if (!pos_.blocks.empty()) {
        BlockFrame& block = pos_.blocks.back();
        for (size_t i = block.index; i < block.body->size(); ++i) {
            if (closes(*(*block.body)[i])) {
                block.index = i + 1;
                return;
            }
        }
    } else {
        size_t line = pos_.line;
        size_t stmt = pos_.stmt;
        for (; line < program_->lines.size(); ++line, stmt = 0) {
            const StmtList& stmts = program_->lines[line].statements;
            for (; stmt < stmts.size(); ++stmt) {
                if (closes(*stmts[stmt])) {
                    pos_.line = line;
                    pos_.stmt = stmt + 1;
                    return;
                }
            }
        }
    }
    throw TWError(ErrorCodes::NEXT_WITHOUT_FOR, "FOR " + var + " without NEXT");
}

void BasicInterpreter::execNext(const NextStmt& s) {
    ForFrame* frame = s.var.empty() ? stack_.topFor() : stack_.findFor(s.var);
    if (!frame) {
        throw TWError(ErrorCodes::NEXT_WITHOUT_FOR, s.var.empty() ? "NEXT without FOR" : "NEXT " + s.var + " without FOR");
    }
    double v = checked(toNumber(vars_.get(frame->varKey)) + frame->step);
    vars_.set(frame->varKey, Value::makeNumber(v));
    bool again = frame->step >= 0 ? v <= frame->limit : v >= frame->limit;
    if (again) {
        pos_ = frame->resume;
    } else {
        stack_.popFor();
    }
}

void BasicInterpreter::execTurtle(const TurtleStmt& s) {
    using K = TurtleCommand::Kind;
    if (s.command == K::SetColor) {
        std::string color = s.colorName;
        if (color.empty()) {
            Value v = evaluate(*s.args.at(0));
            color = v.isText() ? lower(v.text) : paletteColorName(static_cast<int>(toInteger(toNumber(v))));
        }
        drawCommand(TurtleCommand::setColor(color));
        return;
    }
    if (s.command == K::SetXY) {
        double x = toNumber(evaluate(*s.args.at(0)));
        double y = toNumber(evaluate(*s.args.at(1)));
        drawCommand(TurtleCommand::setXY(x, y));
        return;
    }
    double amount = s.args.empty() ? 0.0 : toNumber(evaluate(*s.args.front()));
    drawCommand(TurtleCommand::make(s.command, amount));
}

void BasicInterpreter::execRepeat(const RepeatStmt& s) {
    double count = std::floor(toNumber(evaluate(*s.count)));
    if (count < 1 || s.body.empty()) return;
    if (count > 2147483647.0) throw TWError(ErrorCodes::OVERFLOW, "REPEAT count too large");
    pos_.blocks.push_back(BlockFrame{&s.body, 0, static_cast<long>(count)});
}

void BasicInterpreter::jumpToLine(int lineNumber) {
    auto it = program_->lineIndex.find(lineNumber);
    if (it == program_->lineIndex.end()) {
        throw TWError(ErrorCodes::UNDEFINED_LINE_NUMBER, "Undefined line number " + std::to_string(lineNumber));
    }
    pos_ = ProgramPosition{it->second, 0, {}};
}

void BasicInterpreter::jumpToLabel(const std::string& label) {
    auto it = program_->labelIndex.find(label);
    if (it == program_->labelIndex.end()) {
        throw TWError(ErrorCodes::UNDEFINED_LABEL, "Undefined label *" + label);
    }
    pos_ = ProgramPosition{it->second, 0, {}};
}

void BasicInterpreter::pushReturn() {
    if (stack_.gosubDepth() >= options_.maxCallDepth) {
        throw TWError(ErrorCodes::OUT_OF_MEMORY, "Out of memory: GOSUB nesting too deep");
    }
    stack_.pushGosub(GosubFrame{pos_, line_});
}

// ---------------------------------------------------------------------------
// PILOT
// ---------------------------------------------------------------------------

// $NAME and #NAME in T: text expand to NAME$ / NAME when defined.
std::string BasicInterpreter::interpolate(const std::string& text) const {
    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        char ch = text[i];
        if ((ch == '$' || ch == '#') && i + 1 < text.size() &&
            std::isalpha(static_cast<unsigned char>(text[i + 1]))) {
            size_t j = i + 1;
            while (j < text.size() && (std::isalnum(static_cast<unsigned char>(text[j])) || text[j] == '_')) ++j;
            std::string name = upper(text.substr(i + 1, j - i - 1));
            if (ch == '$') name += '$';
            if (const Value* v = vars_.tryGet(name)) {
                out += displayText(*v);
                i = j;
                continue;
            }
        }
        out.push_back(ch);
        ++i;
    }
    return out;
}

void BasicInterpreter::execPilotType(const PilotTypeStmt& s) {
    std::string text = interpolate(s.text);
    emit(text, true);
    lastTyped_ = text;
}

void BasicInterpreter::execPilotAccept(const PilotAcceptStmt& s) {
    PendingInput p;
    p.accept = &s;
    p.prompt = lastTyped_;
    pending_ = p;
    requestNextInput();
}

void BasicInterpreter::execPilotMatch(const PilotMatchStmt& s) {
    const std::string answer = upper(lastAnswer_);
    matched_ = false;
    for (const auto& alt : s.alternatives) {
        if (answer.find(alt) != std::string::npos) {
            matched_ = true;
            break;
        }
    }
}

void BasicInterpreter::execPilotJump(const PilotJumpStmt& s) {
    if (s.use) pushReturn();
    jumpToLabel(s.label);
}

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

Value BasicInterpreter::evaluate(const Expr& expr) {
    return std::visit([&](const auto& n) -> Value {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, NumberLit>) {
            return Value::makeNumber(n.value);
        } else if constexpr (std::is_same_v<T, TextLit>) {
            return Value::makeText(n.value);
        } else if constexpr (std::is_same_v<T, VarRef>) {
            return vars_.get(n.name);
        } else if constexpr (std::is_same_v<T, ElementRef>) {
            return vars_.getElement(n.name, toNumber(evaluate(*n.index)));
        } else if constexpr (std::is_same_v<T, CallExpr>) {
            return callBuiltin(n);
        } else if constexpr (std::is_same_v<T, UnaryExpr>) {
            Value v = evaluate(*n.operand);
            if (n.op == "-") return Value::makeNumber(-toNumber(v));
            if (v.isBoolean()) return Value::makeBoolean(!v.flag);
            return Value::makeNumber(static_cast<double>(~toInteger(toNumber(v))));
        } else {
            Value left = evaluate(*n.left);
            Value right = evaluate(*n.right);
            return binary(n.op, left, right);
        }
    }, expr.node);
}

Value BasicInterpreter::binary(const std::string& op, const Value& left, const Value& right) {
    if (op == "AND" || op == "OR") {
        if (left.isBoolean() && right.isBoolean()) {
            return Value::makeBoolean(op == "AND" ? (left.flag && right.flag) : (left.flag || right.flag));
        }
        long a = toInteger(toNumber(left));
        long b = toInteger(toNumber(right));
        return Value::makeNumber(static_cast<double>(op == "AND" ? (a & b) : (a | b)));
    }

    if (op == "=" || op == "<>" || op == "<" || op == ">" || op == "<=" || op == ">=") {
        int cmp;
        if (left.isText() || right.isText()) {
            int c = toText(left).compare(toText(right));
            cmp = c < 0 ? -1 : (c > 0 ? 1 : 0);
        } else {
            double a = toNumber(left);
            double b = toNumber(right);
            cmp = a < b ? -1 : (a > b ? 1 : 0);
        }
        bool r = op == "=" ? cmp == 0 : op == "<>" ? cmp != 0 : op == "<" ? cmp < 0
               : op == ">" ? cmp > 0 : op == "<=" ? cmp <= 0 : cmp >= 0;
        return Value::makeBoolean(r);
    }

    if (op == "+" && (left.isText() || right.isText())) {
        return Value::makeText(toText(left) + toText(right));
    }

    double a = toNumber(left);
    double b = toNumber(right);
    if (op == "+") return Value::makeNumber(checked(a + b));
    if (op == "-") return Value::makeNumber(checked(a - b));
    if (op == "*") return Value::makeNumber(checked(a * b));
    if (op == "/") {
        if (b == 0.0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
        return Value::makeNumber(checked(a / b));
    }
    if (op == "MOD") {
        long ib = toInteger(b);
        if (ib == 0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
        return Value::makeNumber(static_cast<double>(toInteger(a) % ib));
    }
    if (op == "^") {
        if (a == 0.0 && b < 0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
        if (a < 0 && b != std::floor(b)) throw TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, "Illegal function call");
        return Value::makeNumber(checked(std::pow(a, b)));
    }
    throw TWError(ErrorCodes::SYNTAX_ERROR, "Unknown operator " + op);
}

double BasicInterpreter::nextRandom() {
    rngState_ = rngState_ * 1103515245u + 12345u;
    return static_cast<double>((rngState_ >> 8) & 0xFFFFFFu) / 16777216.0;
}

Value BasicInterpreter::callBuiltin(const CallExpr& call) {
    const std::string& f = call.name;
    std::vector<Value> args;
    args.reserve(call.args.size());
    for (const auto& a : call.args) args.push_back(evaluate(*a));

    auto num = [&](size_t i) { return toNumber(args.at(i)); };
    auto str = [&](size_t i) -> const std::string& { return toText(args.at(i)); };
    auto illegal = [&]() { return TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, "Illegal function call: " + f); };

    if (f == "ABS") return Value::makeNumber(std::fabs(num(0)));
    if (f == "INT") return Value::makeNumber(std::floor(num(0)));
    if (f == "SGN") { double x = num(0); return Value::makeNumber(x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0)); }
    if (f == "SQR") {
        if (num(0) < 0) throw illegal();
        return Value::makeNumber(std::sqrt(num(0)));
    }
    if (f == "SIN") return Value::makeNumber(std::sin(num(0)));
    if (f == "COS") return Value::makeNumber(std::cos(num(0)));
    if (f == "TAN") return Value::makeNumber(checked(std::tan(num(0))));
    if (f == "ATN") return Value::makeNumber(std::atan(num(0)));
    if (f == "LOG") {
        if (num(0) <= 0) throw illegal();
        return Value::makeNumber(std::log(num(0)));
    }
    if (f == "EXP") return Value::makeNumber(checked(std::exp(num(0))));
    if (f == "RND") {
        double r = nextRandom();
        if (!args.empty() && num(0) > 1) return Value::makeNumber(std::floor(r * std::floor(num(0))) + 1.0);
        return Value::makeNumber(r);
    }
    if (f == "LEN") return Value::makeNumber(static_cast<double>(str(0).size()));
    if (f == "VAL") {
        double v = 0.0;
        return Value::makeNumber(parseNumber(str(0), v) ? v : 0.0);
    }
    if (f == "ASC") {
        if (str(0).empty()) throw illegal();
        return Value::makeNumber(static_cast<unsigned char>(str(0)[0]));
    }
    if (f == "STR$") return Value::makeText(formatNumber(num(0)));
    if (f == "CHR$") {
        long code = toInteger(num(0));
        if (code < 0 || code > 255) throw illegal();
        return Value::makeText(std::string(1, static_cast<char>(code)));
    }
    if (f == "LEFT$" || f == "RIGHT$") {
        long n = toInteger(num(1));
        if (n < 0) throw illegal();
        const std::string& s = str(0);
        size_t count = std::min(static_cast<size_t>(n), s.size());
        return Value::makeText(f == "LEFT$" ? s.substr(0, count) : s.substr(s.size() - count));
    }
    if (f == "MID$") {
        const std::string& s = str(0);
        long start = toInteger(num(1));
        if (start < 1) throw illegal();
        long len = args.size() > 2 ? toInteger(num(2)) : static_cast<long>(s.size());
        if (len < 0) throw illegal();
        if (static_cast<size_t>(start) > s.size()) return Value::makeText("");
        return Value::makeText(s.substr(static_cast<size_t>(start - 1), static_cast<size_t>(len)));
    }
    if (f == "UCASE$") return Value::makeText(upper(str(0)));
    if (f == "LCASE$") return Value::makeText(lower(str(0)));

    throw TWError(ErrorCodes::UNDEFINED_USER_FUNCTION, "Undefined function " + f);
}

} // namespace timewarp
