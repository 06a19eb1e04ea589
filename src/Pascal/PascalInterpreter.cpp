#include "PascalInterpreter.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

#include "../Runtime/TWError.hpp"

namespace timewarp {

using namespace pascal;

namespace {

double number(const Value& v, const char* context) {
    if (!v.isNumber()) {
        throw TWError(ErrorCodes::TYPE_MISMATCH,
                      std::string(context) + " needs a number, got " + typeName(v.type));
    }
    return v.num;
}

double integral(const Value& v, const char* context) {
    double n = number(v, context);
    if (n != std::floor(n)) {
        throw TWError(ErrorCodes::TYPE_MISMATCH, std::string(context) + " needs an integer, got " + formatNumber(n));
    }
    return n;
}

double checked(double v) {
    if (!std::isfinite(v)) throw TWError(ErrorCodes::OVERFLOW, "Overflow");
    return v;
}

int compareValues(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) return a.num < b.num ? -1 : (a.num > b.num ? 1 : 0);
    if (a.isText() && b.isText()) {
        int c = a.text.compare(b.text);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (a.isBoolean() && b.isBoolean()) return static_cast<int>(a.flag) - static_cast<int>(b.flag);
    throw TWError(ErrorCodes::TYPE_MISMATCH,
                  std::string("Cannot compare ") + typeName(a.type) + " with " + typeName(b.type));
}

} // namespace

PascalInterpreter::PascalInterpreter(std::shared_ptr<const CompiledProgram> program, const EngineOptions& options)
    : Interpreter(options), program_(std::move(program)) {
    start();
}

void PascalInterpreter::start() {
    frames_.clear();
    stack_.clear();
    refs_.clear();
    pending_.reset();
    ended_ = false;
    line_ = 0;
    column_ = 0;
    tracedLine_ = 0;
    channel_.clear();
    turtle_.reset(options_.initialPenDown);
    pushFrame(program_->units.at(0));
}

std::unique_ptr<Interpreter> PascalInterpreter::clone() const {
    auto copy = std::make_unique<PascalInterpreter>(*this);
    // Cells are shared between aliases; copy each one once so aliasing survives.
    std::map<const Value*, std::shared_ptr<Value>> cells;
    auto remap = [&](VarRef& r) {
        if (!r.cell) return;
        auto it = cells.find(r.cell.get());
        if (it == cells.end()) it = cells.emplace(r.cell.get(), std::make_shared<Value>(*r.cell)).first;
        r.cell = it->second;
    };
    for (auto& f : copy->frames_) {
        for (auto& s : f.slots) remap(s);
    }
    for (auto& r : copy->refs_) remap(r);
    if (copy->pending_) remap(copy->pending_->target);
    return copy;
}

std::optional<SourceLocation> PascalInterpreter::currentLocation() const {
    if (line_ == 0) return std::nullopt;
    return SourceLocation{line_, column_};
}

Value PascalInterpreter::defaultValue(const TypeSpec& type) {
    Value scalar;
    switch (type.base) {
        case BaseType::Integer:
        case BaseType::Real: scalar = Value::makeNumber(0.0); break;
        case BaseType::Boolean: scalar = Value::makeBoolean(false); break;
        case BaseType::String:
        case BaseType::Char: scalar = Value::makeText(""); break;
    }
    if (!type.isArray) return scalar;
    return Value::makeList(std::vector<Value>(static_cast<size_t>(type.high - type.low + 1), scalar));
}

void PascalInterpreter::pushFrame(const CodeUnit& unit) {
    Frame f;
    f.unit = &unit;
    f.slots.reserve(unit.slots.size());
    for (const auto& t : unit.slots) f.slots.push_back(VarRef{std::make_shared<Value>(defaultValue(t)), -1});
    frames_.push_back(std::move(f));
}

PascalInterpreter::VarRef& PascalInterpreter::slot(const Instr& in) {
    Frame& f = in.b == 1 ? frames_.front() : frames_.back();
    return f.slots.at(static_cast<size_t>(in.a));
}

Value PascalInterpreter::pop() {
    if (stack_.empty()) throw TWError(ErrorCodes::INTERNAL_ERROR, "Operand stack underflow");
    Value v = std::move(stack_.back());
    stack_.pop_back();
    return v;
}

Value& PascalInterpreter::deref(const VarRef& ref) {
    if (ref.index < 0) return *ref.cell;
    return ref.cell->items.at(static_cast<size_t>(ref.index));
}

void PascalInterpreter::store(const VarRef& ref, const Value& value) {
    deref(ref) = value;
}

// Values stored into typed slots; type < 0 accepts anything.
Value PascalInterpreter::checkType(const Value& value, int type, const std::string& what) {
    if (type < 0) return value;
    const auto base = static_cast<BaseType>(type);
    bool ok = false;
    switch (base) {
        case BaseType::Integer: ok = value.isNumber() && value.num == std::floor(value.num); break;
        case BaseType::Real: ok = value.isNumber(); break;
        case BaseType::Boolean: ok = value.isBoolean(); break;
        case BaseType::String: ok = value.isText(); break;
        case BaseType::Char: ok = value.isText() && value.text.size() == 1; break;
    }
    if (!ok) {
        throw TWError(ErrorCodes::TYPE_MISMATCH, "Cannot store " + std::string(typeName(value.type)) + " " +
                                                     value.toString() + " in " + baseTypeName(base) + " " + what);
    }
    return value;
}

size_t PascalInterpreter::elementIndex(const Value& array, const Value& index, long low) {
    double i = integral(index, "Array index");
    double offset = i - static_cast<double>(low);
    if (!array.isList() || offset < 0 || offset >= static_cast<double>(array.items.size())) {
        throw TWError(ErrorCodes::SUBSCRIPT_OUT_OF_RANGE, "Array index " + formatNumber(i) + " out of range");
    }
    return static_cast<size_t>(offset);
}

void PascalInterpreter::advance() {
    if (ended_ || pending_) return;
    Frame& f = frames_.back();
    if (f.pc >= f.unit->code.size()) {
        throw TWError(ErrorCodes::INTERNAL_ERROR, "Execution ran past the end of " + f.unit->name);
    }
    const Instr& in = f.unit->code[f.pc++];
    line_ = in.line;
    column_ = in.column;
    if (in.line != 0 && in.line != tracedLine_) {
        tracedLine_ = in.line;
        trace(in.line, f.unit->name);
    }
    execute(in);
}

void PascalInterpreter::execute(const Instr& in) {
    switch (in.op) {
        case OpCode::PushConst:
            stack_.push_back(program_->constants.at(static_cast<size_t>(in.a)));
            break;
        case OpCode::Load:
            stack_.push_back(deref(slot(in)));
            break;
        case OpCode::Store: {
            Value v = pop();
            store(slot(in), checkType(v, in.c, "variable"));
            break;
        }
        case OpCode::LoadElem: {
            Value index = pop();
            Value& array = deref(slot(in));
            stack_.push_back(array.items[elementIndex(array, index, in.low)]);
            break;
        }
        case OpCode::StoreElem: {
            Value v = pop();
            Value index = pop();
            Value& array = deref(slot(in));
            array.items[elementIndex(array, index, in.low)] = checkType(v, in.c, "array element");
            break;
        }
        case OpCode::PushRef:
            refs_.push_back(slot(in));
            break;
        case OpCode::PushElemRef: {
            Value index = pop();
            const VarRef& r = slot(in);
            size_t i = elementIndex(deref(r), index, in.low);
            refs_.push_back(VarRef{r.cell, static_cast<long>(i)});
            break;
        }
        case OpCode::StrIndex: {
            Value index = pop();
            Value s = pop();
            double i = integral(index, "String index");
            if (!s.isText()) throw TWError(ErrorCodes::TYPE_MISMATCH, "Only strings can be indexed");
            if (i < 1 || i > static_cast<double>(s.text.size())) {
                throw TWError(ErrorCodes::SUBSCRIPT_OUT_OF_RANGE, "String index " + formatNumber(i) + " out of range");
            }
            stack_.push_back(Value::makeText(std::string(1, s.text[static_cast<size_t>(i) - 1])));
            break;
        }
        case OpCode::Neg:
            stack_.push_back(Value::makeNumber(-number(pop(), "Negation")));
            break;
        case OpCode::Not: {
            Value v = pop();
            if (v.isBoolean()) {
                stack_.push_back(Value::makeBoolean(!v.flag));
            } else {
                stack_.push_back(Value::makeNumber(static_cast<double>(~static_cast<long long>(integral(v, "not")))));
            }
            break;
        }
        case OpCode::Add: case OpCode::Sub: case OpCode::Mul: case OpCode::Div:
        case OpCode::IntDiv: case OpCode::Mod: case OpCode::And: case OpCode::Or:
        case OpCode::Eq: case OpCode::Ne: case OpCode::Lt: case OpCode::Gt: case OpCode::Le: case OpCode::Ge:
            binary(in.op);
            break;
        case OpCode::Jump:
            frames_.back().pc = static_cast<size_t>(in.a);
            break;
        case OpCode::JumpIfFalse:
        case OpCode::JumpIfTrue: {
            Value v = pop();
            if (!v.isBoolean()) throw TWError(ErrorCodes::TYPE_MISMATCH, "Condition must be boolean");
            if (v.flag == (in.op == OpCode::JumpIfTrue)) frames_.back().pc = static_cast<size_t>(in.a);
            break;
        }
        case OpCode::Pop:
            pop();
            break;
        case OpCode::Call: {
            const CodeUnit& unit = program_->units.at(static_cast<size_t>(in.a));
            if (frames_.size() >= options_.maxCallDepth) {
                throw TWError(ErrorCodes::OUT_OF_MEMORY, "Out of memory: call depth exceeded in " + unit.name);
            }
            Frame callee;
            callee.unit = &unit;
            for (const auto& t : unit.slots) callee.slots.push_back(VarRef{std::make_shared<Value>(defaultValue(t)), -1});
            for (size_t i = unit.params.size(); i-- > 0;) {
                const ParamInfo& p = unit.params[i];
                if (p.byRef) {
                    callee.slots[static_cast<size_t>(p.slot)] = refs_.back();
                    refs_.pop_back();
                } else {
                    *callee.slots[static_cast<size_t>(p.slot)].cell =
                        checkType(pop(), static_cast<int>(p.type), "parameter of " + unit.name);
                }
            }
            frames_.push_back(std::move(callee));
            break;
        }
        case OpCode::Return: {
            Frame& f = frames_.back();
            const bool isFunction = f.unit->isFunction;
            if (isFunction && !f.resultAssigned) {
                throw TWError(ErrorCodes::FUNCTION_WITHOUT_RESULT,
                              "Function " + f.unit->name + " returned without assigning a result");
            }
            Value result = isFunction ? *f.slots[0].cell : Value{};
            frames_.pop_back();
            if (frames_.empty()) {
                ended_ = true;
                break;
            }
            if (isFunction) stack_.push_back(std::move(result));
            break;
        }
        case OpCode::Builtin:
            callBuiltin(static_cast<BuiltinId>(in.a), in.b);
            break;
        case OpCode::Write:
            write(in.a, in.b != 0);
            break;
        case OpCode::Read: {
            PendingRead p;
            p.target = refs_.back();
            refs_.pop_back();
            p.type = static_cast<BaseType>(in.c);
            pending_ = p;
            channel_.requestInput(std::nullopt);
            break;
        }
        case OpCode::ReadLine: {
            PendingRead p;
            p.discard = true;
            pending_ = p;
            channel_.requestInput(std::nullopt);
            break;
        }
        case OpCode::StoreResult: {
            Value v = pop();
            Frame& f = frames_.back();
            *f.slots[0].cell = checkType(v, in.c, "result of " + f.unit->name);
            f.resultAssigned = true;
            break;
        }
        case OpCode::Halt:
            ended_ = true;
            break;
    }
}

void PascalInterpreter::binary(OpCode op) {
    Value b = pop();
    Value a = pop();
    switch (op) {
        case OpCode::Add:
            if (a.isText() && b.isText()) {
                stack_.push_back(Value::makeText(a.text + b.text));
            } else {
                stack_.push_back(Value::makeNumber(checked(number(a, "+") + number(b, "+"))));
            }
            return;
        case OpCode::Sub:
            stack_.push_back(Value::makeNumber(checked(number(a, "-") - number(b, "-"))));
            return;
        case OpCode::Mul:
            stack_.push_back(Value::makeNumber(checked(number(a, "*") * number(b, "*"))));
            return;
        case OpCode::Div: {
            double d = number(b, "/");
            if (d == 0.0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
            stack_.push_back(Value::makeNumber(checked(number(a, "/") / d)));
            return;
        }
        case OpCode::IntDiv:
        case OpCode::Mod: {
            const char* name = op == OpCode::IntDiv ? "div" : "mod";
            double x = integral(a, name);
            double y = integral(b, name);
            if (y == 0.0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
            stack_.push_back(Value::makeNumber(op == OpCode::IntDiv ? std::trunc(x / y) : std::fmod(x, y)));
            return;
        }
        case OpCode::And:
        case OpCode::Or: {
            const bool isAnd = op == OpCode::And;
            if (a.isBoolean() && b.isBoolean()) {
                stack_.push_back(Value::makeBoolean(isAnd ? (a.flag && b.flag) : (a.flag || b.flag)));
            } else {
                auto x = static_cast<long long>(integral(a, isAnd ? "and" : "or"));
                auto y = static_cast<long long>(integral(b, isAnd ? "and" : "or"));
                stack_.push_back(Value::makeNumber(static_cast<double>(isAnd ? (x & y) : (x | y))));
            }
            return;
        }
        default:
            break;
    }
    int c = compareValues(a, b);
    bool r = false;
    switch (op) {
        case OpCode::Eq: r = c == 0; break;
        case OpCode::Ne: r = c != 0; break;
        case OpCode::Lt: r = c < 0; break;
        case OpCode::Gt: r = c > 0; break;
        case OpCode::Le: r = c <= 0; break;
        case OpCode::Ge: r = c >= 0; break;
        default: throw TWError(ErrorCodes::INTERNAL_ERROR, "Unexpected operator");
    }
    stack_.push_back(Value::makeBoolean(r));
}

void PascalInterpreter::callBuiltin(BuiltinId id, int argc) {
    if (argc != 1) throw TWError(ErrorCodes::INTERNAL_ERROR, "Builtin arity");
    Value v = pop();
    auto illegal = [](const char* name) {
        return TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, std::string("Illegal argument to ") + name);
    };
    switch (id) {
        case BuiltinId::Abs: stack_.push_back(Value::makeNumber(std::fabs(number(v, "abs")))); return;
        case BuiltinId::Sqr: stack_.push_back(Value::makeNumber(checked(number(v, "sqr") * v.num))); return;
        case BuiltinId::Sqrt:
            if (number(v, "sqrt") < 0) throw illegal("sqrt");
            stack_.push_back(Value::makeNumber(std::sqrt(v.num)));
            return;
        case BuiltinId::Sin: stack_.push_back(Value::makeNumber(std::sin(number(v, "sin")))); return;
        case BuiltinId::Cos: stack_.push_back(Value::makeNumber(std::cos(number(v, "cos")))); return;
        case BuiltinId::Arctan: stack_.push_back(Value::makeNumber(std::atan(number(v, "arctan")))); return;
        case BuiltinId::Ln:
            if (number(v, "ln") <= 0) throw illegal("ln");
            stack_.push_back(Value::makeNumber(std::log(v.num)));
            return;
        case BuiltinId::Exp: stack_.push_back(Value::makeNumber(checked(std::exp(number(v, "exp"))))); return;
        case BuiltinId::Round: stack_.push_back(Value::makeNumber(std::round(number(v, "round")))); return;
        case BuiltinId::Trunc: stack_.push_back(Value::makeNumber(std::trunc(number(v, "trunc")))); return;
        case BuiltinId::Odd:
            stack_.push_back(Value::makeBoolean(std::fmod(integral(v, "odd"), 2.0) != 0.0));
            return;
        case BuiltinId::Ord:
            if (v.isText()) {
                if (v.text.size() != 1) throw illegal("ord");
                stack_.push_back(Value::makeNumber(static_cast<unsigned char>(v.text[0])));
            } else if (v.isBoolean()) {
                stack_.push_back(Value::makeNumber(v.flag ? 1.0 : 0.0));
            } else {
                stack_.push_back(Value::makeNumber(integral(v, "ord")));
            }
            return;
        case BuiltinId::Chr: {
            double code = integral(v, "chr");
            if (code < 0 || code > 255) throw illegal("chr");
            stack_.push_back(Value::makeText(std::string(1, static_cast<char>(static_cast<int>(code)))));
            return;
        }
        case BuiltinId::Length:
            if (!v.isText()) throw TWError(ErrorCodes::TYPE_MISMATCH, "length needs a string");
            stack_.push_back(Value::makeNumber(static_cast<double>(v.text.size())));
            return;
        case BuiltinId::Upcase: {
            if (!v.isText()) throw TWError(ErrorCodes::TYPE_MISMATCH, "upcase needs a char or string");
            std::string s = v.text;
            for (auto& ch : s) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            stack_.push_back(Value::makeText(s));
            return;
        }
        case BuiltinId::Pred:
        case BuiltinId::Succ: {
            const int delta = id == BuiltinId::Succ ? 1 : -1;
            if (v.isText() && v.text.size() == 1) {
                int code = static_cast<unsigned char>(v.text[0]) + delta;
                if (code < 0 || code > 255) throw illegal(id == BuiltinId::Succ ? "succ" : "pred");
                stack_.push_back(Value::makeText(std::string(1, static_cast<char>(code))));
            } else {
                stack_.push_back(Value::makeNumber(integral(v, id == BuiltinId::Succ ? "succ" : "pred") + delta));
            }
            return;
        }
    }
}

// write(x:w:d, ...): each argument arrives as value, width, decimals (-1 when absent).
void PascalInterpreter::write(int argc, bool newline) {
    const size_t count = static_cast<size_t>(argc) * 3;
    if (stack_.size() < count) throw TWError(ErrorCodes::INTERNAL_ERROR, "Operand stack underflow");
    const size_t base = stack_.size() - count;
    std::string text;
    for (size_t i = 0; i < static_cast<size_t>(argc); ++i) {
        const Value& v = stack_[base + i * 3];
        const double width = integral(stack_[base + i * 3 + 1], "Field width");
        const double decimals = integral(stack_[base + i * 3 + 2], "Decimal places");
        std::string s;
        if (decimals >= 0 && v.isNumber()) {
            std::ostringstream os;
            os << std::fixed << std::setprecision(static_cast<int>(std::min(decimals, 30.0))) << v.num;
            s = os.str();
        } else {
            s = v.toString();
        }
        if (width > static_cast<double>(s.size())) s.insert(0, static_cast<size_t>(width) - s.size(), ' ');
        text += s;
    }
    stack_.resize(base);
    if (newline || !text.empty()) channel_.output(text, newline);
}

void PascalInterpreter::provideInput(const std::string& text) {
    if (!pending_) return;
    if (pending_->discard) {
        pending_.reset();
        return;
    }
    Value v;
    double n = 0.0;
    switch (pending_->type) {
        case BaseType::Integer:
            if (!parseNumber(text, n) || n != std::floor(n)) {
                channel_.requestInput(std::nullopt);
                return;
            }
            v = Value::makeNumber(n);
            break;
        case BaseType::Real:
            if (!parseNumber(text, n)) {
                channel_.requestInput(std::nullopt);
                return;
            }
            v = Value::makeNumber(n);
            break;
        case BaseType::Boolean: {
            std::string upper = text;
            for (auto& ch : upper) ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            if (upper != "TRUE" && upper != "FALSE") {
                channel_.requestInput(std::nullopt);
                return;
            }
            v = Value::makeBoolean(upper == "TRUE");
            break;
        }
        case BaseType::String:
            v = Value::makeText(text);
            break;
        case BaseType::Char:
            if (text.empty()) {
                channel_.requestInput(std::nullopt);
                return;
            }
            v = Value::makeText(text.substr(0, 1));
            break;
    }
    store(pending_->target, v);
    pending_.reset();
}

} // namespace timewarp
