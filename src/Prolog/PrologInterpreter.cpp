#include "PrologInterpreter.hpp"

#include <cmath>

#include "../Runtime/TWError.hpp"
#include "../Runtime/Value.hpp"

namespace timewarp {

using namespace prolog;

namespace {

constexpr size_t kMaxChoicePoints = 1000000;

double checked(double v) {
    if (!std::isfinite(v)) throw TWError(ErrorCodes::OVERFLOW, "Arithmetic overflow");
    return v;
}

double integral(double v, const char* op) {
    if (v != std::floor(v)) {
        throw TWError(ErrorCodes::TYPE_MISMATCH, std::string(op) + " expects integers, got " + formatNumber(v));
    }
    return v;
}

// Goals that only extend the current output line; a conjunction counts by
// its first goal.
bool isOutputGoal(const Bindings& bindings, TermPtr t) {
    t = bindings.deref(t);
    while (t->is(",", 2)) t = bindings.deref(t->args[0]);
    return t->isAtom("nl") || t->is("write", 1) || t->is("print", 1) || t->is("writeln", 1) || t->is("tab", 1);
}

} // namespace

PrologInterpreter::PrologInterpreter(std::shared_ptr<const Program> program, const EngineOptions& options)
    : Interpreter(options), program_(std::move(program)) {
    start();
}

void PrologInterpreter::start() {
    bindings_.clear();
    choices_.clear();
    goals_.reset();
    active_ = false;
    queryIndex_ = 0;
    pending_.reset();
    ended_ = false;
    line_ = 0;
    lineBuffer_.clear();
    channel_.clear();
    turtle_.reset(options_.initialPenDown);
}

std::unique_ptr<Interpreter> PrologInterpreter::clone() const {
    return std::make_unique<PrologInterpreter>(*this);
}

std::optional<SourceLocation> PrologInterpreter::currentLocation() const {
    if (line_ == 0) return std::nullopt;
    return SourceLocation{line_, 0};
}

PrologInterpreter::GoalList PrologInterpreter::push(TermPtr term, size_t cutBarrier, GoalList next, int line) {
    return std::make_shared<Goal>(Goal{std::move(term), cutBarrier, std::move(next), line});
}

void PrologInterpreter::advance() {
    if (ended_ || pending_) return;
    try {
        resolveStep();
    } catch (const TWError&) {
        // Text written before the failing goal is still shown.
        if (!lineBuffer_.empty()) flushLine(false);
        throw;
    }
}

void PrologInterpreter::resolveStep() {
    if (!active_) {
        if (queryIndex_ >= program_->queries.size()) {
            finish();
            return;
        }
        const Query& q = program_->queries[queryIndex_++];
        bindings_.clear();
        choices_.clear();
        size_t base = bindings_.allocate(q.varCount);
        goals_ = push(renameTerm(q.goal, base), 0, nullptr, q.line);
        active_ = true;
        return;
    }
    if (!goals_) {
        // Solution found; look for the next one.
        if (!lineBuffer_.empty()) flushLine(false);
        backtrack();
        return;
    }
    GoalList g = goals_;
    goals_ = g->next;
    if (g->line != 0) line_ = g->line;
    // Written text waits only for a following nl, so a line is one event.
    if (!lineBuffer_.empty() && !isOutputGoal(bindings_, g->term)) flushLine(false);
    solve(*g);
}

void PrologInterpreter::finish() {
    if (!lineBuffer_.empty()) flushLine(false);
    choices_.clear();
    goals_.reset();
    active_ = false;
    ended_ = true;
}

void PrologInterpreter::flushLine(bool newline) {
    channel_.output(lineBuffer_, newline);
    lineBuffer_.clear();
}

void PrologInterpreter::pushAlternative(GoalList goals) {
    if (choices_.size() >= kMaxChoicePoints) {
        throw TWError(ErrorCodes::OUT_OF_MEMORY, "Out of memory: too many choice points");
    }
    ChoicePoint cp;
    cp.kind = ChoicePoint::Kind::Alternative;
    cp.trailMark = bindings_.trailSize();
    cp.varMark = bindings_.size();
    cp.goals = std::move(goals);
    cp.height = choices_.size();
    choices_.push_back(std::move(cp));
}

void PrologInterpreter::cutTo(size_t height) {
    if (choices_.size() > height) choices_.resize(height);
}

void PrologInterpreter::backtrack() {
    while (!choices_.empty()) {
        ChoicePoint& cp = choices_.back();
        bindings_.undo(cp.trailMark, cp.varMark);
        if (cp.kind == ChoicePoint::Kind::Alternative) {
            goals_ = cp.goals;
            choices_.pop_back();
            return;
        }
        if (tryClauses()) return;
    }
    // Query exhausted.
    goals_.reset();
    active_ = false;
}

// Tries the remaining clauses of the Clauses entry on top of the stack. The
// entry is dropped once its last clause has been taken.
bool PrologInterpreter::tryClauses() {
    ChoicePoint& cp = choices_.back();
    while (cp.nextClause < cp.clauses->size()) {
        const Clause& clause = (*cp.clauses)[cp.nextClause++];
        bindings_.undo(cp.trailMark, cp.varMark);
        const size_t base = bindings_.allocate(clause.varCount);
        if (!bindings_.unify(renameTerm(clause.head, base), cp.call, options_.occursCheck)) continue;

        const size_t barrier = cp.height;
        GoalList continuation = cp.goals;
        if (cp.nextClause >= cp.clauses->size()) choices_.pop_back();
        TermPtr body = renameTerm(clause.body, base);
        goals_ = body->isAtom("true") ? continuation : push(body, barrier, continuation, clause.line);
        return true;
    }
    choices_.pop_back();
    return false;
}

void PrologInterpreter::callPredicate(const TermPtr& term, int line) {
    const std::string key = predicateKey(*term);
    auto it = program_->predicates.find(key);
    if (it == program_->predicates.end()) {
        throw TWError(ErrorCodes::UNDEFINED_PREDICATE, "Undefined predicate " + key, line);
    }
    if (choices_.size() >= kMaxChoicePoints) {
        throw TWError(ErrorCodes::OUT_OF_MEMORY, "Out of memory: too many choice points", line);
    }
    ChoicePoint cp;
    cp.kind = ChoicePoint::Kind::Clauses;
    cp.trailMark = bindings_.trailSize();
    cp.varMark = bindings_.size();
    cp.goals = goals_;
    cp.call = term;
    cp.clauses = &it->second;
    cp.height = choices_.size();
    choices_.push_back(std::move(cp));
    if (!tryClauses()) backtrack();
}

void PrologInterpreter::solve(const Goal& goal) {
    TermPtr t = bindings_.deref(goal.term);
    if (t->isVar()) {
        throw TWError(ErrorCodes::INSTANTIATION_ERROR, "Arguments are not sufficiently instantiated", goal.line);
    }
    if (!t->isCallable()) {
        throw TWError(ErrorCodes::TYPE_MISMATCH, "Goal is not callable: " + formatTerm(t), goal.line);
    }
    if (trace_) trace(goal.line, formatTerm(bindings_.resolve(t)));

    const size_t barrier = goal.cutBarrier;
    if (t->isAtom("!")) {
        cutTo(barrier);
        return;
    }
    if (t->isAtom("true")) return;
    if (t->isAtom("fail") || t->isAtom("false")) {
        backtrack();
        return;
    }
    if (t->is(",", 2)) {
        goals_ = push(t->args[0], barrier, push(t->args[1], barrier, goals_, goal.line), goal.line);
        return;
    }
    if (t->is(";", 2)) {
        const TermPtr lhs = bindings_.deref(t->args[0]);
        if (lhs->is("->", 2)) {
            const size_t h = choices_.size();
            pushAlternative(push(t->args[1], barrier, goals_, goal.line));
            GoalList then = push(lhs->args[1], barrier, goals_, goal.line);
            goals_ = push(lhs->args[0], h + 1, push(Term::makeAtom("!"), h, then, goal.line), goal.line);
        } else {
            pushAlternative(push(t->args[1], barrier, goals_, goal.line));
            goals_ = push(lhs, barrier, goals_, goal.line);
        }
        return;
    }
    if (t->is("->", 2)) {
        const size_t h = choices_.size();
        GoalList then = push(t->args[1], barrier, goals_, goal.line);
        goals_ = push(t->args[0], h, push(Term::makeAtom("!"), h, then, goal.line), goal.line);
        return;
    }
    if (t->is("\\+", 1) || t->is("not", 1)) {
        // Succeeds through the alternative only when the inner goal fails.
        const size_t h = choices_.size();
        pushAlternative(goals_);
        GoalList failAfter = push(Term::makeAtom("!"), h, push(Term::makeAtom("fail"), h, nullptr, goal.line),
                                  goal.line);
        goals_ = push(t->args[0], h + 1, failAfter, goal.line);
        return;
    }
    if (t->name == "call" && t->isCompound()) {
        TermPtr target = bindings_.deref(t->args[0]);
        if (t->arity() > 1) {
            if (!target->isCallable()) {
                throw TWError(ErrorCodes::TYPE_MISMATCH, "call/N needs a callable term", goal.line);
            }
            std::vector<TermPtr> args = target->args;
            args.insert(args.end(), t->args.begin() + 1, t->args.end());
            target = Term::makeCompound(target->name, std::move(args));
        }
        goals_ = push(target, choices_.size(), goals_, goal.line);
        return;
    }
    if (t->isAtom("halt")) {
        finish();
        return;
    }

    std::optional<bool> result = builtin(t);
    if (!result) {
        callPredicate(t, goal.line);
    } else if (!*result) {
        backtrack();
    }
}

std::optional<bool> PrologInterpreter::builtin(const TermPtr& t) {
    const std::string& name = t->name;
    const size_t n = t->arity();
    auto arg = [&](size_t i) { return bindings_.deref(t->args[i]); };

    if (n == 0) {
        if (name == "nl") {
            flushLine(true);
            return true;
        }
        return std::nullopt;
    }

    if (n == 1) {
        if (name == "write" || name == "print") {
            lineBuffer_ += formatTerm(bindings_.resolve(t->args[0]));
            return true;
        }
        if (name == "writeln") {
            lineBuffer_ += formatTerm(bindings_.resolve(t->args[0]));
            flushLine(true);
            return true;
        }
        if (name == "tab") {
            double count = integral(evaluate(t->args[0]), "tab");
            if (count > 0) lineBuffer_.append(static_cast<size_t>(count), ' ');
            return true;
        }
        if (name == "atom") return arg(0)->isAtom();
        if (name == "number") return arg(0)->isNumber();
        if (name == "integer") {
            TermPtr x = arg(0);
            return x->isNumber() && x->number == std::floor(x->number);
        }
        if (name == "atomic") {
            TermPtr x = arg(0);
            return !x->isVar() && !x->isCompound();
        }
        if (name == "var") return arg(0)->isVar();
        if (name == "nonvar") return !arg(0)->isVar();
        if (name == "is_list") {
            TermPtr x = arg(0);
            while (x->is(".", 2)) x = bindings_.deref(x->args[1]);
            return x->isAtom("[]");
        }
        if (name == "readln" || name == "readint") {
            if (!lineBuffer_.empty()) flushLine(false);
            pending_ = PendingRead{t->args[0], name == "readint"};
            channel_.requestInput(std::nullopt);
            return true;
        }
        return std::nullopt;
    }

    if (n != 2) return std::nullopt;

    if (name == "=") return bindings_.unify(t->args[0], t->args[1], options_.occursCheck);
    if (name == "\\=") {
        const size_t trail = bindings_.trailSize();
        const size_t vars = bindings_.size();
        bool unified = bindings_.unify(t->args[0], t->args[1], options_.occursCheck);
        bindings_.undo(trail, vars);
        return !unified;
    }
    if (name == "==" || name == "\\==") {
        bool same = compareTerms(bindings_.resolve(t->args[0]), bindings_.resolve(t->args[1])) == 0;
        return name == "==" ? same : !same;
    }
    if (name == "is") {
        return bindings_.unify(t->args[0], Term::makeNumber(evaluate(t->args[1])), options_.occursCheck);
    }
    if (name == "=:=" || name == "=\\=" || name == "<" || name == ">" || name == "=<" || name == ">=") {
        return compareArithmetic(name, t->args[0], t->args[1]);
    }
    if (name == "length") {
        TermPtr x = arg(0);
        size_t count = 0;
        while (x->is(".", 2)) {
            ++count;
            x = bindings_.deref(x->args[1]);
        }
        if (x->isAtom("[]")) {
            return bindings_.unify(t->args[1], Term::makeNumber(static_cast<double>(count)), options_.occursCheck);
        }
        TermPtr len = arg(1);
        if (!x->isVar() || !len->isNumber()) {
            throw TWError(ErrorCodes::INSTANTIATION_ERROR, "length/2: list or length must be known");
        }
        double wanted = integral(len->number, "length");
        if (wanted < static_cast<double>(count)) return false;
        std::vector<TermPtr> fresh;
        const size_t extra = static_cast<size_t>(wanted) - count;
        const size_t base = bindings_.allocate(extra);
        for (size_t i = 0; i < extra; ++i) fresh.push_back(Term::makeVar(base + i));
        return bindings_.unify(x, makeList(fresh), options_.occursCheck);
    }
    return std::nullopt;
}

double PrologInterpreter::evaluate(const TermPtr& expr) const {
    TermPtr t = bindings_.deref(expr);
    switch (t->kind) {
        case Term::Kind::Number:
            return t->number;
        case Term::Kind::Var:
            throw TWError(ErrorCodes::INSTANTIATION_ERROR, "Arguments are not sufficiently instantiated");
        case Term::Kind::Atom:
            if (t->name == "pi") return std::acos(-1.0);
            if (t->name == "e") return std::exp(1.0);
            throw TWError(ErrorCodes::TYPE_MISMATCH, "Not an arithmetic expression: " + t->name);
        case Term::Kind::String:
            throw TWError(ErrorCodes::TYPE_MISMATCH, "Not an arithmetic expression: \"" + t->name + "\"");
        case Term::Kind::Compound:
            break;
    }

    const std::string& op = t->name;
    if (t->arity() == 1) {
        const double x = evaluate(t->args[0]);
        if (op == "-") return -x;
        if (op == "+") return x;
        if (op == "abs") return std::fabs(x);
        if (op == "sign") return x > 0 ? 1.0 : (x < 0 ? -1.0 : 0.0);
        if (op == "sqrt") {
            if (x < 0) throw TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, "sqrt of a negative number");
            return std::sqrt(x);
        }
        if (op == "sin") return std::sin(x);
        if (op == "cos") return std::cos(x);
        if (op == "tan") return checked(std::tan(x));
        if (op == "atan") return std::atan(x);
        if (op == "exp") return checked(std::exp(x));
        if (op == "log") {
            if (x <= 0) throw TWError(ErrorCodes::ILLEGAL_FUNCTION_CALL, "log of a non-positive number");
            return std::log(x);
        }
        if (op == "truncate" || op == "integer") return op == "integer" ? std::round(x) : std::trunc(x);
        if (op == "round") return std::round(x);
        if (op == "floor") return std::floor(x);
        if (op == "ceiling") return std::ceil(x);
        if (op == "float") return x;
    } else if (t->arity() == 2) {
        const double a = evaluate(t->args[0]);
        const double b = evaluate(t->args[1]);
        if (op == "+") return checked(a + b);
        if (op == "-") return checked(a - b);
        if (op == "*") return checked(a * b);
        if (op == "/") {
            if (b == 0.0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
            return checked(a / b);
        }
        if (op == "//" || op == "mod" || op == "rem") {
            const double x = integral(a, op.c_str());
            const double y = integral(b, op.c_str());
            if (y == 0.0) throw TWError(ErrorCodes::DIVISION_BY_ZERO, "Division by zero");
            if (op == "//") return std::trunc(x / y);
            double r = std::fmod(x, y);
            // mod takes the sign of the divisor.
            if (op == "mod" && r != 0.0 && ((r < 0) != (y < 0))) r += y;
            return r;
        }
        if (op == "min") return std::fmin(a, b);
        if (op == "max") return std::fmax(a, b);
        if (op == "**" || op == "^") return checked(std::pow(a, b));
        if (op == "atan2") return std::atan2(a, b);
    }
    throw TWError(ErrorCodes::TYPE_MISMATCH, "Unknown arithmetic function " + predicateKey(*t));
}

bool PrologInterpreter::compareArithmetic(const std::string& op, const TermPtr& a, const TermPtr& b) const {
    const double x = evaluate(a);
    const double y = evaluate(b);
    if (op == "=:=") return x == y;
    if (op == "=\\=") return x != y;
    if (op == "<") return x < y;
    if (op == ">") return x > y;
    if (op == "=<") return x <= y;
    return x >= y;
}

void PrologInterpreter::provideInput(const std::string& text) {
    if (!pending_) return;
    TermPtr value;
    if (pending_->numeric) {
        double n = 0.0;
        if (!parseNumber(text, n)) {
            channel_.requestInput(std::nullopt);
            return;
        }
        value = Term::makeNumber(n);
    } else {
        value = Term::makeString(text);
    }
    TermPtr target = pending_->target;
    pending_.reset();
    if (!bindings_.unify(target, value, options_.occursCheck)) backtrack();
}

} // namespace timewarp
