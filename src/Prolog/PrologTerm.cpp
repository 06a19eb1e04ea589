#include "PrologTerm.hpp"

#include <cctype>
#include <unordered_map>
#include <utility>

#include "../Runtime/Value.hpp"

namespace timewarp {
namespace prolog {

namespace {

using Type = OperatorDef::Type;

const std::map<std::string, OperatorDef>& infixTable() {
    static const std::map<std::string, OperatorDef> table = {
        {":-", {1200, Type::XFX}}, {"-->", {1200, Type::XFX}},
        {";", {1100, Type::XFY}}, {"|", {1100, Type::XFY}},
        {"->", {1050, Type::XFY}},
        {",", {1000, Type::XFY}},
        {"=", {700, Type::XFX}}, {"\\=", {700, Type::XFX}}, {"==", {700, Type::XFX}},
        {"\\==", {700, Type::XFX}}, {"is", {700, Type::XFX}}, {"=:=", {700, Type::XFX}},
        {"=\\=", {700, Type::XFX}}, {"<", {700, Type::XFX}}, {">", {700, Type::XFX}},
        {"=<", {700, Type::XFX}}, {">=", {700, Type::XFX}}, {"=..", {700, Type::XFX}},
        {"+", {500, Type::YFX}}, {"-", {500, Type::YFX}},
        {"*", {400, Type::YFX}}, {"/", {400, Type::YFX}}, {"//", {400, Type::YFX}},
        {"mod", {400, Type::YFX}}, {"rem", {400, Type::YFX}},
        {"**", {200, Type::XFX}}, {"^", {200, Type::XFY}},
    };
    return table;
}

const std::map<std::string, OperatorDef>& prefixTable() {
    static const std::map<std::string, OperatorDef> table = {
        {":-", {1200, Type::FX}}, {"?-", {1200, Type::FX}},
        {"\\+", {900, Type::FY}},
        {"-", {200, Type::FY}}, {"+", {200, Type::FY}},
    };
    return table;
}

TermPtr makeTerm(Term t) {
    return std::make_shared<Term>(std::move(t));
}

bool isWordOperator(const std::string& name) {
    return !name.empty() && std::isalpha(static_cast<unsigned char>(name[0]));
}

// Nesting deeper than this prints as "...".
constexpr int kMaxFormatDepth = 10000;

void formatInto(const TermPtr& term, int maxPriority, std::string& out, int depth);

void formatList(const TermPtr& term, std::string& out, int depth) {
    out += '[';
    TermPtr cur = term;
    bool first = true;
    while (cur->is(".", 2)) {
        if (!first) out += ',';
        formatInto(cur->args[0], 999, out, depth + 1);
        first = false;
        cur = cur->args[1];
    }
    if (!cur->isAtom("[]")) {
        out += '|';
        formatInto(cur, 999, out, depth + 1);
    }
    out += ']';
}

void formatInto(const TermPtr& term, int maxPriority, std::string& out, int depth) {
    if (depth > kMaxFormatDepth) {
        out += "...";
        return;
    }
    switch (term->kind) {
        case Term::Kind::Atom:
        case Term::Kind::String:
            out += term->name;
            return;
        case Term::Kind::Number:
            out += formatNumber(term->number);
            return;
        case Term::Kind::Var:
            out += "_G" + std::to_string(term->var);
            return;
        case Term::Kind::Compound:
            break;
    }
    if (term->is(".", 2)) {
        formatList(term, out, depth);
        return;
    }
    if (term->arity() == 2) {
        if (const OperatorDef* op = infixOperator(term->name)) {
            const bool paren = op->priority > maxPriority;
            const int left = op->type == Type::YFX ? op->priority : op->priority - 1;
            const int right = op->type == Type::XFY ? op->priority : op->priority - 1;
            if (paren) out += '(';
            formatInto(term->args[0], left, out, depth + 1);
            if (isWordOperator(term->name)) {
                out += ' ' + term->name + ' ';
            } else {
                out += term->name;
            }
            formatInto(term->args[1], right, out, depth + 1);
            if (paren) out += ')';
            return;
        }
    }
    if (term->arity() == 1) {
        if (const OperatorDef* op = prefixOperator(term->name)) {
            const bool paren = op->priority > maxPriority;
            if (paren) out += '(';
            out += term->name;
            const TermPtr& arg = term->args[0];
            if (arg->isNumber() || (arg->isAtom() && prefixOperator(arg->name)) || isWordOperator(term->name)) out += ' ';
            formatInto(arg, op->type == Type::FY ? op->priority : op->priority - 1, out, depth + 1);
            if (paren) out += ')';
            return;
        }
    }
    out += term->name;
    out += '(';
    for (size_t i = 0; i < term->args.size(); ++i) {
        if (i) out += ',';
        formatInto(term->args[i], 999, out, depth + 1);
    }
    out += ')';
}

int kindRank(Term::Kind kind) {
    switch (kind) {
        case Term::Kind::Var: return 0;
        case Term::Kind::Number: return 1;
        case Term::Kind::Atom: return 2;
        case Term::Kind::String: return 3;
        case Term::Kind::Compound: return 4;
    }
    return 5;
}

} // namespace

Term::~Term() {
    std::vector<TermPtr> pending;
    for (auto& a : args) {
        if (a.use_count() == 1) pending.push_back(std::move(a));
    }
    args.clear();
    while (!pending.empty()) {
        TermPtr t = std::move(pending.back());
        pending.pop_back();
        if (t.use_count() != 1) continue;
        // Sole owner: move the children out so t is released without recursing.
        Term& owned = const_cast<Term&>(*t);
        for (auto& a : owned.args) {
            if (a.use_count() == 1) pending.push_back(std::move(a));
        }
        owned.args.clear();
    }
}

TermPtr Term::makeAtom(const std::string& name) {
    Term t;
    t.kind = Kind::Atom;
    t.name = name;
    return makeTerm(std::move(t));
}

TermPtr Term::makeNumber(double value) {
    Term t;
    t.kind = Kind::Number;
    t.number = value;
    return makeTerm(std::move(t));
}

TermPtr Term::makeString(const std::string& text) {
    Term t;
    t.kind = Kind::String;
    t.name = text;
    return makeTerm(std::move(t));
}

TermPtr Term::makeVar(size_t index, const std::string& name) {
    Term t;
    t.kind = Kind::Var;
    t.var = index;
    t.name = name;
    t.ground = false;
    return makeTerm(std::move(t));
}

TermPtr Term::makeCompound(const std::string& name, std::vector<TermPtr> args) {
    Term t;
    t.kind = Kind::Compound;
    t.name = name;
    for (const auto& a : args) t.ground = t.ground && a->ground;
    t.args = std::move(args);
    return makeTerm(std::move(t));
}

const OperatorDef* infixOperator(const std::string& name) {
    auto it = infixTable().find(name);
    return it == infixTable().end() ? nullptr : &it->second;
}

const OperatorDef* prefixOperator(const std::string& name) {
    auto it = prefixTable().find(name);
    return it == prefixTable().end() ? nullptr : &it->second;
}

std::string predicateKey(const Term& term) {
    return term.name + "/" + std::to_string(term.arity());
}

TermPtr makeList(const std::vector<TermPtr>& items, TermPtr tail) {
    TermPtr list = tail ? std::move(tail) : Term::makeAtom("[]");
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        list = Term::makeCompound(".", {*it, list});
    }
    return list;
}

TermPtr renameTerm(const TermPtr& term, size_t offset) {
    if (term->ground || offset == 0) return term;
    if (term->isVar()) return Term::makeVar(term->var + offset, term->name);
    std::vector<TermPtr> args;
    args.reserve(term->args.size());
    for (const auto& a : term->args) args.push_back(renameTerm(a, offset));
    return Term::makeCompound(term->name, std::move(args));
}

std::string formatTerm(const TermPtr& term) {
    std::string out;
    formatInto(term, 1200, out, 0);
    return out;
}

int compareTerms(const TermPtr& a, const TermPtr& b) {
    std::vector<std::pair<const Term*, const Term*>> work{{a.get(), b.get()}};
    while (!work.empty()) {
        const Term* x = work.back().first;
        const Term* y = work.back().second;
        work.pop_back();
        if (x == y) continue;
        int rx = kindRank(x->kind);
        int ry = kindRank(y->kind);
        if (rx != ry) return rx < ry ? -1 : 1;
        switch (x->kind) {
            case Term::Kind::Var:
                if (x->var != y->var) return x->var < y->var ? -1 : 1;
                break;
            case Term::Kind::Number:
                if (x->number != y->number) return x->number < y->number ? -1 : 1;
                break;
            case Term::Kind::Atom:
            case Term::Kind::String: {
                int c = x->name.compare(y->name);
                if (c != 0) return c < 0 ? -1 : 1;
                break;
            }
            case Term::Kind::Compound: {
                if (x->arity() != y->arity()) return x->arity() < y->arity() ? -1 : 1;
                int c = x->name.compare(y->name);
                if (c != 0) return c < 0 ? -1 : 1;
                // Pushed last-first so arguments compare left to right.
                for (size_t i = x->args.size(); i-- > 0;) work.emplace_back(x->args[i].get(), y->args[i].get());
                break;
            }
        }
    }
    return 0;
}

size_t Bindings::allocate(size_t count) {
    size_t base = slots_.size();
    slots_.resize(base + count);
    return base;
}

TermPtr Bindings::deref(TermPtr term) const {
    while (term->isVar() && term->var < slots_.size() && slots_[term->var]) {
        term = slots_[term->var];
    }
    return term;
}

TermPtr Bindings::resolve(const TermPtr& term) const {
    struct Frame {
        TermPtr node;
        std::vector<TermPtr> args;
        size_t pathMark;
    };
    // Variables whose value is being rebuilt, innermost last.
    std::vector<size_t> path;
    std::unordered_map<size_t, int> onPath;
    std::vector<Frame> stack;

    auto unwindTo = [&](size_t mark) {
        while (path.size() > mark) {
            if (--onPath[path.back()] == 0) onPath.erase(path.back());
            path.pop_back();
        }
    };
    // Returns the finished value of t, or null after pushing a frame for it.
    auto enter = [&](TermPtr t) -> TermPtr {
        const size_t mark = path.size();
        while (t->isVar() && t->var < slots_.size() && slots_[t->var]) {
            if (onPath.count(t->var)) {
                unwindTo(mark);
                return Term::makeAtom("...");
            }
            path.push_back(t->var);
            ++onPath[t->var];
            t = slots_[t->var];
        }
        if (t->ground || t->isVar()) {
            unwindTo(mark);
            return t;
        }
        Frame frame{t, {}, mark};
        frame.args.reserve(t->args.size());
        stack.push_back(std::move(frame));
        return nullptr;
    };

    TermPtr value = enter(term);
    while (!stack.empty()) {
        Frame& top = stack.back();
        if (top.args.size() < top.node->args.size()) {
            TermPtr child = top.node->args[top.args.size()];
            if (TermPtr done = enter(std::move(child))) stack.back().args.push_back(std::move(done));
            continue;
        }
        TermPtr built = Term::makeCompound(top.node->name, std::move(top.args));
        unwindTo(top.pathMark);
        stack.pop_back();
        if (stack.empty()) return built;
        stack.back().args.push_back(std::move(built));
    }
    return value;
}

void Bindings::bind(size_t var, const TermPtr& value) {
    if (var >= slots_.size()) slots_.resize(var + 1);
    slots_[var] = value;
    trail_.push_back(var);
}

bool Bindings::occurs(size_t var, const TermPtr& term) const {
    std::vector<TermPtr> work{term};
    while (!work.empty()) {
        TermPtr t = deref(work.back());
        work.pop_back();
        if (t->isVar()) {
            if (t->var == var) return true;
        } else if (!t->ground) {
            for (const auto& a : t->args) work.push_back(a);
        }
    }
    return false;
}

bool Bindings::unify(const TermPtr& a, const TermPtr& b, bool occursCheck) {
    std::vector<std::pair<TermPtr, TermPtr>> work{{a, b}};
    while (!work.empty()) {
        TermPtr x = deref(work.back().first);
        TermPtr y = deref(work.back().second);
        work.pop_back();
        if (x == y) continue;
        if (x->isVar() && y->isVar()) {
            if (x->var == y->var) continue;
            // Younger variable points at the older one.
            if (x->var < y->var) {
                bind(y->var, x);
            } else {
                bind(x->var, y);
            }
            continue;
        }
        if (x->isVar() || y->isVar()) {
            const TermPtr& v = x->isVar() ? x : y;
            const TermPtr& other = x->isVar() ? y : x;
            if (occursCheck && occurs(v->var, other)) return false;
            bind(v->var, other);
            continue;
        }
        if (x->kind != y->kind) return false;
        switch (x->kind) {
            case Term::Kind::Atom:
            case Term::Kind::String:
                if (x->name != y->name) return false;
                break;
            case Term::Kind::Number:
                if (x->number != y->number) return false;
                break;
            case Term::Kind::Compound:
                if (x->name != y->name || x->arity() != y->arity()) return false;
                for (size_t i = 0; i < x->args.size(); ++i) work.emplace_back(x->args[i], y->args[i]);
                break;
            case Term::Kind::Var:
                break;
        }
    }
    return true;
}

void Bindings::undo(size_t trailMark, size_t varMark) {
    while (trail_.size() > trailMark) {
        size_t var = trail_.back();
        trail_.pop_back();
        if (var < slots_.size()) slots_[var] = nullptr;
    }
    if (varMark < slots_.size()) slots_.resize(varMark);
}

void Bindings::clear() {
    slots_.clear();
    trail_.clear();
}

} // namespace prolog
} // namespace timewarp
