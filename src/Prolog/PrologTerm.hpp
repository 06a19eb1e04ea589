#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace timewarp {
namespace prolog {

struct Term;
using TermPtr = std::shared_ptr<const Term>;

/**
 * Term - immutable logic term.
 *
 * Variables are numbered. Inside a stored clause the numbers are local
 * (0..varCount-1); the resolution machine renames a clause by adding an
 * offset into its binding store, so terms themselves never change.
 */
struct Term {
    enum class Kind { Atom, Number, String, Var, Compound };

    Kind kind{Kind::Atom};
    std::string name;             // atom or functor name, string text, variable display name
    double number{0.0};
    size_t var{0};                // variable number
    std::vector<TermPtr> args;    // compound arguments
    bool ground{true};            // no variables below this node

    Term() = default;
    Term(const Term&) = default;
    Term(Term&&) = default;
    Term& operator=(const Term&) = default;
    Term& operator=(Term&&) = default;
    // Releases long argument chains (lists of any length) without recursion.
    ~Term();

    static TermPtr makeAtom(const std::string& name);
    static TermPtr makeNumber(double value);
    static TermPtr makeString(const std::string& text);
    static TermPtr makeVar(size_t index, const std::string& name = "_");
    static TermPtr makeCompound(const std::string& name, std::vector<TermPtr> args);

    bool isAtom() const { return kind == Kind::Atom; }
    bool isAtom(const char* n) const { return kind == Kind::Atom && name == n; }
    bool isNumber() const { return kind == Kind::Number; }
    bool isVar() const { return kind == Kind::Var; }
    bool isCompound() const { return kind == Kind::Compound; }
    bool isCallable() const { return kind == Kind::Atom || kind == Kind::Compound; }
    bool is(const char* functor, size_t arity) const {
        return kind == Kind::Compound && args.size() == arity && name == functor;
    }
    size_t arity() const { return args.size(); }
};

struct OperatorDef {
    enum class Type { XFX, XFY, YFX, FY, FX };
    int priority{0};
    Type type{Type::XFX};
};

// Standard operator table shared by the reader and the writer; null when
// name is not an operator of that form.
const OperatorDef* infixOperator(const std::string& name);
const OperatorDef* prefixOperator(const std::string& name);

// "name/arity" key of a callable term.
std::string predicateKey(const Term& term);

// Builds [items... | tail]; tail defaults to [].
TermPtr makeList(const std::vector<TermPtr>& items, TermPtr tail = nullptr);

// Adds offset to every variable number.
TermPtr renameTerm(const TermPtr& term, size_t offset);

// Display form used by write/1. Lists print as [a,b|T], operators infix.
std::string formatTerm(const TermPtr& term);

// Standard order: Var < Number < Atom < String < Compound.
int compareTerms(const TermPtr& a, const TermPtr& b);

/**
 * Bindings - variable store plus trail.
 *
 * Each variable number indexes one slot; an unbound slot is null. Every bind
 * is recorded on the trail so a choice point can undo back to a mark.
 */
class Bindings {
public:
    size_t allocate(size_t count);
    size_t size() const { return slots_.size(); }
    size_t trailSize() const { return trail_.size(); }

    // Follows bound variables to the first unbound variable or non-variable.
    TermPtr deref(TermPtr term) const;

    // Replaces every bound variable in term by its value. A variable reached
    // again inside its own value (a cyclic binding) is replaced by the atom
    // '...'.
    TermPtr resolve(const TermPtr& term) const;

    bool unify(const TermPtr& a, const TermPtr& b, bool occursCheck);

    // Undoes binds after trailMark and drops variables at or above varMark.
    void undo(size_t trailMark, size_t varMark);

    void clear();

private:
    std::vector<TermPtr> slots_;
    std::vector<size_t> trail_;

    void bind(size_t var, const TermPtr& value);
    bool occurs(size_t var, const TermPtr& term) const;
};

} // namespace prolog
} // namespace timewarp
