#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "PrologParser.hpp"
#include "PrologTerm.hpp"
#include "../Engine/Interpreter.hpp"

namespace timewarp {

/**
 * PrologInterpreter
 *
 * SLD resolution as an explicit machine: the pending conjunction is a linked
 * goal list, alternatives live on a choice-point stack, and bindings are
 * undone from a trail. advance() performs one resolution step (one goal), so
 * a query can stop for readln/1 and be resumed or copied between steps.
 *
 * Every query of the program runs in source order and all of its solutions
 * are enumerated.
 */
class PrologInterpreter : public Interpreter {
public:
    PrologInterpreter(std::shared_ptr<const prolog::Program> program, const EngineOptions& options);

    void start() override;
    void advance() override;
    bool finished() const override { return ended_; }
    std::string completionDetail() const override { return "No more solutions"; }
    void provideInput(const std::string& text) override;
    std::unique_ptr<Interpreter> clone() const override;
    std::optional<SourceLocation> currentLocation() const override;

    size_t choicePointCount() const { return choices_.size(); }

private:
    struct Goal;
    using GoalList = std::shared_ptr<const Goal>;

    struct Goal {
        prolog::TermPtr term;
        size_t cutBarrier{0};   // choice stack height restored by a cut in this goal
        GoalList next;
        int line{0};

        // Unlinks the continuation in a loop; deep recursion leaves very long
        // goal lists behind.
        ~Goal() {
            GoalList rest = std::move(next);
            while (rest && rest.use_count() == 1) {
                GoalList after = std::move(const_cast<Goal&>(*rest).next);
                rest = std::move(after);
            }
        }
    };

    struct ChoicePoint {
        enum class Kind { Clauses, Alternative };
        Kind kind{Kind::Alternative};
        size_t trailMark{0};
        size_t varMark{0};
        GoalList goals;                                     // alternative, or continuation after the call
        prolog::TermPtr call;                               // Clauses: goal being resolved
        const std::vector<prolog::Clause>* clauses{nullptr};
        size_t nextClause{0};
        size_t height{0};                                   // stack height below this entry
    };

    struct PendingRead {
        prolog::TermPtr target;
        bool numeric{false};
    };

    std::shared_ptr<const prolog::Program> program_;
    prolog::Bindings bindings_;
    std::vector<ChoicePoint> choices_;
    GoalList goals_;
    bool active_{false};          // a query is being resolved
    size_t queryIndex_{0};
    std::optional<PendingRead> pending_;
    bool ended_{false};
    int line_{0};
    std::string lineBuffer_;

    void resolveStep();
    void solve(const Goal& goal);
    std::optional<bool> builtin(const prolog::TermPtr& term);
    void callPredicate(const prolog::TermPtr& term, int line);
    bool tryClauses();
    void backtrack();
    void cutTo(size_t height);
    void pushAlternative(GoalList goals);

    static GoalList push(prolog::TermPtr term, size_t cutBarrier, GoalList next, int line);

    double evaluate(const prolog::TermPtr& expr) const;
    bool compareArithmetic(const std::string& op, const prolog::TermPtr& a, const prolog::TermPtr& b) const;
    void flushLine(bool newline);
    void finish();
};

} // namespace timewarp
