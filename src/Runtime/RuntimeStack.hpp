// Runtime stacks for FOR/NEXT, GOSUB/RETURN (and PILOT U:/E:) frames.
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "../Basic/BasicAst.hpp"

namespace timewarp {

// Statement list entered by a REPEAT body or an IF branch.
struct BlockFrame {
    const basic::StmtList* body{nullptr};
    size_t index{0};   // next statement in body
    long remaining{1}; // passes left including the current one
};

// Execution position: statement `stmt` of program line `line`, or, when
// blocks is non-empty, the next statement of the innermost block.
struct ProgramPosition {
    size_t line{0};
    size_t stmt{0};
    std::vector<BlockFrame> blocks;
};

struct ForFrame {
    std::string varKey;      // control variable (upper case)
    double limit{0.0};       // TO limit
    double step{1.0};        // STEP value
    ProgramPosition resume;  // first statement of the loop body
};

struct GosubFrame {
    ProgramPosition returnTo;
    int callerLine{0};       // source line of the GOSUB / U:, for traces
};

class RuntimeStack {
public:
    void clear() { forStack_.clear(); gosubStack_.clear(); }

    // FOR/NEXT. A FOR on a variable that already has an open loop replaces it
    // together with every loop nested inside it.
    void pushFor(const ForFrame& f) {
        for (size_t i = 0; i < forStack_.size(); ++i) {
            if (forStack_[i].varKey == f.varKey) {
                forStack_.resize(i);
                break;
            }
        }
        forStack_.push_back(f);
    }
    ForFrame* topFor() { return forStack_.empty() ? nullptr : &forStack_.back(); }

    // NEXT X closes any inner loops left open; nullptr when X has no loop.
    ForFrame* findFor(const std::string& varKey) {
        for (size_t i = forStack_.size(); i-- > 0;) {
            if (forStack_[i].varKey == varKey) {
                forStack_.resize(i + 1);
                return &forStack_.back();
            }
        }
        return nullptr;
    }
    void popFor() { if (!forStack_.empty()) forStack_.pop_back(); }
    size_t forDepth() const { return forStack_.size(); }

    // GOSUB/RETURN
    void pushGosub(const GosubFrame& f) { gosubStack_.push_back(f); }
    bool popGosub(GosubFrame& out) {
        if (gosubStack_.empty()) return false;
        out = gosubStack_.back(); gosubStack_.pop_back(); return true;
    }
    size_t gosubDepth() const { return gosubStack_.size(); }

private:
    std::vector<ForFrame> forStack_;
    std::vector<GosubFrame> gosubStack_;
};

} // namespace timewarp
