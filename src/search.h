// The Davis-Putnam-Logemann-Loveland procedure, in its original recursive
// form: simplify, stop if the formula is decided, otherwise split on the next
// variable and search both halves on independent copies of the formula.
//
// No assignment trail is kept. A partial assignment exists only implicitly,
// as the unit clauses each split appended and propagation then consumed.

#ifndef __SEARCH_H__
#define __SEARCH_H__

#include <cstdint>
#include <ctime>
#include <utility>

#include "counters.h"
#include "formula.h"
#include "logging.h"
#include "params.h"
#include "propagate.h"
#include "pure.h"
#include "timer.h"
#include "types.h"

DEFINE_PARAM(pure_literals, 1,
             "If non-zero, delete clauses containing pure literals after unit "
             "propagation at every search node.");

DEFINE_PARAM(skip_absent_vars, 1,
             "If non-zero, don't split on variables that no longer occur in "
             "the simplified formula. Both halves of such a split would be "
             "identical.");

class Search {
public:
    // A budget of 0 means unlimited. The time budget is in CPU seconds.
    explicit Search(uint64_t max_nodes = 0, double max_seconds = 0) :
        max_nodes_(max_nodes),
        max_seconds_(max_seconds),
        start_(0),
        nodes_(0),
        aborted_(false) {}

    // Decides f. Returns UNKNOWN only if the budget ran out first.
    ReturnValue run(const Formula& f) {
        Timer t("search");
        start_ = clock();
        nodes_ = 0;
        aborted_ = false;
        ReturnValue r = search(f, 1);
        LOG(1) << "Explored " << nodes_ << " search nodes";
        return r;
    }

    uint64_t nodes() const { return nodes_; }

    bool aborted() const { return aborted_; }

private:
    bool out_of_budget() {
        if (aborted_) return true;
        if (max_nodes_ > 0 && nodes_ > max_nodes_) {
            LOG(1) << "Node budget of " << max_nodes_ << " exhausted";
            aborted_ = true;
        } else if (max_seconds_ > 0 && nodes_ % 256 == 0 &&
                   static_cast<double>(clock() - start_) / CLOCKS_PER_SEC >
                   max_seconds_) {
            LOG(1) << "Time budget of " << max_seconds_ << "s exhausted";
            aborted_ = true;
        }
        return aborted_;
    }

    // Decides f using only variables numbered n and above. Variables below n
    // were already split on by ancestors and have been propagated away.
    ReturnValue search(Formula f, lit_t n) {
        ++nodes_;
        INC(search_nodes);
        LOG_EVERY_N(1, 100000) << "Explored " << nodes_ << " search nodes, "
                               << "next variable " << n;
        if (out_of_budget()) return UNKNOWN;
        LOG(3) << "Node " << nodes_ << ", next variable " << n << ": "
               << f.debug_string();

        unit_propagate(&f);
        if (f.has_empty_clause()) {
            LOG(2) << "Conflict before splitting on " << n;
            return UNSATISFIABLE;
        }
        if (PARAM_pure_literals) eliminate_pure_literals(&f);
        if (f.empty()) {
            LOG(2) << "All clauses satisfied before splitting on " << n;
            return SATISFIABLE;
        }

        // Every literal left belongs to a variable >= n, so the smallest one
        // left is the next variable that can make a difference.
        if (PARAM_skip_absent_vars) {
            lit_t m = f.min_var();
            if (m > n) {
                LOG(3) << "Skipping absent variables " << n << " to " << m - 1;
                n = m;
            }
        }
        CHECK(n <= f.nvars) << "Branch counter " << n << " exceeds variable "
                            << "count " << f.nvars << " on undecided formula: "
                            << f.debug_string();

        INC(splits);
        LOG(2) << "Splitting on " << n;
        Formula pos(f);
        pos.clauses.push_back(Clause(1, n));
        ReturnValue r = search(std::move(pos), n + 1);
        // UNKNOWN means the budget is spent and the other half would only
        // give up too.
        if (r != UNSATISFIABLE) return r;

        f.clauses.push_back(Clause(1, -n));
        r = search(std::move(f), n + 1);
        if (r == UNSATISFIABLE) LOG(2) << "Both values of " << n << " fail";
        return r;
    }

    uint64_t max_nodes_;
    double max_seconds_;
    clock_t start_;
    uint64_t nodes_;
    bool aborted_;
};

// Returns true exactly when a satisfying assignment exists for f. Never gives
// up.
bool solve(const Formula& f) {
    Search s;
    ReturnValue r = s.run(f);
    CHECK(r != UNKNOWN) << "Unbounded search returned UNKNOWN";
    return r == SATISFIABLE;
}

#endif  // __SEARCH_H__
