#ifndef __FORMULA_H__
#define __FORMULA_H__

#include <algorithm>
#include <cstddef>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "counters.h"
#include "logging.h"
#include "types.h"

typedef std::vector<lit_t> Clause;

// Outcome of installing a raw clause into a Formula.
enum AddStatus {
    ADDED = 0,        // Clause was stored (possibly with duplicates removed).
    TAUTOLOGY = 1,    // Clause contained some v and -v and was dropped.
    OUT_OF_RANGE = 2  // Clause contained 0 or a literal beyond nvars. Rejected.
};

// A CNF formula: the conjunction of clauses, each the disjunction of its
// literals. Valid variables range from 1 to nvars, inclusive.
//
// Invariants maintained by add_clause:
//   - every literal l satisfies 0 < var(l) <= nvars,
//   - no clause contains both l and -l,
//   - no clause contains the same literal twice.
//
// An empty clause is a contradiction. A formula with no clauses is true.
// Formulas are plain values: copying one gives a fully independent formula,
// which is how the search isolates sibling branches from one another.
struct Formula {
    lit_t nvars;
    std::vector<Clause> clauses;

    explicit Formula(lit_t nvars = 0) : nvars(nvars) {}

    // Validates and installs a clause given as a raw literal sequence. Nothing
    // is added unless the result is ADDED. An empty input clause is added
    // as-is and makes the formula unsatisfiable.
    AddStatus add_clause(const std::vector<lit_t>& lits) {
        Clause c;
        c.reserve(lits.size());
        for (lit_t l : lits) {
            if (l == lit_nil || l == std::numeric_limits<lit_t>::min() ||
                var(l) > nvars) {
                LOG(2) << "Literal " << l << " out of range [1, " << nvars
                       << "]";
                return OUT_OF_RANGE;
            }
        }
        for (lit_t l : lits) {
            if (std::find(c.begin(), c.end(), -l) != c.end()) {
                INC(tautologies_dropped);
                LOG(3) << "Dropping tautological clause containing " << l
                       << " and " << -l;
                return TAUTOLOGY;
            }
            if (std::find(c.begin(), c.end(), l) == c.end()) c.push_back(l);
        }
        clauses.push_back(std::move(c));
        return ADDED;
    }

    inline std::size_t size() const { return clauses.size(); }

    inline bool empty() const { return clauses.empty(); }

    bool has_empty_clause() const {
        for (const Clause& c : clauses) {
            if (c.empty()) return true;
        }
        return false;
    }

    // Smallest variable that occurs in some clause, or lit_nil if no clause
    // has a literal.
    lit_t min_var() const {
        lit_t m = lit_nil;
        for (const Clause& c : clauses) {
            for (lit_t l : c) {
                if (m == lit_nil || var(l) < m) m = var(l);
            }
        }
        return m;
    }

    std::size_t num_literals() const {
        std::size_t n = 0;
        for (const Clause& c : clauses) n += c.size();
        return n;
    }

    std::string debug_string() const {
        std::ostringstream oss;
        for (const Clause& c : clauses) {
            oss << "(";
            for (std::size_t i = 0; i < c.size(); ++i) {
                oss << c[i];
                if (i + 1 != c.size()) oss << " ";
            }
            oss << ") ";
        }
        return oss.str();
    }
};

#endif  // __FORMULA_H__
