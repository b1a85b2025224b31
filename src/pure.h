#ifndef __PURE_H__
#define __PURE_H__

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

#include "counters.h"
#include "formula.h"
#include "logging.h"
#include "timer.h"
#include "types.h"

// Pure-literal elimination. A literal l is pure if -l appears nowhere in the
// formula. Setting every pure literal true satisfies each clause it appears in
// without touching any other clause, so those clauses can be deleted.
// Deleting clauses can make other literals pure, so passes repeat until a pass
// finds no pure literal. A formula without pure literals is left unchanged.
//
// Returns the number of clauses deleted.
std::size_t eliminate_pure_literals(Formula* f) {
    Timer t("eliminate");
    std::vector<Clause>& clauses = f->clauses;
    std::size_t removed = 0;

    // Sorted, duplicate-free literals of the formula. Sized by what occurs,
    // not by nvars, since nvars can be far larger than the formula.
    std::vector<lit_t> lits;

    while (!clauses.empty()) {
        lits.clear();
        for (const Clause& c : clauses) {
            lits.insert(lits.end(), c.begin(), c.end());
        }
        std::sort(lits.begin(), lits.end());
        lits.erase(std::unique(lits.begin(), lits.end()), lits.end());
        if (lits.empty()) break;

        std::size_t kept = 0;
        for (std::size_t i = 0; i < clauses.size(); ++i) {
            Clause& c = clauses[i];
            bool satisfied = false;
            for (lit_t l : c) {
                if (!std::binary_search(lits.begin(), lits.end(), -l)) {
                    LOG(3) << "Literal " << l << " is pure";
                    satisfied = true;
                    break;
                }
            }
            if (satisfied) continue;
            if (kept != i) clauses[kept] = std::move(c);
            ++kept;
        }
        if (kept == clauses.size()) break;

        INC(pure_literal_passes);
        INC(pure_clauses_removed, clauses.size() - kept);
        removed += clauses.size() - kept;
        clauses.erase(clauses.begin() + kept, clauses.end());
    }
    LOG(4) << "After deleting " << removed << " clauses with pure literals: "
           << f->debug_string();
    return removed;
}

#endif  // __PURE_H__
