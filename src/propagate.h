#ifndef __PROPAGATE_H__
#define __PROPAGATE_H__

#include <algorithm>
#include <cstddef>
#include <utility>

#include "counters.h"
#include "formula.h"
#include "logging.h"
#include "timer.h"
#include "types.h"

// Exhaustive unit propagation. While some clause has exactly one literal p,
// every clause containing p is deleted (it is satisfied) and -p is deleted from
// every clause that contains it (it can no longer help). The first unit clause
// in clause order is always chosen; since propagation is confluent the fixed
// point doesn't depend on that choice.
//
// Propagation continues after an empty clause appears, so the result is a true
// fixed point: calling this twice in a row leaves the formula unchanged the
// second time. Each round deletes at least the chosen unit clause, so the loop
// terminates. Returns the number of unit literals propagated.
std::size_t unit_propagate(Formula* f) {
    Timer t("propagate");
    std::vector<Clause>& clauses = f->clauses;
    std::size_t units = 0;
    while (true) {
        auto unit = std::find_if(clauses.begin(), clauses.end(),
                                 [](const Clause& c) { return c.size() == 1; });
        if (unit == clauses.end()) break;
        lit_t p = unit->front();
        ++units;
        INC(units_propagated);
        LOG(3) << "Propagating unit " << p;

        // Compact the surviving clauses to the front of the vector.
        std::size_t kept = 0;
        for (std::size_t i = 0; i < clauses.size(); ++i) {
            Clause& c = clauses[i];
            if (std::find(c.begin(), c.end(), p) != c.end()) {
                INC(clauses_satisfied);
                continue;
            }
            auto end = std::remove(c.begin(), c.end(), -p);
            if (end != c.end()) {
                INC(literals_falsified, c.end() - end);
                c.erase(end, c.end());
            }
            if (kept != i) clauses[kept] = std::move(c);
            ++kept;
        }
        clauses.erase(clauses.begin() + kept, clauses.end());
    }
    LOG(4) << "After propagating " << units << " units: " << f->debug_string();
    return units;
}

#endif  // __PROPAGATE_H__
