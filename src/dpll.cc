// Recursive DPLL: unit propagation, pure-literal elimination and splitting on
// variables in increasing numeric order, with every branch searching its own
// copy of the formula. See search.h.

#include <string>

#include "counters.h"
#include "flags.h"
#include "formula.h"
#include "logging.h"
#include "parse.h"
#include "search.h"
#include "timer.h"
#include "types.h"

int main(int argc, char** argv) {
    int oidx;
    CHECK(parse_flags(argc, argv, &oidx)) <<
        "Usage: " << argv[0] << " [OPTIONS]... [FILE]";
    CHECK(argc - oidx <= 1) << "Expected at most one input file";
    init_counters();
    init_timers();

    DIMACS d(oidx < argc ? argv[oidx] : nullptr);
    Formula f;
    if (!d.read(&f)) {
        PRINT << "c ERROR: " << d.error() << std::endl;
        PRINT << "s UNKNOWN" << std::endl;
        return EXIT_FAILURE;
    }

    Search s(FLAGS_nodes, FLAGS_timeout);
    ReturnValue r = s.run(f);
    PRINT << "c Explored " << s.nodes() << " search nodes" << std::endl;
    if (r == SATISFIABLE) SAT_EXIT;
    if (r == UNSATISFIABLE) UNSAT_EXIT;
    UNKNOWN_EXIT;
}
