#ifndef __FLAGS_H__
#define __FLAGS_H__

#include <cstdlib>
#include <getopt.h>
#include <iostream>
#include <limits>
#include <string>

#include "logging.h"
#include "params.h"

// To add and use a new flag:
// (1) Declare it and its default below globally as FLAGS_xxx = default.
// (2) Declare an extern reference to it in the module where you want to use it.
// (3) Add an entry to long_options[] and optstring[] below defining its parse.
// (4) Add a case in the switch statement below to handle setting the flag.
// (5) Add a sentence to the help text displayed with -h.

int FLAGS_verbosity = 0;
bool FLAGS_time = false;
bool FLAGS_counters = false;
unsigned long FLAGS_nodes = 0;
double FLAGS_timeout = 0;
std::string FLAGS_params = "";

void print_usage(const char* argv0) {
    PRINT << "Usage: " << argv0 << " [OPTIONS]... [FILE]" << std::endl;
    PRINT << std::endl;
    PRINT << "FILE must be in DIMACS cnf format. If FILE is omitted or is -, "
          << "the formula is read" << std::endl
          << "from standard input. If the input formula is satisfiable, "
          << "\"s SATISFIABLE\" is" << std::endl
          << "written to stdout and the program returns 10. If the input "
          << "formula is" << std::endl
          << "unsatisfiable, \"s UNSATISFIABLE\" is written to stdout and the "
          << "program returns 20." << std::endl
          << "If a search budget runs out, \"s UNKNOWN\" is written and the "
          << "program returns 0." << std::endl << std::endl;
    PRINT << "OPTIONS include:" << std::endl << std::endl;
    PRINT << "  -vN    Set the verbosity to N" << std::endl
          << std::endl;
    PRINT << "  -nN    Give up after exploring N search nodes (0: no limit)"
          << std::endl << std::endl;
    PRINT << "  -TS    Give up after S seconds of CPU time (0: no limit)"
          << std::endl << std::endl;
    PRINT << "  -t     Collect and print timing information"
          << std::endl << std::endl;
    PRINT << "  -c     Collect and print counters" << std::endl
          << std::endl;
    PRINT << "  -h     Display this message" << std::endl << std::endl;
    if (!Params::singleton().empty()) {
        PRINT << "  -p     Set various double-valued params. Param "
              << "overrides must be provided as" << std::endl
              << "         key=value pairs, separated by semicolons. "
              << "Example: \"foo=1.0;bar=2.0\"." << std::endl
              << "         Available params include:" << std::endl
              << std::endl;
        PRINT << Params::singleton().help_string();
    }
}

bool parse_flags(int argc, char* argv[], int* option_index) {
    *option_index = 0;
    int c;
    char* end = nullptr;
    std::string error;

    struct option long_options[] = {
        { "verbosity",      required_argument,  NULL, 'v' },
        { "nodes",          required_argument,  NULL, 'n' },
        { "timeout",        required_argument,  NULL, 'T' },
        { "time",           no_argument,        NULL, 't' },
        { "counters",       no_argument,        NULL, 'c' },
        { "help",           no_argument,        NULL, 'h' },
        { "params",         required_argument,  NULL, 'p' },
        { 0, 0, 0, 0}
    };

    char optstring[] = "v:n:T:p:tch";

    while (1) {
        c = getopt_long(argc, argv, optstring, long_options, nullptr);
        if (c == -1)
            break;

        switch (c) {
        case 'h':
            print_usage(argv[0]);
            exit(0);
            break;
        case 'v':
            FLAGS_verbosity = atoi(optarg);
            PRINT << "c Setting verbosity = " << FLAGS_verbosity
                  << std::endl;
            break;
        case 'n':
            FLAGS_nodes = strtoul(optarg, &end, 10);
            CHECK(*optarg != '\0' && *end == '\0' && *optarg != '-')
                << "Node budget '" << optarg << "' must be a non-negative "
                << "integer";
            PRINT << "c Setting node budget = " << FLAGS_nodes << std::endl;
            break;
        case 'T':
            FLAGS_timeout = strtod(optarg, &end);
            CHECK(*optarg != '\0' && *end == '\0' && FLAGS_timeout >= 0)
                << "Timeout '" << optarg << "' must be a non-negative number "
                << "of seconds";
            PRINT << "c Setting timeout = " << FLAGS_timeout << "s"
                  << std::endl;
            break;
        case 'p':
            FLAGS_params = optarg;
            CHECK(Params::singleton().parse(FLAGS_params, &error)) << error;
            break;
        case 't':
            PRINT << "c Timing enabled" << std::endl;
            FLAGS_time = true;
            break;
        case 'c':
            PRINT << "c Counters enabled" << std::endl;
            FLAGS_counters = true;
            break;
        default:
            return false;
        }
    }
    *option_index = optind;
    return true;
}


#endif // __FLAGS_H__
