#ifndef __LOGGING_H__
#define __LOGGING_H__

#include <signal.h>
#include <iostream>
#include <string>

#include "types.h"

extern int FLAGS_verbosity;

// Logging is compiled out unless built with -DLOGGING=1. When compiled in,
// LOG(i) only prints if the runtime verbosity (-v) is at least i. Every line
// starts with "c " so that log output can be mixed with the verdict.
#ifndef LOGGING
#define LOGGING 0
#endif

#define LOG_ENABLED(i) (LOGGING && FLAGS_verbosity >= i)
#define LOG(i) if (LOG_ENABLED(i)) Logger(__FILE__,__LINE__,false)
#define LOG_EVERY_N(i, n) \
    static uint64_t VARNAME(__c, __LINE__) = 0; ++VARNAME(__c, __LINE__); \
    if (LOG_ENABLED(i) && (VARNAME(__c, __LINE__) % n == 0)) \
        Logger(__FILE__,__LINE__,false)

// Fatal checks are always compiled in. A failed CHECK reports an unknown
// verdict, logs the streamed message and exits with EXIT_FAILURE.
#define CHECK(expr) if (!(expr)) Logger(__FILE__,__LINE__,true)
#define UNSAT_EXIT UnsatExit()
#define SAT_EXIT SatExit()
#define UNKNOWN_EXIT UnknownExit()
#define PRINT std::cout

class Logger {
public:
    Logger(const char* filename, int line, bool fatal) : fatal_(fatal) {
        if (fatal_) {
            PRINT << "s UNKNOWN" << std::endl;
            PRINT << "c [FATAL " << filename << ":" << line << "] ";
        } else {
            PRINT << "c [" << filename << ":" << line << "] ";
        }
    }

    ~Logger() {
        PRINT << std::endl;
        if (fatal_) exit(EXIT_FAILURE);
    }

    template<class T>
    Logger& operator<<(const T& msg) {
        PRINT << msg;
        return *this;
    }

private:
    bool fatal_;
};

void UnsatExit() {
    PRINT << "s UNSATISFIABLE" << std::endl;
    exit(UNSATISFIABLE);
}

void SatExit() {
    PRINT << "s SATISFIABLE" << std::endl;
    exit(SATISFIABLE);
}

void UnknownExit() {
    PRINT << "s UNKNOWN" << std::endl;
    exit(UNKNOWN);
}

// On SIGINT, report an unknown verdict and exit through exit() so that any
// atexit reporters (timers, counters) still run. Safe to call more than once.
void ExitOnInterrupt() {
    struct sigaction sigbreak;
    sigbreak.sa_handler = [](int signum) { UnknownExit(); };
    sigemptyset(&sigbreak.sa_mask);
    sigbreak.sa_flags = 0;
    CHECK(sigaction(SIGINT, &sigbreak, NULL) == 0);
}

#endif  // __LOGGING_H__
