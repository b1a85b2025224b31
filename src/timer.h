// Timers: scoped CPU-time accounting for the phases of a solve. Usage:
//
//   { Timer t("propagate"); ... }
//
// accumulates the CPU time spent inside the block under "propagate". Totals
// are printed on exit, or on SIGINT:
//
//   c timer: [propagate] = 12ms (avg: 3µs)
//
// Timers are compiled in with -DTIMERS=1 and enabled at runtime with -t.

#ifndef __TIMER_H__
#define __TIMER_H__

#include <cmath>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>
#include <string>

#include "logging.h"
#include "types.h"

#ifndef TIMERS
#define TIMERS 0
#endif

extern bool FLAGS_time;

class Timers {
public:
    void add(const char* name, clock_t elapsed) {
        Total& t = totals_[name];
        t.seconds += static_cast<double>(elapsed) / CLOCKS_PER_SEC;
        ++t.calls;
    }

    void print() const {
        for (const auto& kv : totals_) {
            PRINT << "c timer: [" << kv.first << "] = "
                  << fancy_time(kv.second.seconds);
            if (kv.second.calls > 1) {
                PRINT << " (avg: "
                      << fancy_time(kv.second.seconds / kv.second.calls)
                      << ")";
            }
            PRINT << std::endl;
        }
    }

    void dump() {
        print();
        totals_.clear();
    }

    static std::string fancy_time(double t) {
        std::ostringstream oss;
        if (t < (1.0 / 1000)) {
            oss << std::fixed << std::setprecision(0) << t * 1000000 << "µs";
        } else if (t < 1) {
            oss << std::fixed << std::setprecision(0) << t * 1000 << "ms";
        } else if (t < 60) {
            oss << std::fixed << std::setprecision(1) << t << "s";
        } else {
            oss << std::fixed << std::setprecision(0) << std::floor(t / 60)
                << "m " << std::fmod(t, 60) << "s";
        }
        return oss.str();
    }

    static Timers& singleton() {
        static Timers s;
        return s;
    }
private:
    struct Total {
        double seconds = 0;
        uint64_t calls = 0;
    };
    std::map<std::string, Total> totals_;
};

// Nested timers with the same name are counted once per scope, so recursive
// callers should time only the outermost call.
class Timer {
public:
    explicit Timer(const char* name) : name_(name), start_(0) {
        if (!TIMERS) return;
        if (!FLAGS_time) return;
        start_ = clock();
    }
    ~Timer() {
        if (!TIMERS) return;
        if (!FLAGS_time) return;
        Timers::singleton().add(name_, clock() - start_);
    }
private:
    const char* name_;
    clock_t start_;
};

void init_timers() {
    if (!TIMERS) return;
    if (!FLAGS_time) return;
    // Initialize singleton so it won't get destroyed before atexit call.
    Timers::singleton();
    std::atexit([]{ Timers::singleton().dump(); });
    ExitOnInterrupt();
}

#endif  // __TIMER_H__
