// Counters: low-overhead unsigned 64-bit counters that report total and average
// increment. Usage:
//
//   INC(foo);       // Increment foo by 1. foo must be a valid variable name.
//   INC(foo, 100);  // Increment foo by 100.
//
// On program termination or SIGINT, totals are reported:
//
//   c counter: [foo] = 21225
//
// If the counter total is different than the number of calls to INC, an average
// increment is also reported:
//
//   c counter: [foo] = 21225 (avg: 12.5)
//
// Counters are compiled in with -DCOUNTERS=1 and enabled at runtime with -c.
// Several INC sites may share a name; their totals are merged when printed.

#ifndef __COUNTERS_H__
#define __COUNTERS_H__

#include <cstdint>
#include <map>
#include <string>

#include "logging.h"
#include "types.h"

#ifndef COUNTERS
#define COUNTERS 0
#endif

extern bool FLAGS_counters;

#define INC2(counter, val) \
    static Counter VARNAME(__counter, __LINE__)(STRING(counter)); \
    if (FLAGS_counters) VARNAME(__counter, __LINE__).add(val);
#define INC1(counter) INC2(counter, 1);
#define GETMACRO(_1,_2,NAME,...) NAME
#define INC(...) if (COUNTERS) {GETMACRO(__VA_ARGS__, INC2, INC1)(__VA_ARGS__)}

struct Counter;

class Counters {
public:
    void register_counter(const char* name, const Counter* c) {
        counters_.insert({name, c});
    }

    void print() const;

    void dump() {
        print();
        counters_.clear();
    }

    static Counters& singleton() {
        static Counters s;
        return s;
    }
private:
    std::multimap<const char*, const Counter*, cstrcmp> counters_;
};

// One INC site. Registers itself on first use if counters are enabled.
struct Counter {
    explicit Counter(const char* name) {
        if (FLAGS_counters) Counters::singleton().register_counter(name, this);
    }

    void add(uint64_t val) {
        ++calls;
        sum += val;
    }

    uint64_t calls = 0;
    uint64_t sum = 0;
};

void Counters::print() const {
    for (auto itr = counters_.begin(); itr != counters_.end();) {
        auto range = counters_.equal_range(itr->first);
        uint64_t calls = 0;
        uint64_t sum = 0;
        for (auto jtr = range.first; jtr != range.second; ++jtr) {
            calls += jtr->second->calls;
            sum += jtr->second->sum;
        }
        PRINT << "c counter: [" << itr->first << "] = " << sum;
        if (calls != sum) {
            PRINT << " (avg: " << static_cast<double>(sum) / calls << ")";
        }
        PRINT << std::endl;
        itr = range.second;
    }
}

void init_counters() {
    if (!COUNTERS) return;
    if (!FLAGS_counters) return;
    // Initialize singleton so it won't get destroyed before atexit call.
    Counters::singleton();
    std::atexit([]{ Counters::singleton().dump(); });
    ExitOnInterrupt();
}

#endif  // __COUNTERS_H__
