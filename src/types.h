#ifndef __TYPES_H__
#define __TYPES_H__

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>

// Literals are signed 32-bit integers: the magnitude names the variable and
// the sign gives its polarity. Clause counts are unsigned 32-bit integers.
typedef int32_t lit_t;
typedef uint32_t clause_t;

// Common #defines
#define var(x) (abs(x))
#define STRING_TOKEN(x) #x
#define STRING(x) STRING_TOKEN(x)
#define VARNAME1(x,y) x##y
#define VARNAME(x,y) VARNAME1(x,y)

// nil values
constexpr lit_t lit_nil = lit_t(0);
constexpr lit_t lit_max = std::numeric_limits<lit_t>::max();

// Verdicts double as process exit codes, following the SAT competition.
enum ReturnValue {
    UNKNOWN = 0,
    SATISFIABLE = 10,
    UNSATISFIABLE = 20
};

// Comparison functor for using const char* in maps
struct cstrcmp {
    bool operator()(const char* x, const char* y) const {
        return std::strcmp(x, y) < 0;
    }
};

#endif  // __TYPES_H__
