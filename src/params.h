#ifndef __PARAMS_H__
#define __PARAMS_H__

#include <cstdlib>
#include <map>
#include <sstream>
#include <string>

#include "logging.h"
#include "types.h"

// Tunable double-valued parameters. A param is declared once, at namespace
// scope in the translation unit that uses it:
//
//   DEFINE_PARAM(foo, 1, "Help text for foo.");
//
// and is then read as PARAM_foo. Defaults can be overridden on the command
// line with -p "foo=0;bar=2.5".
#define DEFINE_PARAM(param, default_val, help_text)   \
    double PARAM_##param = default_val; \
    ParamRegisterer REG_##param(STRING(param), &PARAM_##param, help_text);

struct Params {
    void register_param(const char* name, double* val, const char* help_text) {
        ptrs[name] = val;
        help[name] = help_text;
    }

    // Applies semicolon-separated key=value overrides. Returns false and
    // fills in error if any override is malformed or names an unknown param.
    // Overrides before the bad one stay applied.
    bool parse(const std::string& param_defs, std::string* error) {
        std::istringstream iss(param_defs);
        std::string kv;
        while (std::getline(iss, kv, ';')) {
            if (kv.empty()) continue;
            std::size_t eq = kv.find('=');
            if (eq == std::string::npos) {
                *error = "Error parsing k=v: '" + kv + "'";
                return false;
            }
            std::string k = kv.substr(0, eq);
            std::string value_str = kv.substr(eq + 1);
            char* end = nullptr;
            double v = strtod(value_str.c_str(), &end);
            if (value_str.empty() || *end != '\0') {
                *error = "Error converting '" + value_str + "' to double.";
                return false;
            }
            auto itr = ptrs.find(k.c_str());
            if (itr == ptrs.end()) {
                *error = "Attempt to set undefined parameter '" + k + "'";
                return false;
            }
            LOG(1) << "Overriding param: " << k << " = " << v;
            *itr->second = v;
        }
        return true;
    }

    bool empty() const {
        return ptrs.empty();
    }

    // One entry per param, help text wrapped to kLineLength columns.
    std::string help_string() const {
        static const std::size_t kLineLength = 80;
        static const std::string kIndent = "     ";
        std::ostringstream oss;
        for (const auto& kv : help) {
            std::string hang =
                kIndent + "  " + std::string(strlen(kv.first), ' ');
            std::string line = kIndent + kv.first + ": ";
            std::istringstream words(kv.second);
            std::string word;
            while (words >> word) {
                if (line.size() + word.size() + 1 > kLineLength) {
                    oss << line << std::endl;
                    line = hang;
                }
                line += word + " ";
            }
            oss << line << std::endl;
            oss << hang << "Default: " << *ptrs.at(kv.first) << std::endl
                << std::endl;
        }
        return oss.str();
    }

    static Params& singleton() {
        static Params s;
        return s;
    }
private:
    std::map<const char*, double*, cstrcmp> ptrs;
    std::map<const char*, const char*, cstrcmp> help;
};

struct ParamRegisterer {
    ParamRegisterer(const char* name, double* value, const char* help_text) {
        Params::singleton().register_param(name, value, help_text);
    }
};

#endif  // __PARAMS_H__
