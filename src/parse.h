#ifndef __PARSE_H__
#define __PARSE_H__

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "formula.h"
#include "logging.h"
#include "timer.h"
#include "types.h"

// Reader for a DIMACS cnf input file. File starts with zero or more comments
// followed by a line declaring the number of variables and clauses in the file.
// Each subsequent line is the zero-terminated definition of a disjunction.
// Clauses are specified by integers representing literals, starting at 1.
// Negated literals are represented with a leading minus.
//
// Example: The following CNF formula:
//
//   (x_1 OR x_2) AND (x_3) AND (NOT x_2 OR NOT x_3 OR x_4)
//
// Can be represented with the following file:
//
// c Header comment
// p cnf 4 3
// 1 2 0
// 3 0
// -2 -3 4 0
//
// A comment starts with a lone c token and runs to the end of the line.
// Comment lines may also appear between clauses, a clause may span several
// lines, and a lone % ends the clause list (as in the SATLIB benchmarks). A
// final clause missing its terminating 0 is accepted.
//
// Usage:
//
// DIMACS d(filename);
// Formula f;
// if (!d.read(&f)) { /* report d.error() */ }
struct DIMACS {
    // Reads from filename, or from stdin if filename is null or "-".
    explicit DIMACS(const char* filename) :
        filename_(filename == nullptr ? "-" : filename), owned_(false) {
        if (filename_ == "-") {
            f_ = stdin;
        } else {
            f_ = fopen(filename_.c_str(), "r");
            owned_ = true;
        }
    }

    // Reads from an already open stream, which the caller keeps ownership of.
    explicit DIMACS(FILE* f) : filename_("<stream>"), f_(f), owned_(false) {}

    ~DIMACS() { if (owned_ && f_ != nullptr) fclose(f_); }

    DIMACS(const DIMACS&) = delete;
    DIMACS& operator=(const DIMACS&) = delete;

    // Parses the whole input into f. Returns false on the first malformed or
    // out-of-range token, in which case error() describes the problem and f
    // must not be used.
    bool read(Formula* f) {
        Timer t("parse");
        if (f_ == nullptr) {
            error_ = "Failed to open file: " + filename_;
            return false;
        }
        if (!read_header()) return false;
        *f = Formula(nvars_);
        LOG(1) << "Problem has " << nvars_ << " variables and " << nclauses_
               << " clauses.";

        std::vector<lit_t> c;
        bool open = false;  // Have we read part of a clause?
        clause_t seen = 0;
        std::string tok;
        while (next_token(&tok)) {
            if (tok == "c") { skip_line(); continue; }
            if (tok == "%") break;
            lit_t l;
            if (!to_lit(tok, &l)) return false;
            if (l != lit_nil) {
                c.push_back(l);
                open = true;
                continue;
            }
            if (!install(f, c, ++seen)) return false;
            c.clear();
            open = false;
        }
        if (open && !install(f, c, ++seen)) return false;

        if (seen != nclauses_) {
            LOG(1) << "Header declares " << nclauses_ << " clauses but "
                   << seen << " were read.";
        }
        LOG(1) << "Done parsing input, kept " << f->size() << " clauses.";
        return true;
    }

    inline lit_t nvars() const { return nvars_; }

    inline clause_t nclauses() const { return nclauses_; }

    inline const std::string& error() const { return error_; }

private:
    bool fail(const std::string& msg) {
        std::ostringstream oss;
        oss << filename_ << ":" << line_ << ": " << msg;
        error_ = oss.str();
        return false;
    }

    // Reads the next whitespace-delimited token. Returns false at EOF.
    bool next_token(std::string* tok) {
        tok->clear();
        int ch;
        while ((ch = getc(f_)) != EOF && isspace(ch)) {
            if (ch == '\n') ++line_;
        }
        while (ch != EOF && !isspace(ch)) {
            tok->push_back(static_cast<char>(ch));
            ch = getc(f_);
        }
        if (ch != EOF) ungetc(ch, f_);
        return !tok->empty();
    }

    void skip_line() {
        int ch;
        while ((ch = getc(f_)) != EOF && ch != '\n') {}
        if (ch == '\n') ++line_;
    }

    // Parses a decimal integer token. Returns false if tok isn't one.
    bool to_long(const std::string& tok, long long* v) {
        char* end = nullptr;
        errno = 0;
        *v = strtoll(tok.c_str(), &end, 10);
        if (*end != '\0' || errno == ERANGE) {
            return fail("Expected an integer, found '" + tok + "'");
        }
        return true;
    }

    bool to_lit(const std::string& tok, lit_t* l) {
        long long v;
        if (!to_long(tok, &v)) return false;
        if (v < -nvars_ || v > nvars_) {
            std::ostringstream oss;
            oss << "Literal " << v << " exceeds the declared variable count "
                << nvars_;
            return fail(oss.str());
        }
        *l = static_cast<lit_t>(v);
        return true;
    }

    // Skip comment lines until we see the problem line.
    bool read_header() {
        std::string tok;
        while (next_token(&tok) && tok == "c") skip_line();
        if (tok.empty()) return fail("Missing problem line 'p cnf'");
        if (tok != "p") {
            return fail("Expected problem line 'p cnf', found '" + tok + "'");
        }
        if (!next_token(&tok) || tok != "cnf") {
            return fail("Problem line must declare format 'cnf'");
        }
        long long nv = 0, nc = 0;
        if (!next_token(&tok)) return fail("Missing variable count");
        if (!to_long(tok, &nv)) return false;
        if (!next_token(&tok)) return fail("Missing clause count");
        if (!to_long(tok, &nc)) return false;
        if (nv < 0) return fail("Variable count must be non-negative.");
        if (nc < 0) return fail("Clause count must be non-negative.");
        // The search counts one past the last variable, so keep a spare value.
        if (nv >= lit_max) return fail("Variable count is too large.");
        if (nc > std::numeric_limits<clause_t>::max()) {
            return fail("Clause count is too large.");
        }
        nvars_ = static_cast<lit_t>(nv);
        nclauses_ = static_cast<clause_t>(nc);
        return true;
    }

    // Adds the k-th clause read from the input to f.
    bool install(Formula* f, const std::vector<lit_t>& c, clause_t k) {
        if (c.empty()) {
            LOG(2) << "Empty clause " << k << " in input file, unsatisfiable "
                   << "formula.";
        }
        AddStatus s = f->add_clause(c);
        if (s == OUT_OF_RANGE) {
            std::ostringstream oss;
            oss << "Clause " << k << " has a literal out of range";
            return fail(oss.str());
        }
        return true;
    }

    std::string filename_;
    FILE* f_ = nullptr;
    bool owned_;
    int line_ = 1;
    lit_t nvars_ = 0;
    clause_t nclauses_ = 0;
    std::string error_;
};

#endif  // __PARSE_H__
