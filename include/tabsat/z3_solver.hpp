// ============================================================================
// tabsat/z3_solver.hpp — Z3 wrapper used as an independent oracle
// ============================================================================
//
// This module encodes propositional formulas into Z3 boolean expressions
// and lets Z3 decide them.  The tableau engine never calls it: it exists to
// cross-check tableau verdicts (`--verify`) and to serve as an oracle in
// the self-tests.
//
// Usage:
//   Z3Checker checker;
//   checker.add_formula(f);
//   if (checker.check() == Z3Result::SAT) {
//       Assignment m = checker.get_model(f.variables());
//   }
//
// ============================================================================

#ifndef TABSAT_Z3_SOLVER_HPP
#define TABSAT_Z3_SOLVER_HPP

#include "tabsat/ast.hpp"
#include "tabsat/tableau.hpp"

#include <z3++.h>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>

namespace tabsat {

// ── Z3Result ────────────────────────────────────────────────────────────────

enum class Z3Result {
    SAT,
    UNSAT,
    UNKNOWN
};

const char* z3_result_to_string(Z3Result r) noexcept;

// ── Z3Checker ───────────────────────────────────────────────────────────────
// Maintains a Z3 context and solver.  Assertions are added incrementally,
// and check() determines satisfiability of their conjunction.

class Z3Checker {
public:
    Z3Checker();

    /// Assert a formula.
    void add_formula(const Formula& formula);

    /// Assert that the named variable has the given value.
    void add_literal(const std::string& name, bool value);

    /// Check satisfiability of everything asserted so far.
    Z3Result check();

    /// Reset the solver to empty state.
    void reset();

    /// Values of `vars` in the model of the last SAT check.  Variables the
    /// model leaves unconstrained are reported as false.  Throws
    /// std::runtime_error if the assertions are not satisfiable.
    Assignment get_model(const std::set<std::string>& vars);

private:
    // Convert a Formula to a Z3 boolean expression.
    z3::expr to_z3(const Formula& formula);

    // Get or create a Z3 boolean variable for the given name.
    z3::expr get_bool_var(const std::string& name);

    z3::context ctx_;
    z3::solver  solver_;

    // z3::expr has no default constructor, hence the indirection.
    std::unordered_map<std::string, std::unique_ptr<z3::expr>> bool_vars_;
};

// ── verify_result ───────────────────────────────────────────────────────────
// Compare a tableau verdict for `formula` against Z3.  For a satisfiable
// verdict the tableau's model is also evaluated on the formula.  Returns a
// description of the disagreement, or std::nullopt if both agree.

std::optional<std::string> verify_result(const Formula& formula, const Result& result);

// ── z3_classify ─────────────────────────────────────────────────────────────
// Classification of `formula` computed by Z3 alone (satisfiability of the
// formula and of its negation).  std::nullopt if Z3 answers UNKNOWN.

std::optional<Classification> z3_classify(const Formula& formula);

}  // namespace tabsat

#endif  // TABSAT_Z3_SOLVER_HPP
