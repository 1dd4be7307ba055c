// ============================================================================
// z3_solver.cpp — Implementation of the Z3 oracle
// ============================================================================

#include "tabsat/z3_solver.hpp"

#include <stdexcept>

namespace tabsat {

const char* z3_result_to_string(Z3Result r) noexcept {
    switch (r) {
        case Z3Result::SAT:     return "SAT";
        case Z3Result::UNSAT:   return "UNSAT";
        case Z3Result::UNKNOWN: return "UNKNOWN";
    }
    return "?";
}

// ── Z3Checker ───────────────────────────────────────────────────────────────

Z3Checker::Z3Checker()
    : ctx_(), solver_(ctx_) {}

void Z3Checker::reset() {
    solver_.reset();
    bool_vars_.clear();
}

z3::expr Z3Checker::get_bool_var(const std::string& name) {
    auto it = bool_vars_.find(name);
    if (it != bool_vars_.end()) {
        return *it->second;
    }
    auto var = std::make_unique<z3::expr>(ctx_.bool_const(name.c_str()));
    z3::expr result = *var;
    bool_vars_[name] = std::move(var);
    return result;
}

z3::expr Z3Checker::to_z3(const Formula& formula) {
    switch (formula.kind()) {
        case NodeKind::Var:
            return get_bool_var(formula.name());

        case NodeKind::Not:
            return !to_z3(formula.operand());

        case NodeKind::And: {
            z3::expr lhs = to_z3(formula.lhs());
            z3::expr rhs = to_z3(formula.rhs());
            return lhs && rhs;
        }

        case NodeKind::Or: {
            z3::expr lhs = to_z3(formula.lhs());
            z3::expr rhs = to_z3(formula.rhs());
            return lhs || rhs;
        }

        case NodeKind::Implies: {
            z3::expr lhs = to_z3(formula.lhs());
            z3::expr rhs = to_z3(formula.rhs());
            return z3::implies(lhs, rhs);
        }

        case NodeKind::Iff: {
            z3::expr lhs = to_z3(formula.lhs());
            z3::expr rhs = to_z3(formula.rhs());
            return lhs == rhs;
        }
    }

    throw std::runtime_error("to_z3: unhandled node kind " +
                             std::string(node_kind_name(formula.kind())));
}

void Z3Checker::add_formula(const Formula& formula) {
    solver_.add(to_z3(formula));
}

void Z3Checker::add_literal(const std::string& name, bool value) {
    z3::expr var = get_bool_var(name);
    if (value) {
        solver_.add(var);
    } else {
        solver_.add(!var);
    }
}

Z3Result Z3Checker::check() {
    z3::check_result result = solver_.check();

    switch (result) {
        case z3::sat:
            return Z3Result::SAT;
        case z3::unsat:
            return Z3Result::UNSAT;
        case z3::unknown:
            return Z3Result::UNKNOWN;
    }

    return Z3Result::UNKNOWN;
}

Assignment Z3Checker::get_model(const std::set<std::string>& vars) {
    if (solver_.check() != z3::sat) {
        throw std::runtime_error("Z3Checker::get_model: assertions are not satisfiable");
    }

    z3::model model = solver_.get_model();
    Assignment out;
    for (const std::string& name : vars) {
        z3::expr value = model.eval(get_bool_var(name), true);
        out[name] = value.is_true();
    }
    return out;
}

// ── verify_result ───────────────────────────────────────────────────────────

std::optional<std::string> verify_result(const Formula& formula, const Result& result) {
    Z3Checker checker;
    checker.add_formula(formula);
    Z3Result z3 = checker.check();

    if (z3 == Z3Result::UNKNOWN) {
        return std::string("Z3 returned UNKNOWN");
    }

    const bool tableau_sat = (result == Result::Satisfiable);
    const bool z3_sat = (z3 == Z3Result::SAT);
    if (tableau_sat != z3_sat) {
        return std::string("tableau says ") + result_to_string(result) +
               ", Z3 says " + z3_result_to_string(z3);
    }

    if (tableau_sat && !formula.evaluate(result.model)) {
        return std::string("tableau model does not satisfy the formula");
    }
    return std::nullopt;
}

// ── z3_classify ─────────────────────────────────────────────────────────────

std::optional<Classification> z3_classify(const Formula& formula) {
    Z3Checker positive;
    positive.add_formula(formula);
    Z3Result sat = positive.check();

    Z3Checker negative;
    negative.add_formula(Formula::negation(formula));
    Z3Result falsifiable = negative.check();

    if (sat == Z3Result::UNKNOWN || falsifiable == Z3Result::UNKNOWN) {
        return std::nullopt;
    }
    if (sat == Z3Result::UNSAT) return Classification::Contradiction;
    if (falsifiable == Z3Result::UNSAT) return Classification::Tautology;
    return Classification::Contingent;
}

}  // namespace tabsat
