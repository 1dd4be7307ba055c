// ============================================================================
// cli.cpp — Command-line interface and main driver
// ============================================================================

#include "tabsat/cli.hpp"
#include "tabsat/ast.hpp"
#include "tabsat/parser.hpp"
#include "tabsat/tableau.hpp"
#include "tabsat/test.hpp"
#include "tabsat/utils.hpp"
#include "tabsat/z3_solver.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabsat {

// ── parse_args ──────────────────────────────────────────────────────────────

Options parse_args(int argc, char* argv[]) {
    Options opts;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done) {
            // Everything after "--" is input.
        } else if (arg == "--") {
            options_done = true;
            continue;
        } else if (arg == "--selftest") {
            opts.selftest = true;
            continue;
        } else if (arg == "--formula" || arg == "-f") {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires a formula argument");
            }
            if (opts.formula) {
                throw std::runtime_error(arg + " given more than once");
            }
            opts.formula = argv[++i];
            continue;
        } else if (arg == "--model") {
            opts.show_model = true;
            continue;
        } else if (arg == "--stats") {
            opts.show_stats = true;
            continue;
        } else if (arg == "--tree") {
            opts.show_tree = true;
            continue;
        } else if (arg == "--dot") {
            opts.show_dot = true;
            continue;
        } else if (arg == "--valid") {
            opts.validity = true;
            continue;
        } else if (arg == "--classify") {
            opts.classify = true;
            continue;
        } else if (arg == "--verify") {
            opts.verify = true;
            continue;
        } else if (arg == "--debug") {
            opts.debug = true;
            continue;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
            continue;
        } else if (arg.starts_with("--")) {
            throw std::runtime_error("unknown option: " + arg + " (use -- before a formula)");
        }

        if (opts.input) {
            throw std::runtime_error("multiple inputs not supported");
        }
        opts.input = std::move(arg);
    }

    if (opts.formula && opts.input) {
        throw std::runtime_error("--formula cannot be combined with another input");
    }
    if (opts.validity && opts.classify) {
        throw std::runtime_error("--valid and --classify are mutually exclusive");
    }

    return opts;
}

// ── print_usage ─────────────────────────────────────────────────────────────

void print_usage(const char* program_name) {
    std::cerr
        << "Usage: " << program_name << " [OPTIONS] [<formula> | <input.txt>]\n"
        << "       " << program_name << " [OPTIONS] --formula <formula>\n"
        << "       " << program_name << " [OPTIONS] -- <formula>\n"
        << "       " << program_name << " --selftest\n"
        << "\n"
        << "Propositional satisfiability checker (semantic tableaux).\n"
        << "With no input, the whole of standard input is read as one formula.\n"
        << "\n"
        << "Options:\n"
        << "  --formula, -f <f>  Formula to decide\n"
        << "  <input.txt>   File with one formula per line\n"
        << "  --model       Print the satisfying assignment (counter-model with --valid)\n"
        << "  --valid       Decide validity instead of satisfiability\n"
        << "  --classify    Print TAUTOLOGY, CONTINGENT or CONTRADICTION\n"
        << "  --verify      Cross-check every verdict with Z3\n"
        << "  --tree        Print the complete tableau as indented text\n"
        << "  --dot         Print the complete tableau in Graphviz format\n"
        << "  --stats       Show engine statistics\n"
        << "  --debug       Trace every rule application on stderr\n"
        << "  --selftest    Run built-in tests\n"
        << "  --help, -h    Show this message\n"
        << "  --            End of options; the next argument is the input\n"
        << "\n"
        << "Grammar:\n"
        << "  formula ::= variable | -formula | (formula op formula)\n"
        << "  op      ::= ^ | '|' | -> | <->\n"
        << "\n"
        << "Input file format:\n"
        << "  - One formula per line\n"
        << "  - Empty lines and lines starting with # are ignored\n"
        << "  - Inline comments: everything after # is ignored\n";
}

// ── Input collection ────────────────────────────────────────────────────────

namespace {

struct InputFormula {
    std::uint32_t line;
    std::string   text;
    bool          numbered;  // print "<line>: " before the verdict
};

std::vector<InputFormula> collect_inputs(const Options& opts) {
    std::vector<InputFormula> formulas;

    if (opts.formula) {
        formulas.push_back({1, *opts.formula, false});
    } else if (opts.input && opts.input->ends_with(".txt")) {
        for (SourceLine& line : read_formula_file(*opts.input)) {
            formulas.push_back({line.number, std::move(line.text), true});
        }
    } else if (opts.input) {
        formulas.push_back({1, *opts.input, false});
    } else {
        formulas.push_back({1, read_all(std::cin), false});
    }
    return formulas;
}

// Print the verdict lines for one formula.  Returns false if --verify found
// a disagreement.
bool decide(const Options& opts, const Formula& formula, FormulaId id,
            TableauEngine& engine, const std::string& prefix) {
    if (opts.classify) {
        Classification c = engine.classify(id);
        std::cout << prefix << classification_to_string(c) << "\n";
        if (opts.verify) {
            std::optional<Classification> z3 = z3_classify(formula);
            if (!z3 || *z3 != c) {
                std::cerr << "ERROR: verification failed: Z3 classifies the formula as "
                          << (z3 ? classification_to_string(*z3) : "UNKNOWN") << "\n";
                return false;
            }
        }
        return true;
    }

    if (opts.validity) {
        Result r = engine.falsify(id);
        std::cout << prefix << (r == Result::Unsatisfiable ? "VALID" : "INVALID") << "\n";
        if (opts.show_model && r == Result::Satisfiable) {
            std::cout << "  counter-model:\n" << format_assignment(r.model);
        }
        if (opts.verify) {
            if (auto diff = verify_result(Formula::negation(formula), r)) {
                std::cerr << "ERROR: verification failed: " << *diff << "\n";
                return false;
            }
        }
        return true;
    }

    Result r = engine.check(id);
    std::cout << prefix << result_to_string(r) << "\n";
    if (opts.show_model && r == Result::Satisfiable) {
        std::cout << format_assignment(r.model);
    }
    if (opts.verify) {
        if (auto diff = verify_result(formula, r)) {
            std::cerr << "ERROR: verification failed: " << *diff << "\n";
            return false;
        }
    }
    return true;
}

}  // namespace

// ── run ─────────────────────────────────────────────────────────────────────
// Main driver loop.  Reads the input, decides each formula, prints results.

int run(const Options& opts) {
    // ── Handle --selftest ───────────────────────────────────────────────
    if (opts.selftest) {
        return run_selftests();
    }

    std::vector<InputFormula> formulas;
    try {
        formulas = collect_inputs(opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    // ── Process each formula ────────────────────────────────────────────
    FormulaFactory factory;
    TableauEngine engine(factory);
    engine.set_trace(opts.debug);
    engine.set_complete(opts.show_tree || opts.show_dot);
    bool had_errors = false;

    for (const InputFormula& in : formulas) {
        const std::string prefix =
            in.numbered ? std::to_string(in.line) + ": " : std::string();

        try {
            Formula formula = parse_formula(in.text, in.line);
            if (opts.debug) {
                std::cerr << "[tabsat] parsed " << formula.to_string() << "\n";
            }
            FormulaId id = factory.intern(formula);

            if (!decide(opts, formula, id, engine, prefix)) {
                had_errors = true;
            }

            if (opts.show_stats) {
                std::cout << "  Stats: " << engine.stats() << "\n";
            }
            if (opts.show_tree) {
                std::cout << engine.tree_string();
            }
            if (opts.show_dot) {
                std::cout << engine.to_dot();
            }
        } catch (const ParseError& e) {
            // Messages already include line/column.
            std::cerr << e.what() << "\n";
            had_errors = true;
        }
    }

    return had_errors ? 1 : 0;
}

}  // namespace tabsat
