// ============================================================================
// tabsat/cli.hpp — Command-line interface handling
// ============================================================================
//
// Parses argv into a structured Options object and provides the main
// driver loop: read input → parse → run tableau → print verdict.
//
// ============================================================================

#ifndef TABSAT_CLI_HPP
#define TABSAT_CLI_HPP

#include <optional>
#include <string>

namespace tabsat {

// ── Options ─────────────────────────────────────────────────────────────────

struct Options {
    std::optional<std::string> input;    // formula or path to a .txt file
    std::optional<std::string> formula;  // from --formula / -f
    bool        selftest   = false;
    bool        show_model = false;
    bool        show_stats = false;
    bool        show_tree  = false;
    bool        show_dot   = false;
    bool        validity   = false;  // decide validity instead of satisfiability
    bool        classify   = false;
    bool        verify     = false;  // cross-check verdicts with Z3
    bool        debug      = false;
    bool        help       = false;
};

/// Parse command-line arguments.  "--" ends option parsing, so a formula
/// that looks like an option can still be given positionally.
/// Throws std::runtime_error on bad usage.
Options parse_args(int argc, char* argv[]);

/// Print usage information to stderr.
void print_usage(const char* program_name);

/// Main driver: read input, process formulas, print results.
/// Returns the process exit code (0 = ok, 1 = errors encountered).
int run(const Options& opts);

}  // namespace tabsat

#endif  // TABSAT_CLI_HPP
