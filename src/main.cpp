// ============================================================================
// main.cpp — Entry point for the tabsat tool
// ============================================================================
//
// Exit codes: 0 when every formula was decided, 1 when a formula could not
// be parsed or verified (or the self-tests failed), 2 for a usage error.
//
// ============================================================================

#include "tabsat/cli.hpp"

#include <iostream>
#include <stdexcept>

namespace {

constexpr int kExitUsage = 2;

}  // namespace

int main(int argc, char* argv[]) {
    const char* program = argc > 0 ? argv[0] : "tabsat";

    tabsat::Options opts;
    try {
        opts = tabsat::parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        tabsat::print_usage(program);
        return kExitUsage;
    }

    if (opts.help) {
        tabsat::print_usage(program);
        return 0;
    }

    try {
        return tabsat::run(opts);
    } catch (const std::exception& e) {
        // Anything run() did not report per formula, e.g. Z3 failures.
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
