// ============================================================================
// tabsat/utils.hpp — Formula file reading and output formatting
// ============================================================================

#ifndef TABSAT_UTILS_HPP
#define TABSAT_UTILS_HPP

#include "tabsat/ast.hpp"

#include <cstdint>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace tabsat {

// ── Formula files ───────────────────────────────────────────────────────────
// One formula per line.  '#' starts a comment that runs to the end of the
// line; lines left blank after that are skipped.

struct SourceLine {
    std::uint32_t number = 0;  // 1-based line in the input
    std::string   text;        // comment removed, surrounding blanks trimmed
};

/// Read the formula lines of `in`, keeping their original line numbers.
std::vector<SourceLine> read_formula_lines(std::istream& in);

/// Open `path` and read its formula lines.
/// Throws std::runtime_error if the file cannot be opened.
std::vector<SourceLine> read_formula_file(const std::string& path);

/// Consume a stream completely and return its content.
std::string read_all(std::istream& in);

/// `s` without leading or trailing blanks (space, tab, CR, LF).
std::string_view trim_blanks(std::string_view s) noexcept;

// ── Output ──────────────────────────────────────────────────────────────────

/// One "  name = true|false" line per variable.
std::string format_assignment(const Assignment& a);

}  // namespace tabsat

#endif  // TABSAT_UTILS_HPP
