// ============================================================================
// utils.cpp — Formula file reading and output formatting
// ============================================================================

#include "tabsat/utils.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace tabsat {

namespace {

constexpr std::string_view kBlanks = " \t\r\n";

}  // namespace

// ── trim_blanks ─────────────────────────────────────────────────────────────

std::string_view trim_blanks(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(kBlanks);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(kBlanks);
    return s.substr(first, last - first + 1);
}

// ── read_formula_lines ──────────────────────────────────────────────────────

std::vector<SourceLine> read_formula_lines(std::istream& in) {
    std::vector<SourceLine> out;
    std::string raw;
    std::uint32_t number = 0;

    while (std::getline(in, raw)) {
        ++number;
        std::string_view text(raw);
        text = trim_blanks(text.substr(0, text.find('#')));
        if (text.empty()) continue;
        out.push_back({number, std::string(text)});
    }
    return out;
}

std::vector<SourceLine> read_formula_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("cannot open file: " + path);
    }
    return read_formula_lines(file);
}

// ── read_all ────────────────────────────────────────────────────────────────

std::string read_all(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

// ── format_assignment ───────────────────────────────────────────────────────

std::string format_assignment(const Assignment& a) {
    std::string out;
    for (const auto& [name, value] : a) {
        out += "  " + name + " = " + (value ? "true" : "false") + "\n";
    }
    return out;
}

}  // namespace tabsat
