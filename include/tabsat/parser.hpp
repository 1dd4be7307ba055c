// ============================================================================
// tabsat/parser.hpp — Recursive-descent parser for propositional formulas
// ============================================================================
//
// Grammar (after whitespace removal):
//
//   formula   ::= variable
//               | '-' formula
//               | '(' formula binop formula ')'
//   variable  ::= [A-Za-z][A-Za-z0-9]*
//   binop     ::= '^' | '|' | '->' | '<->'
//
// Every binary connective carries its own pair of parentheses, so there is
// no precedence to resolve and one token of lookahead decides every step.
//
// ============================================================================

#ifndef TABSAT_PARSER_HPP
#define TABSAT_PARSER_HPP

#include "tabsat/ast.hpp"
#include "tabsat/lexer.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace tabsat {

// ── ParseErrorKind ──────────────────────────────────────────────────────────

enum class ParseErrorKind : std::uint8_t {
    UnexpectedCharacter,     // a formula cannot start here
    UnterminatedExpression,  // input ended inside '(' ... ')'
    UnknownOperator,         // not one of ^ | -> <->
    EmptyVariableName,       // an operand is missing before an operator
    TrailingInput,           // text left after a complete formula
    UnexpectedEndOfInput     // input ended where a top-level formula was required
};

const char* parse_error_kind_name(ParseErrorKind k) noexcept;

// ── ParseError ──────────────────────────────────────────────────────────────
// what() follows the format: <line>: ERROR: <msg> at column <n>

class ParseError : public std::runtime_error {
public:
    ParseError(ParseErrorKind kind, SourcePos pos, const std::string& msg);

    ParseErrorKind     kind() const noexcept { return kind_; }
    const SourcePos&   pos() const noexcept { return pos_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    ParseErrorKind kind_;
    SourcePos      pos_;
    std::string    detail_;
};

// ── Parser ──────────────────────────────────────────────────────────────────
// Parses exactly one formula from a Lexer.  Throws ParseError on any
// syntax error; no partial result is ever returned.

class Parser {
public:
    explicit Parser(Lexer& lexer);

    /// Parse a complete formula (expects Eof after).
    Formula parse();

    /// Parse one formula without requiring Eof.
    Formula parse_formula();

private:
    Formula parse_operand();
    Formula parse_variable();
    Formula parse_binary();
    NodeKind parse_binop();

    [[noreturn]] void error(ParseErrorKind kind, const Token& tok,
                            const std::string& msg);

    Lexer&        lex_;
    std::uint32_t depth_ = 0;  // open '(' not yet closed
};

// ── Convenience free function ───────────────────────────────────────────────
// Parse a single formula from a string.

Formula parse_formula(const std::string& input, std::uint32_t line = 1);

}  // namespace tabsat

#endif  // TABSAT_PARSER_HPP
