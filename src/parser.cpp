// ============================================================================
// parser.cpp — Recursive-descent formula parser
// ============================================================================
//
// Implementation notes
// --------------------
//
//   parse()           calls parse_formula() and then expects Eof.
//   parse_formula()   dispatches on the lookahead: identifier, '-' or '('.
//   parse_binary()    handles '(' formula binop formula ')'.
//   parse_binop()     classifies the connective between the operands.
//
// Error classification depends on where a bad token is met:
//
//   formula slot, Eof, inside '('   UnterminatedExpression
//   formula slot, Eof, top level    UnexpectedEndOfInput
//   formula slot, binop             EmptyVariableName (operand missing)
//   formula slot, anything else     UnexpectedCharacter
//   operator slot, Eof              UnterminatedExpression
//   operator slot, non-binop        UnknownOperator
//   closing slot, Eof               UnterminatedExpression
//   closing slot, anything else     UnexpectedCharacter
//   after the formula               TrailingInput
//
// ============================================================================

#include "tabsat/parser.hpp"

#include <cstddef>
#include <utility>

namespace tabsat {

// ── parse_error_kind_name ───────────────────────────────────────────────────

const char* parse_error_kind_name(ParseErrorKind k) noexcept {
    switch (k) {
        case ParseErrorKind::UnexpectedCharacter:    return "UnexpectedCharacter";
        case ParseErrorKind::UnterminatedExpression: return "UnterminatedExpression";
        case ParseErrorKind::UnknownOperator:        return "UnknownOperator";
        case ParseErrorKind::EmptyVariableName:      return "EmptyVariableName";
        case ParseErrorKind::TrailingInput:          return "TrailingInput";
        case ParseErrorKind::UnexpectedEndOfInput:   return "UnexpectedEndOfInput";
    }
    return "?";
}

// ── ParseError ──────────────────────────────────────────────────────────────

ParseError::ParseError(ParseErrorKind kind, SourcePos pos, const std::string& msg)
    : std::runtime_error(std::to_string(pos.line) + ": ERROR: " + msg +
                         " at column " + std::to_string(pos.column)),
      kind_(kind), pos_(pos), detail_(msg) {}

// ── Constructor ─────────────────────────────────────────────────────────────

Parser::Parser(Lexer& lexer) : lex_(lexer) {}

// ── Error helpers ───────────────────────────────────────────────────────────

void Parser::error(ParseErrorKind kind, const Token& tok, const std::string& msg) {
    throw ParseError(kind, tok.pos, msg);
}

// ── parse ───────────────────────────────────────────────────────────────────
// Entry point: parse one formula then require end-of-input.

Formula Parser::parse() {
    if (lex_.blank()) {
        error(ParseErrorKind::UnexpectedEndOfInput, lex_.peek(), "empty formula");
    }
    Formula f = parse_formula();
    const Token& t = lex_.peek();
    if (t.kind != TokenKind::Eof) {
        error(ParseErrorKind::TrailingInput, t,
              "unexpected '" + t.text + "' after formula");
    }
    return f;
}

// ── parse_formula ───────────────────────────────────────────────────────────
// formula ::= variable | '-' formula | '(' formula binop formula ')'
//
// A run of '-' is counted in a loop and wrapped afterwards, so negation
// chains cost no stack.  Only parentheses recurse.

Formula Parser::parse_formula() {
    std::size_t negations = 0;
    while (lex_.peek().kind == TokenKind::Minus) {
        lex_.next();
        ++negations;
    }

    Formula f = parse_operand();
    for (; negations > 0; --negations) {
        f = Formula::negation(std::move(f));
    }
    return f;
}

// ── parse_operand ───────────────────────────────────────────────────────────
// A variable or a parenthesised binary formula.

Formula Parser::parse_operand() {
    const Token& t = lex_.peek();

    switch (t.kind) {
        case TokenKind::Identifier:
            return parse_variable();
        case TokenKind::LParen:
            return parse_binary();
        case TokenKind::Eof:
            if (depth_ > 0) {
                error(ParseErrorKind::UnterminatedExpression, t,
                      "missing operand and ')' before end of input");
            }
            error(ParseErrorKind::UnexpectedEndOfInput, t,
                  "expected a formula, got end of input");
        case TokenKind::Caret:
        case TokenKind::Pipe:
        case TokenKind::Arrow:
        case TokenKind::DoubleArrow:
            error(ParseErrorKind::EmptyVariableName, t,
                  "missing operand before '" + t.text + "'");
        case TokenKind::Minus:
        case TokenKind::RParen:
        case TokenKind::Invalid:
            break;
    }
    error(ParseErrorKind::UnexpectedCharacter, t,
          "unexpected character '" + t.text + "'");
}

// ── parse_variable ──────────────────────────────────────────────────────────

Formula Parser::parse_variable() {
    Token t = lex_.next();
    return Formula::var(std::move(t.text));
}

// ── parse_binary ────────────────────────────────────────────────────────────
// '(' formula binop formula ')'

Formula Parser::parse_binary() {
    lex_.next();  // consume '('
    ++depth_;
    Formula lhs = parse_formula();
    NodeKind op = parse_binop();
    Formula rhs = parse_formula();

    Token close = lex_.next();
    if (close.kind == TokenKind::Eof) {
        error(ParseErrorKind::UnterminatedExpression, close,
              "missing ')' before end of input");
    }
    if (close.kind != TokenKind::RParen) {
        error(ParseErrorKind::UnexpectedCharacter, close,
              "expected ')', got '" + close.text + "'");
    }
    --depth_;
    return Formula::binary(op, std::move(lhs), std::move(rhs));
}

// ── parse_binop ─────────────────────────────────────────────────────────────
// The lexer already applied longest match ("<->" before "->"); any other
// token in this slot is rejected rather than reinterpreted.

NodeKind Parser::parse_binop() {
    Token t = lex_.next();
    switch (t.kind) {
        case TokenKind::Caret:       return NodeKind::And;
        case TokenKind::Pipe:        return NodeKind::Or;
        case TokenKind::Arrow:       return NodeKind::Implies;
        case TokenKind::DoubleArrow: return NodeKind::Iff;
        case TokenKind::Eof:
            error(ParseErrorKind::UnterminatedExpression, t,
                  "missing operator and ')' before end of input");
        case TokenKind::Identifier:
        case TokenKind::Minus:
        case TokenKind::LParen:
        case TokenKind::RParen:
        case TokenKind::Invalid:
            break;
    }
    error(ParseErrorKind::UnknownOperator, t,
          "unknown operator '" + t.text + "'");
}

// ── parse_formula (free function) ───────────────────────────────────────────

Formula parse_formula(const std::string& input, std::uint32_t line) {
    Lexer lex(input, line);
    Parser parser(lex);
    return parser.parse();
}

}  // namespace tabsat
