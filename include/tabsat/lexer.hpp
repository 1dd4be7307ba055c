// ============================================================================
// tabsat/lexer.hpp — Tokeniser for the formula language
// ============================================================================
//
// The lexer discards every whitespace character of the raw input first and
// then classifies what is left.  "a b" therefore lexes as the single
// variable "ab", and "< - >" as the biconditional.  Every token still
// carries the position (line, column) of its first character in the raw
// input so that error messages point at the text the user typed.
//
// Recognised tokens:
//   Identifiers  [A-Za-z][A-Za-z0-9]*
//   Symbols      -  ^  |  (  )  ->  <->
//   Invalid      any other single character (including a leading digit and
//                a '<' that does not start "<->")
//   EOF          end-of-input sentinel
//
// The lexer never throws: deciding whether an Invalid token is an
// unexpected character or an unknown operator depends on where the parser
// meets it.
//
// ============================================================================

#ifndef TABSAT_LEXER_HPP
#define TABSAT_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace tabsat {

// ── SourcePos ───────────────────────────────────────────────────────────────
// 1-based line and column, used for error reporting.

struct SourcePos {
    std::uint32_t line   = 1;
    std::uint32_t column = 1;

    bool operator==(const SourcePos& o) const noexcept {
        return line == o.line && column == o.column;
    }
};

// ── TokenKind ───────────────────────────────────────────────────────────────

enum class TokenKind : std::uint8_t {
    Identifier,     // variable name
    Minus,          // -
    Caret,          // ^
    Pipe,           // |
    Arrow,          // ->
    DoubleArrow,    // <->
    LParen,         // (
    RParen,         // )
    Invalid,        // unclassifiable character
    Eof
};

/// Human-readable name for debugging.
const char* token_kind_name(TokenKind k) noexcept;

/// True for the four binary connective tokens.
bool is_binop_token(TokenKind k) noexcept;

// ── Token ───────────────────────────────────────────────────────────────────

struct Token {
    TokenKind   kind = TokenKind::Eof;
    std::string text;
    SourcePos   pos;
};

// ── Lexer ───────────────────────────────────────────────────────────────────
// Produces tokens lazily via next(); one token of lookahead via peek().

class Lexer {
public:
    /// Construct a lexer over the given input.
    /// @param source  the full text to tokenise
    /// @param line    the line number of the first line (default 1)
    explicit Lexer(std::string_view source, std::uint32_t line = 1);

    /// Return the next token.  Repeated calls after EOF keep returning EOF.
    Token next();

    /// Peek at the next token without consuming it.
    const Token& peek();

    /// True if the input held nothing but whitespace.
    bool blank() const noexcept { return text_.empty(); }

private:
    Token read_identifier();
    SourcePos pos_at(std::size_t idx) const noexcept;

    std::string            text_;       // input with whitespace removed
    std::vector<SourcePos> positions_;  // raw position of each text_ char
    SourcePos              end_pos_;    // position just past the input
    std::size_t            idx_ = 0;
    bool                   has_peeked_ = false;
    Token                  peeked_;
};

// ── tokenise ────────────────────────────────────────────────────────────────
// Convenience: tokenise a complete string and return a vector of tokens
// (including the trailing Eof).

std::vector<Token> tokenise(std::string_view source, std::uint32_t line = 1);

}  // namespace tabsat

#endif  // TABSAT_LEXER_HPP
