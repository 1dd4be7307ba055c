// ============================================================================
// lexer.cpp — Formula tokeniser implementation
// ============================================================================

#include "tabsat/lexer.hpp"

#include <cctype>

namespace tabsat {

// ── token_kind_name ─────────────────────────────────────────────────────────

const char* token_kind_name(TokenKind k) noexcept {
    switch (k) {
        case TokenKind::Identifier:   return "identifier";
        case TokenKind::Minus:        return "-";
        case TokenKind::Caret:        return "^";
        case TokenKind::Pipe:         return "|";
        case TokenKind::Arrow:        return "->";
        case TokenKind::DoubleArrow:  return "<->";
        case TokenKind::LParen:       return "(";
        case TokenKind::RParen:       return ")";
        case TokenKind::Invalid:      return "invalid";
        case TokenKind::Eof:          return "EOF";
    }
    return "?";
}

bool is_binop_token(TokenKind k) noexcept {
    return k == TokenKind::Caret || k == TokenKind::Pipe ||
           k == TokenKind::Arrow || k == TokenKind::DoubleArrow;
}

// ── Lexer ───────────────────────────────────────────────────────────────────
// Whitespace is dropped up front; positions_ remembers where each kept
// character sat in the raw input.

Lexer::Lexer(std::string_view source, std::uint32_t line) {
    SourcePos pos{line, 1};
    text_.reserve(source.size());
    positions_.reserve(source.size());
    for (char c : source) {
        if (c == '\n') {
            ++pos.line;
            pos.column = 1;
            continue;
        }
        if (!std::isspace(static_cast<unsigned char>(c))) {
            text_.push_back(c);
            positions_.push_back(pos);
        }
        ++pos.column;
    }
    end_pos_ = pos;
}

SourcePos Lexer::pos_at(std::size_t idx) const noexcept {
    return idx < positions_.size() ? positions_[idx] : end_pos_;
}

// ── read_identifier ─────────────────────────────────────────────────────────
// Read [A-Za-z][A-Za-z0-9]*.

Token Lexer::read_identifier() {
    SourcePos start = pos_at(idx_);
    std::size_t begin = idx_;

    while (idx_ < text_.size() &&
           std::isalnum(static_cast<unsigned char>(text_[idx_]))) {
        ++idx_;
    }

    return Token{TokenKind::Identifier, text_.substr(begin, idx_ - begin), start};
}

// ── next ────────────────────────────────────────────────────────────────────

Token Lexer::next() {
    // If we already peeked, return the stored token.
    if (has_peeked_) {
        has_peeked_ = false;
        return std::move(peeked_);
    }

    if (idx_ >= text_.size()) {
        return Token{TokenKind::Eof, "", end_pos_};
    }

    SourcePos start = pos_at(idx_);
    char c = text_[idx_];

    // ── single-character tokens ─────────────────────────────────────────
    if (c == '^') { ++idx_; return Token{TokenKind::Caret,  "^", start}; }
    if (c == '|') { ++idx_; return Token{TokenKind::Pipe,   "|", start}; }
    if (c == '(') { ++idx_; return Token{TokenKind::LParen, "(", start}; }
    if (c == ')') { ++idx_; return Token{TokenKind::RParen, ")", start}; }

    // ── multi-character operators ───────────────────────────────────────
    // <-> is the only token starting with '<'; a lone "<" or "<-" is an
    // invalid token rather than a guess at what was meant.
    if (c == '<') {
        if (idx_ + 2 < text_.size() && text_[idx_ + 1] == '-' &&
            text_[idx_ + 2] == '>') {
            idx_ += 3;
            return Token{TokenKind::DoubleArrow, "<->", start};
        }
        ++idx_;
        return Token{TokenKind::Invalid, "<", start};
    }

    // '-' followed by '>' is always the implication arrow.
    if (c == '-') {
        if (idx_ + 1 < text_.size() && text_[idx_ + 1] == '>') {
            idx_ += 2;
            return Token{TokenKind::Arrow, "->", start};
        }
        ++idx_;
        return Token{TokenKind::Minus, "-", start};
    }

    // ── identifiers ─────────────────────────────────────────────────────
    if (std::isalpha(static_cast<unsigned char>(c))) {
        return read_identifier();
    }

    ++idx_;
    return Token{TokenKind::Invalid, std::string(1, c), start};
}

// ── peek ────────────────────────────────────────────────────────────────────

const Token& Lexer::peek() {
    if (!has_peeked_) {
        peeked_ = next();
        has_peeked_ = true;
    }
    return peeked_;
}

// ── tokenise (convenience) ──────────────────────────────────────────────────

std::vector<Token> tokenise(std::string_view source, std::uint32_t line) {
    Lexer lex(source, line);
    std::vector<Token> toks;
    for (;;) {
        Token t = lex.next();
        toks.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return toks;
}

}  // namespace tabsat
