// ============================================================================
// test.cpp — Self-test suite for the tabsat satisfiability tool
// ============================================================================
//
// Contains tests covering:
//   - Lexer tokenisation (whitespace removal, positions, arrow tokens)
//   - Parser correctness and every syntax error kind with its position
//   - Formula values and interning, including million-level nesting
//   - The expansion rule table and branch closure
//   - Tableau verdicts, models, validity and classification
//   - Creation-order model choice and branch release
//   - Tree / Graphviz rendering and statistics
//   - Deep nesting and pigeonhole instances
//   - A seeded random corpus checked against truth tables and Z3
//   - Utilities and command-line parsing
//
// ============================================================================

#include "tabsat/test.hpp"
#include "tabsat/ast.hpp"
#include "tabsat/cli.hpp"
#include "tabsat/lexer.hpp"
#include "tabsat/parser.hpp"
#include "tabsat/tableau.hpp"
#include "tabsat/utils.hpp"
#include "tabsat/z3_solver.hpp"

#include <cstdint>
#include <iostream>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace tabsat {

// ── TestContext ──────────────────────────────────────────────────────────────

void TestContext::check(bool condition, const std::string& description) {
    ++total_;
    if (!condition) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n";
    }
}

void TestContext::check_eq(const std::string& actual,
                           const std::string& expected,
                           const std::string& description) {
    ++total_;
    if (actual != expected) {
        ++failed_;
        std::cerr << "  FAIL: " << description << "\n"
                  << "    expected: " << expected << "\n"
                  << "    actual:   " << actual << "\n";
    }
}

// ── TestRunner ──────────────────────────────────────────────────────────────

void TestRunner::run(const std::string& name, TestFunc func) {
    ++tests_run_;
    TestContext ctx;
    ctx.current_test_ = name;

    std::cerr << "TEST: " << name << "\n";
    try {
        func(ctx);
    } catch (const std::exception& e) {
        std::cerr << "  EXCEPTION: " << e.what() << "\n";
        ++ctx.failed_;
    }

    checks_total_ += ctx.total();
    checks_failed_ += ctx.failed();
    if (ctx.failed() > 0) {
        ++tests_failed_;
    } else {
        std::cerr << "  OK (" << ctx.total() << " checks)\n";
    }
}

int TestRunner::summarise() const {
    std::cerr << "\n=== Test Summary ===\n"
              << "Tests:  " << tests_run_ << " run, "
              << (tests_run_ - tests_failed_) << " passed, "
              << tests_failed_ << " failed\n"
              << "Checks: " << checks_total_ << " total, "
              << (checks_total_ - checks_failed_) << " passed, "
              << checks_failed_ << " failed\n";

    if (tests_failed_ == 0) {
        std::cerr << "ALL TESTS PASSED\n";
        return 0;
    } else {
        std::cerr << "SOME TESTS FAILED\n";
        return 1;
    }
}

// ============================================================================
// Helpers
// ============================================================================

static std::string pp(const std::string& input) {
    return parse_formula(input).to_string();
}

// Kind of the ParseError raised for `input`, or nullopt if it parses.
static std::optional<ParseErrorKind> parse_error_kind(const std::string& input) {
    try {
        parse_formula(input);
        return std::nullopt;
    } catch (const ParseError& e) {
        return e.kind();
    }
}

static ParseError parse_error_of(const std::string& input, std::uint32_t line = 1) {
    try {
        parse_formula(input, line);
    } catch (const ParseError& e) {
        return e;
    }
    throw std::runtime_error("expected a parse error for: " + input);
}

static Result check_sat(const std::string& input) {
    FormulaFactory factory;
    TableauEngine engine(factory);
    return engine.check(factory.intern(parse_formula(input)));
}

static std::string model_string(const Assignment& a) {
    std::string out;
    for (const auto& [name, value] : a) {
        out += name + "=" + (value ? "T" : "F") + " ";
    }
    return out;
}

// True if some assignment over the formula's variables gives it `value`.
static bool brute_force_any(const Formula& f, bool value) {
    const std::set<std::string> vars = f.variables();
    const std::vector<std::string> names(vars.begin(), vars.end());
    for (std::uint32_t mask = 0; mask < (1u << names.size()); ++mask) {
        Assignment a;
        for (std::size_t i = 0; i < names.size(); ++i) {
            a[names[i]] = ((mask >> i) & 1u) != 0;
        }
        if (f.evaluate(a) == value) return true;
    }
    return false;
}

static Classification brute_force_classify(const Formula& f) {
    if (!brute_force_any(f, true)) return Classification::Contradiction;
    if (!brute_force_any(f, false)) return Classification::Tautology;
    return Classification::Contingent;
}

static Formula conjoin(std::vector<Formula> parts) {
    Formula acc = std::move(parts.front());
    for (std::size_t i = 1; i < parts.size(); ++i) {
        acc = Formula::conjunction(std::move(acc), std::move(parts[i]));
    }
    return acc;
}

static Formula disjoin(std::vector<Formula> parts) {
    Formula acc = std::move(parts.front());
    for (std::size_t i = 1; i < parts.size(); ++i) {
        acc = Formula::disjunction(std::move(acc), std::move(parts[i]));
    }
    return acc;
}

// Pigeonhole principle: `pigeons` pigeons into `holes` holes, at most one
// pigeon per hole.  Satisfiable iff pigeons <= holes.
static Formula pigeonhole(int pigeons, int holes) {
    auto in = [](int p, int h) {
        return Formula::var("p" + std::to_string(p) + "h" + std::to_string(h));
    };

    std::vector<Formula> clauses;
    for (int p = 1; p <= pigeons; ++p) {
        std::vector<Formula> somewhere;
        for (int h = 1; h <= holes; ++h) somewhere.push_back(in(p, h));
        clauses.push_back(disjoin(std::move(somewhere)));
    }
    for (int h = 1; h <= holes; ++h) {
        for (int p = 1; p <= pigeons; ++p) {
            for (int q = p + 1; q <= pigeons; ++q) {
                clauses.push_back(Formula::negation(
                    Formula::conjunction(in(p, h), in(q, h))));
            }
        }
    }
    return conjoin(std::move(clauses));
}

static Formula random_formula(std::mt19937& rng, int depth) {
    static const char* const kVars[] = {"p", "q", "r", "s"};
    static const NodeKind kBinary[] = {NodeKind::And, NodeKind::Or,
                                       NodeKind::Implies, NodeKind::Iff};
    std::uniform_int_distribution<int> pick(0, 5);
    std::uniform_int_distribution<int> var(0, 3);

    const int choice = depth == 0 ? 0 : pick(rng);
    if (choice == 0) {
        return Formula::var(kVars[var(rng)]);
    }
    if (choice == 1) {
        return Formula::negation(random_formula(rng, depth - 1));
    }
    Formula lhs = random_formula(rng, depth - 1);
    Formula rhs = random_formula(rng, depth - 1);
    return Formula::binary(kBinary[choice - 2], std::move(lhs), std::move(rhs));
}

// ============================================================================
// Lexer Tests
// ============================================================================

static void test_lexer_symbols(TestContext& ctx) {
    auto toks = tokenise("(a1 ^ -b) | -> <-> )");
    ctx.check(toks.size() == 11, "eleven tokens including EOF");
    ctx.check(toks[0].kind == TokenKind::LParen, "( paren");
    ctx.check(toks[1].kind == TokenKind::Identifier && toks[1].text == "a1", "identifier a1");
    ctx.check(toks[2].kind == TokenKind::Caret, "^ operator");
    ctx.check(toks[3].kind == TokenKind::Minus, "- operator");
    ctx.check(toks[4].kind == TokenKind::Identifier && toks[4].text == "b", "identifier b");
    ctx.check(toks[5].kind == TokenKind::RParen, ") paren");
    ctx.check(toks[6].kind == TokenKind::Pipe, "| operator");
    ctx.check(toks[7].kind == TokenKind::Arrow, "-> operator");
    ctx.check(toks[8].kind == TokenKind::DoubleArrow, "<-> operator");
    ctx.check(toks[9].kind == TokenKind::RParen, ") paren");
    ctx.check(toks[10].kind == TokenKind::Eof, "EOF");
    ctx.check(is_binop_token(TokenKind::DoubleArrow), "<-> is a binop");
    ctx.check(!is_binop_token(TokenKind::Minus), "- is not a binop");
}

static void test_lexer_whitespace(TestContext& ctx) {
    auto toks = tokenise("a b");
    ctx.check(toks.size() == 2, "a b is one token plus EOF");
    ctx.check(toks[0].kind == TokenKind::Identifier && toks[0].text == "ab",
              "whitespace inside a name is dropped");

    auto spaced = tokenise("< - >");
    ctx.check(spaced[0].kind == TokenKind::DoubleArrow, "spaced <-> still lexes");
    ctx.check(spaced[1].kind == TokenKind::Eof, "nothing after spaced <->");

    auto blank = tokenise(" \t\n ");
    ctx.check(blank.size() == 1 && blank[0].kind == TokenKind::Eof, "blank input is EOF");
}

static void test_lexer_positions(TestContext& ctx) {
    auto toks = tokenise("  (x");
    ctx.check(toks[0].pos == SourcePos{1, 3}, "( at column 3");
    ctx.check(toks[1].pos == SourcePos{1, 4}, "x at column 4");
    ctx.check(toks[2].pos == SourcePos{1, 5}, "EOF just past the input");

    auto lines = tokenise("(a\n^b)");
    ctx.check(lines[2].kind == TokenKind::Caret, "^ on second line");
    ctx.check(lines[2].pos == SourcePos{2, 1}, "^ at line 2 column 1");

    auto offset = tokenise("a", 5);
    ctx.check(offset[0].pos.line == 5, "first line number honoured");
}

static void test_lexer_invalid(TestContext& ctx) {
    auto digit = tokenise("1a");
    ctx.check(digit[0].kind == TokenKind::Invalid && digit[0].text == "1",
              "leading digit is invalid");
    ctx.check(digit[1].kind == TokenKind::Identifier && digit[1].text == "a",
              "identifier after digit");

    auto partial = tokenise("<-");
    ctx.check(partial[0].kind == TokenKind::Invalid && partial[0].text == "<",
              "lone < is invalid");
    ctx.check(partial[1].kind == TokenKind::Minus, "- after lone <");

    auto amp = tokenise("&");
    ctx.check(amp[0].kind == TokenKind::Invalid, "& is invalid");
}

// ============================================================================
// Parser Tests
// ============================================================================

static void test_parse_variables(TestContext& ctx) {
    ctx.check_eq(pp("a"), "a", "single variable");
    ctx.check_eq(pp("abc12"), "abc12", "alphanumeric variable");
    ctx.check_eq(pp("Z"), "Z", "upper-case variable");
    ctx.check(parse_formula("a b") == Formula::var("ab"), "spaces are dropped");
    ctx.check(parse_formula("Abc") != parse_formula("abc"), "names are case-sensitive");
}

static void test_parse_connectives(TestContext& ctx) {
    ctx.check(parse_formula("(a^b)") ==
                  Formula::conjunction(Formula::var("a"), Formula::var("b")),
              "conjunction tree");
    ctx.check(parse_formula("-a") == Formula::negation(Formula::var("a")),
              "negation tree");
    ctx.check_eq(pp("(a|b)"), "(a|b)", "disjunction");
    ctx.check_eq(pp("(a->b)"), "(a->b)", "implication");
    ctx.check_eq(pp("(a<->b)"), "(a<->b)", "biconditional");
    ctx.check_eq(pp("--a"), "--a", "double negation kept");
    ctx.check_eq(pp(" ( a -> - b ) "), "(a->-b)", "whitespace anywhere");
    ctx.check_eq(pp("((a^b)->-(c|d))"), "((a^b)->-(c|d))", "nested");
    ctx.check_eq(pp("(-p->p)"), "(-p->p)", "negation before arrow");

    Formula f = parse_formula("((a->b)<->-c)");
    ctx.check(f.kind() == NodeKind::Iff, "root is <->");
    ctx.check(f.lhs().kind() == NodeKind::Implies, "lhs is ->");
    ctx.check(f.rhs().kind() == NodeKind::Not, "rhs is -");
    ctx.check_eq(f.rhs().operand().name(), "c", "negated variable c");
}

static void test_parse_error_kinds(TestContext& ctx) {
    struct ErrorCase {
        const char*    input;
        ParseErrorKind kind;
    };
    const std::vector<ErrorCase> cases = {
        {"(a^b",   ParseErrorKind::UnterminatedExpression},
        {"(a",     ParseErrorKind::UnterminatedExpression},
        {"(a<->b", ParseErrorKind::UnterminatedExpression},
        {"1a",     ParseErrorKind::UnexpectedCharacter},
        {")",      ParseErrorKind::UnexpectedCharacter},
        {"_a",     ParseErrorKind::UnexpectedCharacter},
        {"(a^)",   ParseErrorKind::UnexpectedCharacter},
        {"(a^b^c)", ParseErrorKind::UnexpectedCharacter},
        {"(a&b)",  ParseErrorKind::UnknownOperator},
        {"(a<-b)", ParseErrorKind::UnknownOperator},
        {"(a=>b)", ParseErrorKind::UnknownOperator},
        {"(a-b)",  ParseErrorKind::UnknownOperator},
        {"(a)",    ParseErrorKind::UnknownOperator},
        {"(ab)",   ParseErrorKind::UnknownOperator},
        {"(^b)",   ParseErrorKind::EmptyVariableName},
        {"^",      ParseErrorKind::EmptyVariableName},
        {"a)",     ParseErrorKind::TrailingInput},
        {"(a^b))", ParseErrorKind::TrailingInput},
        {"(a^b)c", ParseErrorKind::TrailingInput},
        {"a^b",    ParseErrorKind::TrailingInput},
        {"",       ParseErrorKind::UnexpectedEndOfInput},
        {"   ",    ParseErrorKind::UnexpectedEndOfInput},
        {"-",      ParseErrorKind::UnexpectedEndOfInput},
        {"(a^",    ParseErrorKind::UnterminatedExpression},
        {"(-",     ParseErrorKind::UnterminatedExpression},
        {"-(",     ParseErrorKind::UnterminatedExpression},
        {"((a^b)^", ParseErrorKind::UnterminatedExpression},
        {"--",     ParseErrorKind::UnexpectedEndOfInput},
    };

    for (const ErrorCase& c : cases) {
        std::optional<ParseErrorKind> got = parse_error_kind(c.input);
        ctx.check(got.has_value() && *got == c.kind,
                  std::string("'") + c.input + "' should fail with " +
                  parse_error_kind_name(c.kind) + ", got " +
                  (got ? parse_error_kind_name(*got) : "no error"));
    }
}

static void test_parse_error_positions(TestContext& ctx) {
    ParseError unterminated = parse_error_of("(a^b");
    ctx.check(unterminated.pos() == SourcePos{1, 5}, "unterminated at end of input");
    ctx.check_eq(unterminated.what(),
                 "1: ERROR: missing ')' before end of input at column 5",
                 "message format");

    ParseError digit = parse_error_of("1a");
    ctx.check(digit.pos() == SourcePos{1, 1}, "digit at column 1");

    ParseError op = parse_error_of("(a & b)");
    ctx.check(op.pos() == SourcePos{1, 4}, "& at raw column 4");
    ctx.check_eq(op.detail(), "unknown operator '&'", "detail text");

    ParseError missing = parse_error_of("(^b)");
    ctx.check(missing.pos() == SourcePos{1, 2}, "missing operand at column 2");

    ParseError trailing = parse_error_of("(a^b)\n)");
    ctx.check(trailing.kind() == ParseErrorKind::TrailingInput, "trailing ) on line 2");
    ctx.check(trailing.pos() == SourcePos{2, 1}, "trailing ) at line 2 column 1");

    ParseError open_operand = parse_error_of("(a^");
    ctx.check(open_operand.pos() == SourcePos{1, 4}, "operand missing at end of input");
    ctx.check_eq(open_operand.detail(), "missing operand and ')' before end of input",
                 "open parenthesis named in the detail");

    ParseError empty = parse_error_of("");
    ctx.check_eq(empty.detail(), "empty formula", "empty input detail");

    ParseError shifted = parse_error_of("(a^b", 7);
    ctx.check(shifted.pos().line == 7, "line offset carried into the error");
    ctx.check_eq(shifted.what(),
                 "7: ERROR: missing ')' before end of input at column 5",
                 "message uses the given line");
}

static void test_parse_round_trip(TestContext& ctx) {
    const std::vector<std::string> inputs = {
        "a", "-a", "--a", "(a^b)", "(a|-b)", "((a->b)<->(b->a))",
        "-(-(p^q)<->(-p|-q))", "(((p|q)|r)^((-p^-q)^-r))",
    };
    for (const std::string& s : inputs) {
        Formula f = parse_formula(s);
        ctx.check(parse_formula(f.to_string()) == f, "round trip " + s);
        ctx.check_eq(f.to_string(), s, "canonical text of " + s);
    }
}

// ============================================================================
// Formula / Factory Tests
// ============================================================================

static void test_formula_values(TestContext& ctx) {
    auto throws_invalid = [](const std::string& name) {
        try {
            Formula::var(name);
        } catch (const std::invalid_argument&) {
            return true;
        }
        return false;
    };
    ctx.check(throws_invalid(""), "empty name rejected");
    ctx.check(throws_invalid("1a"), "leading digit rejected");
    ctx.check(throws_invalid("a_b"), "underscore rejected");
    ctx.check(throws_invalid("a b"), "space rejected");
    ctx.check(is_valid_variable_name("x9"), "x9 is a valid name");

    bool binary_rejected = false;
    try {
        Formula::binary(NodeKind::Not, Formula::var("a"), Formula::var("b"));
    } catch (const std::invalid_argument&) {
        binary_rejected = true;
    }
    ctx.check(binary_rejected, "binary() rejects Not");

    Formula f = parse_formula("((a^b)->-c)");
    Formula g = f;
    ctx.check(g == f, "copy is equal");
    ctx.check(FormulaHash{}(g) == FormulaHash{}(f), "equal formulas hash equal");
    g = Formula::var("z");
    ctx.check_eq(f.to_string(), "((a^b)->-c)", "original survives reassignment of copy");

    ctx.check(f.size() == 6, "six nodes");
    ctx.check(f.variables() == std::set<std::string>{"a", "b", "c"}, "variables a b c");
    ctx.check(f.evaluate({{"a", true}, {"b", true}}), "missing c defaults to false");
    ctx.check(!f.evaluate({{"a", true}, {"b", true}, {"c", true}}), "a b c true falsifies");
    ctx.check(f.evaluate({}), "empty assignment makes premise false");
}

static void test_factory_interning(TestContext& ctx) {
    FormulaFactory fac;
    Formula f = parse_formula("((a^b)|(a^b))");
    FormulaId id = fac.intern(f);
    const FormulaNode& root = fac.node(id);
    ctx.check(root.kind == NodeKind::Or, "root is |");
    ctx.check(root.children[0] == root.children[1], "equal sub-trees share an id");
    ctx.check(fac.size() == 4, "a, b, (a^b), root");

    ctx.check(fac.intern(f) == id, "interning twice yields the same id");
    ctx.check(fac.size() == 4, "no new nodes on re-intern");
    ctx.check(fac.make_and(fac.make_var("a"), fac.make_var("b")) == root.children[0],
              "make_and finds the interned node");
    ctx.check(fac.make_var("a") != fac.make_var("A"), "case-sensitive interning");

    ctx.check_eq(fac.to_string(id), "((a^b)|(a^b))", "factory rendering");
    ctx.check(fac.to_formula(id) == f, "to_formula rebuilds the tree");

    bool out_of_range = false;
    try {
        fac.node(9999);
    } catch (const std::out_of_range&) {
        out_of_range = true;
    }
    ctx.check(out_of_range, "unknown id rejected");
}

// ── Million-level nesting ───────────────────────────────────────────────────
// Building, interning, deciding, copying, comparing, printing and destroying
// must not depend on the call stack.

static void test_formula_deep_values(TestContext& ctx) {
    constexpr std::size_t kDepth = 1000000;

    Formula deep = Formula::var("a");
    for (std::size_t i = 0; i < kDepth; ++i) {
        deep = Formula::negation(std::move(deep));
    }
    ctx.check(deep.size() == kDepth + 1, "a million negations and one variable");
    ctx.check(deep.evaluate({{"a", true}}), "even negation count keeps the value");
    ctx.check(deep.variables() == std::set<std::string>{"a"}, "only a occurs");

    const std::string text = deep.to_string();
    ctx.check(text.size() == kDepth + 1 && text.back() == 'a', "printed without recursion");
    ctx.check(parse_formula(text) == deep, "negation chain parses back");

    {
        Formula copy = deep;
        ctx.check(copy == deep, "deep copy is equal");
        ctx.check(FormulaHash{}(copy) == FormulaHash{}(deep), "deep copy hashes equal");
        copy = Formula::var("b");
        ctx.check(!(copy == deep), "reassigned copy differs");
    }

    FormulaFactory factory;
    FormulaId id = factory.intern(deep);
    ctx.check(factory.size() == kDepth + 1, "one node per level");
    ctx.check(factory.to_formula(id) == deep, "to_formula rebuilds the chain");
    ctx.check(factory.to_string(id) == text, "factory prints the chain");

    TableauEngine engine(factory);
    Result r = engine.check(id);
    ctx.check(r == Result::Satisfiable, "deep chain SAT");
    ctx.check(r.model == Assignment{{"a", true}}, "deep chain model");
    ctx.check(engine.is_valid(id) == false, "deep chain not valid");

    // Left-nested conjunction: every binary walk goes a hundred thousand
    // levels down its left spine.
    Formula spine = Formula::var("x");
    for (int i = 0; i < 100000; ++i) {
        spine = Formula::conjunction(std::move(spine), Formula::var("x"));
    }
    Formula spine_copy = spine;
    ctx.check(spine_copy == spine, "deep binary copy is equal");
    ctx.check(spine.evaluate({{"x", true}}) && !spine.evaluate({}), "deep binary evaluate");
    FormulaId spine_id = factory.intern(spine);
    ctx.check(engine.check(spine_id) == Result::Satisfiable, "deep binary SAT");
    ctx.check(engine.check(factory.make_and(spine_id, factory.make_not(factory.make_var("x")))) ==
                  Result::Unsatisfiable,
              "deep binary with -x UNSAT");

    deep = Formula::var("a");
    ctx.check(deep.size() == 1, "million-level tree released on reassignment");
}

// ============================================================================
// Rule / Branch Tests
// ============================================================================

static void test_expansion_rules(TestContext& ctx) {
    FormulaFactory f;
    const FormulaId a = f.make_var("a");
    const FormulaId b = f.make_var("b");
    using SFs = std::vector<SignedFormula>;
    using K = Expansion::Kind;

    Expansion lit = expand(f, {a, true});
    ctx.check(lit.kind == K::Terminal, "variable is terminal");

    Expansion not_t = expand(f, {f.make_not(a), true});
    ctx.check(not_t.kind == K::Linear && not_t.left == SFs{{a, false}}, "T:-a -> F:a");
    Expansion not_f = expand(f, {f.make_not(a), false});
    ctx.check(not_f.kind == K::Linear && not_f.left == SFs{{a, true}}, "F:-a -> T:a");

    Expansion and_t = expand(f, {f.make_and(a, b), true});
    ctx.check(and_t.kind == K::Linear && and_t.left == SFs{{a, true}, {b, true}},
              "T:^ is linear");
    Expansion and_f = expand(f, {f.make_and(a, b), false});
    ctx.check(and_f.kind == K::Branching && and_f.left == SFs{{a, false}} &&
              and_f.right == SFs{{b, false}}, "F:^ branches");

    Expansion or_t = expand(f, {f.make_or(a, b), true});
    ctx.check(or_t.kind == K::Branching && or_t.left == SFs{{a, true}} &&
              or_t.right == SFs{{b, true}}, "T:| branches");
    Expansion or_f = expand(f, {f.make_or(a, b), false});
    ctx.check(or_f.kind == K::Linear && or_f.left == SFs{{a, false}, {b, false}},
              "F:| is linear");

    Expansion imp_t = expand(f, {f.make_implies(a, b), true});
    ctx.check(imp_t.kind == K::Branching && imp_t.left == SFs{{a, false}} &&
              imp_t.right == SFs{{b, true}}, "T:-> branches");
    Expansion imp_f = expand(f, {f.make_implies(a, b), false});
    ctx.check(imp_f.kind == K::Linear && imp_f.left == SFs{{a, true}, {b, false}},
              "F:-> is linear");

    Expansion iff_t = expand(f, {f.make_iff(a, b), true});
    ctx.check(iff_t.kind == K::Branching &&
              iff_t.left == SFs{{a, true}, {b, true}} &&
              iff_t.right == SFs{{a, false}, {b, false}}, "T:<-> branches on agreement");
    Expansion iff_f = expand(f, {f.make_iff(a, b), false});
    ctx.check(iff_f.kind == K::Branching &&
              iff_f.left == SFs{{a, true}, {b, false}} &&
              iff_f.right == SFs{{a, false}, {b, true}}, "F:<-> branches on disagreement");

    ctx.check_eq(signed_to_string(f, {f.make_and(a, b), false}), "F:(a^b)", "signed text");
}

static void test_branch_closure(TestContext& ctx) {
    FormulaFactory f;
    const FormulaId a = f.make_var("a");
    const FormulaId na = f.make_not(a);

    Branch br;
    ctx.check(br.add(f, {a, true}), "T:a keeps the branch open");
    ctx.check(br.saturated(), "literals are not queued");
    ctx.check(br.add(f, {na, true}), "T:-a queued");
    ctx.check(!br.saturated(), "compound formula pending");
    ctx.check(br.add(f, {a, true}), "duplicate is accepted");
    ctx.check(br.entries().size() == 2, "duplicate not recorded twice");

    std::optional<SignedFormula> next = br.take_pending();
    ctx.check(next.has_value() && *next == SignedFormula{na, true}, "FIFO pending");
    ctx.check(!br.take_pending().has_value(), "pending drained");

    ctx.check(!br.add(f, {a, false}), "F:a closes");
    ctx.check(br.closed(), "branch closed");
    ctx.check(br.conflict() == a, "conflict on a");
    ctx.check(!br.add(f, {f.make_var("b"), true}), "closed branch stays closed");
    ctx.check(br.entries().size() == 3, "nothing added after closure");

    Branch compound;
    const FormulaId x = f.make_and(a, f.make_var("b"));
    compound.add(f, {x, true});
    ctx.check(!compound.add(f, {x, false}), "compound pair closes");
    ctx.check(compound.conflict() == x, "conflict on the compound formula");
    ctx.check(compound.saturated(), "closure clears pending work");
}

// ============================================================================
// Tableau Engine Tests
// ============================================================================

static void test_engine_scenarios(TestContext& ctx) {
    Result conj = check_sat("(a^b)");
    ctx.check(conj == Result::Satisfiable, "(a^b) SAT");
    ctx.check(conj.model == Assignment{{"a", true}, {"b", true}}, "(a^b) model");

    Result neg = check_sat("-a");
    ctx.check(neg == Result::Satisfiable, "-a SAT");
    ctx.check(neg.model == Assignment{{"a", false}}, "-a model");

    Result eq = check_sat("((a->b)^(b->a))");
    ctx.check(eq == Result::Satisfiable, "mutual implication SAT");
    ctx.check(eq.model.at("a") == eq.model.at("b"), "a and b agree");
    ctx.check(eq.model == Assignment{{"a", false}, {"b", false}},
              "model from the first open branch created");

    Result iff = check_sat("(a<->-a)");
    ctx.check(iff == Result::Unsatisfiable, "(a<->-a) UNSAT");
    ctx.check(iff.model.empty(), "no model when UNSAT");

    ctx.check(check_sat("(a^-a)") == Result::Unsatisfiable, "(a^-a) UNSAT");
    ctx.check(check_sat("(a|-a)") == Result::Satisfiable, "(a|-a) SAT");

    Result wide = check_sat("(a|b)");
    ctx.check(wide.model == Assignment{{"a", true}, {"b", false}},
              "unconstrained variable defaults to false");
    ctx.check_eq(result_to_string(wide), "SAT", "SAT text");
    ctx.check_eq(result_to_string(iff), "UNSAT", "UNSAT text");
}

static void test_engine_idempotent(TestContext& ctx) {
    FormulaFactory factory;
    TableauEngine engine(factory);
    FormulaId first = factory.intern(parse_formula("((p|q)^(-p|r))"));
    FormulaId second = factory.intern(parse_formula("(p^-p)"));

    Result a = engine.check(first);
    Result b = engine.check(second);
    Result c = engine.check(first);
    ctx.check(a == Result::Satisfiable && b == Result::Unsatisfiable, "verdicts");
    ctx.check(c == Result::Satisfiable, "same verdict on repeat");
    ctx.check(a.model == c.model, "same model on repeat");
}

static void test_engine_validity(TestContext& ctx) {
    FormulaFactory factory;
    TableauEngine engine(factory);
    auto id = [&](const std::string& s) { return factory.intern(parse_formula(s)); };

    ctx.check(engine.is_valid(id("(((p->q)->p)->p)")), "Peirce's law valid");
    ctx.check(engine.is_valid(id("(p|-p)")), "excluded middle valid");
    ctx.check(!engine.is_valid(id("(p->q)")), "(p->q) not valid");

    Result counter = engine.falsify(id("(p->q)"));
    ctx.check(counter == Result::Satisfiable, "(p->q) falsifiable");
    ctx.check(counter.model == Assignment{{"p", true}, {"q", false}}, "counter-model");

    ctx.check(engine.classify(id("(p|-p)")) == Classification::Tautology, "tautology");
    ctx.check(engine.classify(id("p")) == Classification::Contingent, "contingent");
    ctx.check(engine.classify(id("(p^-p)")) == Classification::Contradiction, "contradiction");
    ctx.check(engine.classify(id("-(p<->p)")) == Classification::Contradiction,
              "negated identity is a contradiction");
    ctx.check_eq(classification_to_string(Classification::Contingent), "CONTINGENT",
                 "classification text");
}

static void test_engine_tree_and_stats(TestContext& ctx) {
    FormulaFactory factory;
    TableauEngine engine(factory);

    engine.check(factory.intern(parse_formula("(a^-a)")));
    ctx.check_eq(engine.tree_string(), "[0] T:(a^-a), T:a, T:-a, F:a  CLOSED\n",
                 "closed single-node tableau");
    const TableauStats& s = engine.statistics();
    ctx.check(s.nodes_created == 1 && s.nodes_closed == 1, "one closed node");
    ctx.check(s.expansions == 2 && s.splits == 0, "two linear expansions");

    FormulaId disj = factory.intern(parse_formula("(a|b)"));
    engine.check(disj);
    ctx.check_eq(engine.tree_string(),
                 "[0] T:(a|b)  split on T:(a|b)\n"
                 "  [1] T:a  OPEN\n"
                 "  [2] T:b  UNEXPLORED\n",
                 "search stops at the first open leaf created");
    ctx.check(engine.statistics().nodes_open == 1, "one open node");

    engine.set_complete(true);
    Result full = engine.check(disj);
    ctx.check(full.model == Assignment{{"a", true}, {"b", false}},
              "complete mode keeps the first model");
    ctx.check_eq(engine.tree_string(),
                 "[0] T:(a|b)  split on T:(a|b)\n"
                 "  [1] T:a  OPEN\n"
                 "  [2] T:b  OPEN\n",
                 "complete tableau");
    const TableauStats& c = engine.statistics();
    ctx.check(c.nodes_created == 3 && c.nodes_open == 2, "three nodes, two open");
    ctx.check(c.splits == 1 && c.max_depth == 1, "one split at depth 1");
    ctx.check(engine.nodes().size() == 3, "nodes exposed");
    ctx.check(engine.nodes()[0]->children.size() == 2, "root has two children");

    const std::string dot = engine.to_dot();
    ctx.check(dot.find("digraph Tableau {") != std::string::npos, "dot header");
    ctx.check(dot.find("n0 -> n1;") != std::string::npos, "edge to left child");
    ctx.check(dot.find("n0 -> n2;") != std::string::npos, "edge to right child");
    ctx.check(engine.stats().find("nodes=3") != std::string::npos, "stats text");
}

// Branches are processed in creation order, so a shallow open leaf created
// early wins over a deeper one on the left.
static void test_engine_creation_order(TestContext& ctx) {
    FormulaFactory factory;
    TableauEngine engine(factory);
    FormulaId id = factory.intern(parse_formula("((x|y)|z)"));

    Result r = engine.check(id);
    ctx.check(r.model == Assignment{{"x", false}, {"y", false}, {"z", true}},
              "z branch was created before x and y");
    ctx.check_eq(engine.tree_string(),
                 "[0] T:((x|y)|z)  split on T:((x|y)|z)\n"
                 "  [1] T:(x|y)  split on T:(x|y)\n"
                 "    [3] T:x  UNEXPLORED\n"
                 "    [4] T:y  UNEXPLORED\n"
                 "  [2] T:z  OPEN\n",
                 "second level never saturated");
    ctx.check(engine.statistics().nodes_created == 5, "five nodes");

    engine.set_complete(true);
    Result full = engine.check(id);
    ctx.check(full.model == r.model, "complete mode reports the same model");
    ctx.check(engine.statistics().nodes_open == 3, "three open leaves");

    // Counter-models follow the same order.
    engine.set_complete(false);
    Result counter = engine.falsify(factory.intern(parse_formula("((-p^-q)^r)")));
    ctx.check(counter.model == Assignment{{"p", false}, {"q", false}, {"r", false}},
              "F:r leaf created before the F:-p leaf");
}

// Decided nodes keep only what the renderers need.
static void test_engine_branch_release(TestContext& ctx) {
    auto all_released = [](const TableauEngine& engine) {
        for (const auto& node : engine.nodes()) {
            if (!node->branch.entries().empty() || !node->branch.saturated()) {
                return false;
            }
        }
        return true;
    };

    std::vector<Formula> clauses;
    for (int i = 0; i < 8; ++i) {
        clauses.push_back(Formula::disjunction(Formula::var("x" + std::to_string(i)),
                                               Formula::var("y" + std::to_string(i))));
    }
    clauses.push_back(parse_formula("(-x0^-y0)"));
    Formula unsat = conjoin(std::move(clauses));

    FormulaFactory factory;
    TableauEngine engine(factory);
    FormulaId unsat_id = factory.intern(unsat);

    ctx.check(engine.check(unsat_id) == Result::Unsatisfiable, "clause set UNSAT");
    ctx.check(engine.statistics().nodes_closed > 2, "several closed leaves");
    ctx.check(all_released(engine), "closed and split nodes hold no branch");
    ctx.check(engine.tree_string().find("CLOSED") != std::string::npos,
              "rendering survives the release");

    FormulaId sat_id = factory.intern(parse_formula("((a|b)^(c|d))"));
    ctx.check(engine.check(sat_id) == Result::Satisfiable, "SAT stops early");
    ctx.check(engine.tree_string().find("UNEXPLORED") != std::string::npos,
              "some nodes left unexplored");
    ctx.check(all_released(engine), "open and unexplored nodes hold no branch");

    engine.set_complete(true);
    ctx.check(engine.check(sat_id) == Result::Satisfiable, "complete SAT");
    ctx.check(all_released(engine), "complete tableau holds no branch");
}

static void test_engine_deep_nesting(TestContext& ctx) {
    const std::string even = std::string(2000, '-') + "a";
    Result r_even = check_sat(even);
    ctx.check(r_even == Result::Satisfiable, "2000 negations SAT");
    ctx.check(r_even.model == Assignment{{"a", true}}, "even negations need a");

    Result r_odd = check_sat(std::string(2001, '-') + "a");
    ctx.check(r_odd == Result::Satisfiable && r_odd.model == Assignment{{"a", false}},
              "odd negations need -a");

    ctx.check(check_sat("(a^" + std::string(1999, '-') + "a)") == Result::Unsatisfiable,
              "a with its deep negation UNSAT");

    std::string chain = "x299";
    for (int i = 298; i >= 0; --i) {
        chain = "(x" + std::to_string(i) + "^" + chain + ")";
    }
    Result r_chain = check_sat(chain);
    ctx.check(r_chain == Result::Satisfiable, "300-variable chain SAT");
    ctx.check(r_chain.model.size() == 300, "every chain variable in the model");
    bool all_true = true;
    for (const auto& [name, value] : r_chain.model) all_true = all_true && value;
    ctx.check(all_true, "every chain variable true");

    ctx.check(check_sat("(" + chain + "^-x150)") == Result::Unsatisfiable,
              "chain with one negated member UNSAT");
}

static void test_engine_pigeonhole(TestContext& ctx) {
    struct Case { int pigeons; int holes; bool sat; };
    const std::vector<Case> cases = {{2, 2, true}, {3, 2, false}, {3, 3, true}};

    for (const Case& c : cases) {
        Formula php = pigeonhole(c.pigeons, c.holes);
        FormulaFactory factory;
        TableauEngine engine(factory);
        Result r = engine.check(factory.intern(php));
        const std::string name = "PHP(" + std::to_string(c.pigeons) + "," +
                                 std::to_string(c.holes) + ")";
        ctx.check((r == Result::Satisfiable) == c.sat,
                  name + " expected " + (c.sat ? "SAT" : "UNSAT"));
        if (r == Result::Satisfiable) {
            ctx.check(php.evaluate(r.model), name + " model satisfies");
        }
        ctx.check(!verify_result(php, r).has_value(), name + " agrees with Z3");
    }
}

// ============================================================================
// Data-driven propositional suite
// ============================================================================

std::vector<TestCase> generate_propositional_cases() {
    return {
        /* 001 */ { "p", true },
        /* 002 */ { "-p", true },
        /* 003 */ { "(p^-p)", false },
        /* 004 */ { "(p|-p)", true },
        /* 005 */ { "(p^q)", true },
        /* 006 */ { "((p^q)^-q)", false },
        /* 007 */ { "((p|q)^(-p^-q))", false },
        /* 008 */ { "((p->q)^(p^-q))", false },
        /* 009 */ { "((p->q)^p)", true },
        /* 010 */ { "(p<->-p)", false },
        /* 011 */ { "-(p<->p)", false },
        /* 012 */ { "-(p->p)", false },
        /* 013 */ { "--p", true },
        /* 014 */ { "(--p^-p)", false },
        /* 015 */ { "((p<->q)^(q<->r))", true },
        /* 016 */ { "(((p<->q)^(q<->r))^(p^-r))", false },
        /* 017 */ { "(((p->q)^(q->r))^(p^-r))", false },
        /* 018 */ { "(((p|q)^(-p|-q))^(p<->q))", false },
        /* 019 */ { "((p|q)^(-p|-q))", true },
        /* 020 */ { "-((p->q)|(q->p))", false },
        /* 021 */ { "-(((p->q)->p)->p)", false },
        /* 022 */ { "((p^(q|r))^(-(p^q)^-(p^r)))", false },
        /* 023 */ { "(-(p^q)<->(-p|-q))", true },
        /* 024 */ { "-(-(p^q)<->(-p|-q))", false },
        /* 025 */ { "((a1|a2)^((a1->b)^(a2->b)))", true },
        /* 026 */ { "(((a1|a2)^((a1->b)^(a2->b)))^-b)", false },
        /* 027 */ { "(x<->(y<->z))", true },
        /* 028 */ { "((p->(q->r))^-((p^q)->r))", false },
        /* 029 */ { "(Abc^-abc)", true },
        /* 030 */ { "((a->b)^(b->a))", true },
        /* 031 */ { "(((a->b)^(b->a))^(a^-b))", false },
        /* 032 */ { "-(p|-p)", false },
        /* 033 */ { "((p->q)^(-q^p))", false },
        /* 034 */ { "((p->q)^(-q^-p))", true },
        /* 035 */ { "(-(p|q)<->(-p^-q))", true },
        /* 036 */ { "-((p^q)->(p|q))", false },
        /* 037 */ { "((p<->q)<->(q<->p))", true },
        /* 038 */ { "-((p<->q)<->(q<->p))", false },
        /* 039 */ { "((-p->p)^-p)", false },
        /* 040 */ { "(((p|q)|r)^((-p^-q)^-r))", false },
    };
}

static void run_test_vector(TestContext& ctx, const std::vector<TestCase>& tests) {
    FormulaFactory factory;
    TableauEngine engine(factory);

    for (std::size_t i = 0; i < tests.size(); ++i) {
        const TestCase& tc = tests[i];
        const std::string label = "Test " + std::to_string(i + 1) + ": " + tc.formula;

        Formula f = parse_formula(tc.formula);
        Result r = engine.check(factory.intern(f));
        const bool actual_sat = (r == Result::Satisfiable);

        ctx.check(actual_sat == tc.expected_sat,
                  label + " expected " + (tc.expected_sat ? "SAT" : "UNSAT") +
                  " got " + result_to_string(r));
        ctx.check(brute_force_any(f, true) == tc.expected_sat,
                  label + " truth table agrees");
        if (actual_sat) {
            ctx.check(f.evaluate(r.model), label + " model " + model_string(r.model));
        }
        std::optional<std::string> diff = verify_result(f, r);
        ctx.check(!diff.has_value(), label + " Z3: " + diff.value_or(""));
    }
}

static void test_propositional_cases(TestContext& ctx) {
    run_test_vector(ctx, generate_propositional_cases());
}

// ── Seeded random corpus ────────────────────────────────────────────────────
// Soundness: every reported model satisfies its formula.
// Completeness: UNSAT exactly when the truth table has no satisfying row.

static void test_random_corpus(TestContext& ctx) {
    std::mt19937 rng(1337);
    FormulaFactory factory;
    TableauEngine engine(factory);
    TableauEngine complete(factory);
    complete.set_complete(true);

    for (int i = 0; i < 300; ++i) {
        Formula f = random_formula(rng, 1 + i % 4);
        const std::string text = f.to_string();
        const std::string label = "random " + std::to_string(i) + " " + text;

        ctx.check(parse_formula(text) == f, label + " round trip");

        FormulaId id = factory.intern(f);
        Result r = engine.check(id);
        const bool sat = (r == Result::Satisfiable);
        ctx.check(sat == brute_force_any(f, true), label + " verdict vs truth table");

        if (sat) {
            ctx.check(f.evaluate(r.model), label + " model satisfies");
            std::set<std::string> keys;
            for (const auto& [name, value] : r.model) keys.insert(name);
            ctx.check(keys == f.variables(), label + " model covers every variable");
        } else {
            ctx.check(r.model.empty(), label + " no model");
        }

        Result again = engine.check(id);
        ctx.check(again.verdict == r.verdict && again.model == r.model,
                  label + " idempotent");

        Result full = complete.check(id);
        ctx.check(full.verdict == r.verdict && full.model == r.model,
                  label + " complete mode agrees");

        ctx.check(engine.classify(id) == brute_force_classify(f),
                  label + " classification");
        ctx.check(!verify_result(f, r).has_value(), label + " agrees with Z3");
    }
}

// ============================================================================
// Z3 oracle Tests
// ============================================================================

static void test_z3_checker(TestContext& ctx) {
    Z3Checker checker;
    checker.add_formula(parse_formula("(a^-a)"));
    ctx.check(checker.check() == Z3Result::UNSAT, "Z3: (a^-a) UNSAT");

    bool threw = false;
    try {
        checker.get_model({"a"});
    } catch (const std::runtime_error&) {
        threw = true;
    }
    ctx.check(threw, "get_model refuses an UNSAT state");

    checker.reset();
    checker.add_formula(parse_formula("(a|b)"));
    checker.add_literal("a", false);
    ctx.check(checker.check() == Z3Result::SAT, "Z3: (a|b) with -a SAT");
    Assignment m = checker.get_model({"a", "b"});
    ctx.check(m == Assignment{{"a", false}, {"b", true}}, "Z3 model forced to b");
    ctx.check_eq(z3_result_to_string(Z3Result::UNKNOWN), "UNKNOWN", "result text");
}

static void test_z3_verify(TestContext& ctx) {
    Formula a = parse_formula("a");
    ctx.check(verify_result(a, Result(Result::Unsatisfiable)).has_value(),
              "wrong verdict detected");
    ctx.check(verify_result(a, Result(Result::Satisfiable, {{"a", false}})).has_value(),
              "bad model detected");
    ctx.check(!verify_result(a, Result(Result::Satisfiable, {{"a", true}})).has_value(),
              "correct verdict accepted");
    ctx.check(!verify_result(parse_formula("(a^-a)"), Result(Result::Unsatisfiable))
                   .has_value(),
              "correct UNSAT accepted");

    ctx.check(z3_classify(parse_formula("(a|-a)")) == Classification::Tautology,
              "Z3 tautology");
    ctx.check(z3_classify(a) == Classification::Contingent, "Z3 contingent");
    ctx.check(z3_classify(parse_formula("(a^-a)")) == Classification::Contradiction,
              "Z3 contradiction");
}

// ============================================================================
// Utility / CLI Tests
// ============================================================================

static void test_utils(TestContext& ctx) {
    ctx.check_eq(std::string(trim_blanks("  a \t")), "a", "trim");
    ctx.check(trim_blanks(" \r\n").empty(), "all blanks");

    std::istringstream file("(a^b)  # note\n\n   # only a comment\n-a\r\n#\n");
    std::vector<SourceLine> lines = read_formula_lines(file);
    ctx.check(lines.size() == 2, "comment and blank lines skipped");
    if (lines.size() == 2) {
        ctx.check(lines[0].number == 1, "first formula on line 1");
        ctx.check_eq(lines[0].text, "(a^b)", "inline comment removed");
        ctx.check(lines[1].number == 4, "second formula keeps line 4");
        ctx.check_eq(lines[1].text, "-a", "carriage return trimmed");
    }

    bool missing = false;
    try {
        read_formula_file("/nonexistent/tabsat/formulas.txt");
    } catch (const std::runtime_error&) {
        missing = true;
    }
    ctx.check(missing, "unreadable file rejected");

    ctx.check_eq(format_assignment({{"b", false}, {"a", true}}),
                 "  a = true\n  b = false\n", "assignment sorted by name");

    std::istringstream in("(a\n^b)");
    ctx.check_eq(read_all(in), "(a\n^b)", "read_all keeps newlines");
}

static Options parse_cli(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(a.data());
    return parse_args(static_cast<int>(argv.size()), argv.data());
}

static void test_cli_options(TestContext& ctx) {
    Options o = parse_cli({"tabsat", "--model", "--stats", "-f", "(a^b)"});
    ctx.check(o.show_model && o.show_stats, "flags set");
    ctx.check_eq(o.formula.value_or(""), "(a^b)", "formula option");
    ctx.check(!o.input, "no positional input");

    Options file = parse_cli({"tabsat", "--classify", "--verify", "cases.txt"});
    ctx.check(file.classify && file.verify, "classify and verify");
    ctx.check_eq(file.input.value_or(""), "cases.txt", "positional input");

    Options none = parse_cli({"tabsat"});
    ctx.check(!none.formula && !none.input, "no input means stdin");

    Options empty_f = parse_cli({"tabsat", "-f", ""});
    ctx.check(empty_f.formula.has_value() && empty_f.formula->empty(),
              "empty --formula is still given");
    Options empty_pos = parse_cli({"tabsat", ""});
    ctx.check(empty_pos.input.has_value() && empty_pos.input->empty(),
              "empty positional formula is still given");
    ctx.check(run(empty_f) == 1, "empty --formula reports a parse error");

    Options dashed = parse_cli({"tabsat", "--model", "--", "--a"});
    ctx.check(dashed.show_model, "options before -- still apply");
    ctx.check_eq(dashed.input.value_or(""), "--a", "formula after --");
    Options help_like = parse_cli({"tabsat", "--", "-h"});
    ctx.check(!help_like.help, "-h after -- is not an option");
    ctx.check_eq(help_like.input.value_or(""), "-h", "-h after -- is the input");

    auto rejects = [](std::vector<std::string> args) {
        try {
            parse_cli(std::move(args));
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    };
    ctx.check(rejects({"tabsat", "--bogus"}), "unknown option");
    ctx.check(rejects({"tabsat", "a", "b"}), "two inputs");
    ctx.check(rejects({"tabsat", "-f", "a", "x.txt"}), "formula plus input");
    ctx.check(rejects({"tabsat", "--valid", "--classify"}), "valid plus classify");
    ctx.check(rejects({"tabsat", "-f"}), "missing formula argument");
    ctx.check(rejects({"tabsat", "-f", "a", "-f", "b"}), "formula given twice");
    ctx.check(rejects({"tabsat", "--", "a", "b"}), "two inputs after --");
    ctx.check(rejects({"tabsat", "-f", "a", "--", "b"}), "formula plus input after --");
}

// ============================================================================
// run_selftests
// ============================================================================

int run_selftests() {
    TestRunner runner;

    // Lexer tests
    runner.run("lexer_symbols",              test_lexer_symbols);
    runner.run("lexer_whitespace",           test_lexer_whitespace);
    runner.run("lexer_positions",            test_lexer_positions);
    runner.run("lexer_invalid",              test_lexer_invalid);

    // Parser tests
    runner.run("parse_variables",            test_parse_variables);
    runner.run("parse_connectives",          test_parse_connectives);
    runner.run("parse_error_kinds",          test_parse_error_kinds);
    runner.run("parse_error_positions",      test_parse_error_positions);
    runner.run("parse_round_trip",           test_parse_round_trip);

    // Formula representation
    runner.run("formula_values",             test_formula_values);
    runner.run("factory_interning",          test_factory_interning);
    runner.run("formula_deep_values",        test_formula_deep_values);

    // Rules and branches
    runner.run("expansion_rules",            test_expansion_rules);
    runner.run("branch_closure",             test_branch_closure);

    // Engine
    runner.run("engine_scenarios",           test_engine_scenarios);
    runner.run("engine_idempotent",          test_engine_idempotent);
    runner.run("engine_validity",            test_engine_validity);
    runner.run("engine_tree_and_stats",      test_engine_tree_and_stats);
    runner.run("engine_creation_order",      test_engine_creation_order);
    runner.run("engine_branch_release",      test_engine_branch_release);
    runner.run("engine_deep_nesting",        test_engine_deep_nesting);
    runner.run("engine_pigeonhole",          test_engine_pigeonhole);

    // Data-driven suites
    runner.run("propositional_cases",        test_propositional_cases);
    runner.run("random_corpus",              test_random_corpus);

    // Z3 oracle
    runner.run("z3_checker",                 test_z3_checker);
    runner.run("z3_verify",                  test_z3_verify);

    // Utilities and CLI
    runner.run("utils",                      test_utils);
    runner.run("cli_options",                test_cli_options);

    return runner.summarise();
}

}  // namespace tabsat
