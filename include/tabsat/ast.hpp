// ============================================================================
// tabsat/ast.hpp — Abstract Syntax Tree for propositional formulas
// ============================================================================
//
// Design notes:
//
//   Two representations live side by side:
//
//   Formula         an owning tree produced by the parser.  Every node owns
//                   its children exclusively through std::unique_ptr, so a
//                   Formula is a plain value: copying it deep-copies the
//                   tree, moving it transfers ownership.
//
//   FormulaFactory  an interning table.  Interning a Formula assigns one
//                   FormulaId to every structurally distinct sub-formula,
//                   so structural equality becomes an integer comparison.
//                   The tableau engine works on ids exclusively.
//
//   Every walk over a tree (copy, comparison, destruction, interning,
//   printing, evaluation) uses an explicit worklist instead of recursion.
//
//   Node types:
//     - Var     : propositional variable (name)
//     - Not     : negation, child[0]
//     - And     : conjunction, child[0] ^ child[1]
//     - Or      : disjunction, child[0] | child[1]
//     - Implies : implication child[0] -> child[1]
//     - Iff     : biconditional child[0] <-> child[1]
//
// ============================================================================

#ifndef TABSAT_AST_HPP
#define TABSAT_AST_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tabsat {

// ── FormulaId ───────────────────────────────────────────────────────────────
// A lightweight handle into the formula interning table.  The id is an index
// into the FormulaFactory's internal node vector.  The special value
// kInvalidId signals "no formula".
// ─────────────────────────────────────────────────────────────────────────────

using FormulaId = std::uint32_t;
inline constexpr FormulaId kInvalidId = static_cast<FormulaId>(-1);

// ── Assignment ──────────────────────────────────────────────────────────────
// Truth values keyed by variable name.  Ordered so that printing is
// deterministic.

using Assignment = std::map<std::string, bool>;

// ── NodeKind ────────────────────────────────────────────────────────────────

enum class NodeKind : std::uint8_t {
    Var,
    Not,
    And,
    Or,
    Implies,
    Iff
};

/// Grammar symbol for a NodeKind ("-", "^", "|", "->", "<->"; "Var").
const char* node_kind_name(NodeKind k) noexcept;

/// True for And, Or, Implies and Iff.
bool is_binary(NodeKind k) noexcept;

/// True if `name` matches [A-Za-z][A-Za-z0-9]*.
bool is_valid_variable_name(std::string_view name) noexcept;

// ── Formula ─────────────────────────────────────────────────────────────────
// Owning formula tree.  Build values through the named constructors; the
// variable constructor validates the name and throws std::invalid_argument
// on an empty or malformed one.

class Formula {
public:
    // ── Constructors ────────────────────────────────────────────────────
    static Formula var(std::string name);
    static Formula negation(Formula operand);
    static Formula conjunction(Formula lhs, Formula rhs);
    static Formula disjunction(Formula lhs, Formula rhs);
    static Formula implication(Formula lhs, Formula rhs);
    static Formula biconditional(Formula lhs, Formula rhs);

    /// Build a binary node of the given kind.  Throws std::invalid_argument
    /// if `kind` is not binary.
    static Formula binary(NodeKind kind, Formula lhs, Formula rhs);

    Formula(const Formula& other);
    Formula& operator=(const Formula& other);
    Formula(Formula&&) noexcept = default;
    Formula& operator=(Formula&&) noexcept = default;

    /// Releases the subtree from an explicit worklist, so nesting depth is
    /// bounded by memory rather than by the call stack.
    ~Formula();

    // ── Accessors ───────────────────────────────────────────────────────
    NodeKind           kind() const noexcept { return kind_; }
    const std::string& name() const noexcept { return name_; }

    /// Operand of a Not node.
    const Formula& operand() const { return *children_[0]; }
    /// Left / right operands of a binary node.
    const Formula& lhs() const { return *children_[0]; }
    const Formula& rhs() const { return *children_[1]; }

    /// Number of nodes in the tree.
    std::size_t size() const;

    /// Names of all variables occurring in the formula.
    std::set<std::string> variables() const;

    /// Evaluate under `a`.  Variables missing from `a` are false.
    bool evaluate(const Assignment& a) const;

    /// Canonical, fully parenthesised rendering in the input grammar
    /// (no whitespace).  Parsing the result yields an equal tree.
    std::string to_string() const;

    bool operator==(const Formula& o) const noexcept;
    bool operator!=(const Formula& o) const noexcept { return !(*this == o); }

private:
    Formula() = default;

    NodeKind                 kind_ = NodeKind::Var;
    std::string              name_;  // non-empty for Var nodes only
    std::unique_ptr<Formula> children_[2];
};

// ── FormulaHash ─────────────────────────────────────────────────────────────
// Structural hash consistent with Formula::operator==.

struct FormulaHash {
    std::size_t operator()(const Formula& f) const noexcept;
};

// ── FormulaNode ─────────────────────────────────────────────────────────────
// Immutable interned node.  The FormulaFactory is the sole owner.

struct FormulaNode {
    NodeKind    kind{};
    std::string var_name;        // non-empty for Var nodes
    FormulaId   children[2]{kInvalidId, kInvalidId};

    // Structural-equality (used by the interning table).
    bool operator==(const FormulaNode& o) const noexcept;
};

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Hash functor for FormulaNode, combining kind + var_name + children.

struct FormulaNodeHash {
    std::size_t operator()(const FormulaNode& n) const noexcept;
};

// ── FormulaFactory ──────────────────────────────────────────────────────────
// Thread-unsafe (single-threaded design).  Owns the node storage and the
// interning map.  Every make_*() method returns the canonical FormulaId for
// that structure.

class FormulaFactory {
public:
    FormulaFactory() = default;

    // ── Constructors ────────────────────────────────────────────────────
    FormulaId make_var(const std::string& name);
    FormulaId make_not(FormulaId child);
    FormulaId make_and(FormulaId lhs, FormulaId rhs);
    FormulaId make_or(FormulaId lhs, FormulaId rhs);
    FormulaId make_implies(FormulaId lhs, FormulaId rhs);
    FormulaId make_iff(FormulaId lhs, FormulaId rhs);

    /// Intern a whole tree.  Structurally equal sub-trees, within one
    /// formula or across calls, receive the same id.
    FormulaId intern(const Formula& formula);

    // ── Accessors ───────────────────────────────────────────────────────
    const FormulaNode& node(FormulaId id) const;
    std::size_t        size() const noexcept;

    /// Rebuild an owning tree from an interned id.
    Formula to_formula(FormulaId id) const;

    // ── Pretty-print ────────────────────────────────────────────────────
    // Same canonical rendering as Formula::to_string().
    std::string to_string(FormulaId id) const;

private:
    FormulaId make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs);

    // Intern a node: return existing id when structurally equal, otherwise
    // allocate a new slot.
    FormulaId intern_node(FormulaNode node);

    std::vector<FormulaNode>                                    nodes_;
    std::unordered_map<FormulaNode, FormulaId, FormulaNodeHash> intern_;
};

}  // namespace tabsat

#endif  // TABSAT_AST_HPP
