// ============================================================================
// tabsat/tableau.hpp — Signed semantic tableau engine
// ============================================================================
//
// Architecture Overview:
// ─────────────────────
// - The unit of work is a signed formula (φ, T) or (φ, F): "φ is asserted
//   true (false) on this branch".
// - A Branch accumulates signed formulas and keeps a FIFO worklist of the
//   compound ones still to be expanded.  Inserting (φ, s) when (φ, ¬s) is
//   present closes the branch on the spot.
// - Each TableauNode owns one branch segment.  Linear rules extend the
//   node's branch in place; a branching rule ends the node and creates two
//   children, each inheriting the parent's branch plus its own additions.
// - Pending nodes are processed first-in, first-out, so they are saturated
//   in creation order and deep formulas never deepen the call stack.
// - The search stops at the first open leaf in creation order unless a
//   complete tableau was requested.
// - A node's branch is released as soon as the node closes, opens or
//   splits.  The rendered tree only needs each node's `added` formulas.
//
// Expansion rules:
// ───────────────
//   (-φ, T)      → (φ, F)                 (-φ, F)      → (φ, T)
//   (φ^ψ, T)     → (φ, T), (ψ, T)         (φ^ψ, F)     → (φ, F) | (ψ, F)
//   (φ|ψ, T)     → (φ, T) | (ψ, T)        (φ|ψ, F)     → (φ, F), (ψ, F)
//   (φ->ψ, T)    → (φ, F) | (ψ, T)        (φ->ψ, F)    → (φ, T), (ψ, F)
//   (φ<->ψ, T)   → (φ,T),(ψ,T) | (φ,F),(ψ,F)
//   (φ<->ψ, F)   → (φ,T),(ψ,F) | (φ,F),(ψ,T)
//   (p, _)       terminal literal
//
// ============================================================================

#ifndef TABSAT_TABLEAU_HPP
#define TABSAT_TABLEAU_HPP

#include "tabsat/ast.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace tabsat {

// ── Result ──────────────────────────────────────────────────────────────────
//
// A Result captures the verdict, the assignment read off the first open
// branch in creation order (empty when unsatisfiable), and the wall-clock time (in seconds)
// taken by the engine.

struct Result {
    /// The satisfiability verdict.
    enum class Value { Satisfiable, Unsatisfiable };

    Value      verdict   = Value::Unsatisfiable;
    Assignment model;
    double     elapsed_s = 0.0;

    // Construction.
    Result() = default;
    Result(Value v, Assignment m = {}, double t = 0.0)
        : verdict(v), model(std::move(m)), elapsed_s(t) {}

    // Comparison against a bare Value so `r == Result::Satisfiable` reads
    // naturally at call-sites.
    bool operator==(Value v) const noexcept { return verdict == v; }
    bool operator!=(Value v) const noexcept { return verdict != v; }

    static constexpr Value Satisfiable   = Value::Satisfiable;
    static constexpr Value Unsatisfiable = Value::Unsatisfiable;
};

/// Convert a Result to a display string ("SAT" / "UNSAT").
const char* result_to_string(const Result& r) noexcept;

// ── Classification ──────────────────────────────────────────────────────────

enum class Classification : std::uint8_t {
    Tautology,      // true under every assignment
    Contingent,     // true under some, false under others
    Contradiction   // true under none
};

const char* classification_to_string(Classification c) noexcept;

// ── SignedFormula ───────────────────────────────────────────────────────────

struct SignedFormula {
    FormulaId formula  = kInvalidId;
    bool      polarity = true;

    bool operator==(const SignedFormula& o) const noexcept {
        return formula == o.formula && polarity == o.polarity;
    }
};

/// "T:(a^b)" / "F:a".
std::string signed_to_string(const FormulaFactory& factory, SignedFormula sf);

// ── Expansion ───────────────────────────────────────────────────────────────
// The result of applying one rule.  A linear rule fills `left` only; a
// branching rule fills `left` (child A) and `right` (child B).

struct Expansion {
    enum class Kind : std::uint8_t { Terminal, Linear, Branching };

    Kind                       kind = Kind::Terminal;
    std::vector<SignedFormula> left;
    std::vector<SignedFormula> right;
};

/// Apply the expansion rule for `sf`.
Expansion expand(const FormulaFactory& factory, SignedFormula sf);

// ── Branch ──────────────────────────────────────────────────────────────────
// Signed formulas accumulated along one root-to-frontier path.  Copying a
// Branch copies its contents; branches never alias each other.

class Branch {
public:
    /// Assert `sf` on this branch.  A signed formula already present is
    /// ignored.  Compound formulas are queued for expansion.  Returns false
    /// if the branch is closed afterwards.  Once closed, add() is a no-op.
    bool add(const FormulaFactory& factory, SignedFormula sf);

    /// Pop the earliest-inserted pending formula.
    std::optional<SignedFormula> take_pending();

    bool closed() const noexcept { return closed_; }
    bool saturated() const noexcept { return pending_.empty(); }

    /// The pair that closed the branch, if any.
    FormulaId conflict() const noexcept { return conflict_; }

    bool contains(SignedFormula sf) const noexcept;

    /// All signed formulas in insertion order.
    const std::vector<SignedFormula>& entries() const noexcept { return entries_; }

private:
    std::unordered_set<FormulaId> asserted_true_;
    std::unordered_set<FormulaId> asserted_false_;
    std::vector<SignedFormula> entries_;
    std::deque<SignedFormula>  pending_;
    bool                       closed_   = false;
    FormulaId                  conflict_ = kInvalidId;
};

// ── NodeStatus ──────────────────────────────────────────────────────────────

enum class NodeStatus : std::uint8_t {
    Unknown,    // Not yet explored (or abandoned after the first open leaf)
    Open,       // Fully expanded without contradiction
    Closed,     // Contradiction found
    Split       // Ended by a branching rule; status lives in the children
};

// ── TableauNode ─────────────────────────────────────────────────────────────
// A node in the tableau tree.
//
// Fields:
//   branch   - Accumulated branch; released once the node is decided.
//   added    - Signed formulas introduced at this node (for rendering).
//   expanded - The formula whose branching rule split this node.
//   children - Child nodes (zero or two).
//   depth    - Depth in the tree.
//   id       - Creation order, starting at 0 for the root.

struct TableauNode {
    Branch                    branch;
    std::vector<SignedFormula> added;
    std::optional<SignedFormula> expanded;
    NodeStatus                status = NodeStatus::Unknown;
    std::vector<TableauNode*> children;
    std::uint32_t             depth = 0;
    std::uint32_t             id = 0;
};

// ── Statistics ──────────────────────────────────────────────────────────────

struct TableauStats {
    std::uint32_t nodes_created = 0;
    std::uint32_t nodes_closed  = 0;
    std::uint32_t nodes_open    = 0;
    std::uint32_t expansions    = 0;
    std::uint32_t splits        = 0;
    std::uint32_t max_depth     = 0;
    double        elapsed_s     = 0.0;

    void reset() noexcept { *this = TableauStats{}; }

    std::string to_string() const;
};

// ── TableauEngine ───────────────────────────────────────────────────────────
// Decides interned formulas of one FormulaFactory.  The tableau built by
// the last call is kept for inspection until the next call.

class TableauEngine {
public:
    explicit TableauEngine(const FormulaFactory& factory);
    ~TableauEngine();

    // Non-copyable, non-movable (owns node memory).
    TableauEngine(const TableauEngine&) = delete;
    TableauEngine& operator=(const TableauEngine&) = delete;

    /// Is there an assignment making `formula` true?
    Result check(FormulaId formula);

    /// Is there an assignment making `formula` false?  Unsatisfiable means
    /// the formula is valid; otherwise the model is a counter-model.
    Result falsify(FormulaId formula);

    /// True iff every assignment satisfies `formula`.
    bool is_valid(FormulaId formula);

    /// Tautology / Contingent / Contradiction.
    Classification classify(FormulaId formula);

    /// Keep expanding after the first open leaf so that the whole tableau
    /// is built.  The verdict and model are unaffected.
    void set_complete(bool enable) { complete_ = enable; }

    /// Write a trace line per rule application to std::cerr.
    void set_trace(bool enable) { trace_ = enable; }

    /// Indented text rendering of the last tableau.
    std::string tree_string() const;

    /// Graphviz rendering of the last tableau.
    std::string to_dot() const;

    /// Statistics about the last run.
    std::string stats() const;
    const TableauStats& statistics() const noexcept { return stats_; }

    /// Expose the last tableau (read-only).  nodes()[0] is the root.
    const std::vector<std::unique_ptr<TableauNode>>& nodes() const { return nodes_; }

private:
    enum class Outcome { Open, Closed, Split };

    Result run(SignedFormula root);

    TableauNode* alloc_node(TableauNode* parent);

    // Expand `node` until it closes, saturates, or splits.
    Outcome saturate(TableauNode* node);

    // Add `sfs` to `node`'s branch, recording them in node->added.
    bool extend(TableauNode* node, const std::vector<SignedFormula>& sfs);

    Assignment extract_model(const TableauNode* leaf, FormulaId formula) const;

    void collect_variables(FormulaId formula, Assignment& out) const;

    void render_node(const TableauNode* node, std::string& out) const;

    const char* status_name(NodeStatus s) const noexcept;

    // ── Data members ────────────────────────────────────────────────────
    const FormulaFactory& factory_;

    std::vector<std::unique_ptr<TableauNode>> nodes_;

    TableauStats stats_;

    // Configuration.
    bool complete_ = false;
    bool trace_    = false;
};

}  // namespace tabsat

#endif  // TABSAT_TABLEAU_HPP
