// ============================================================================
// tableau.cpp — Signed semantic tableau engine implementation
// ============================================================================
//
// KEY DESIGN DECISIONS:
// ─────────────────────
// 1. Pure rewrite rules: expand() maps one signed formula to its
//    successors without looking at the rest of the branch.
//
// 2. Incremental closure: Branch::add() detects (φ,T)/(φ,F) at insertion
//    time, so a branch stops the moment it becomes contradictory.  Formulas
//    are interned, so φ may be compound as well as a variable.
//
// 3. Deterministic order: pending formulas are expanded FIFO, and so are
//    pending nodes.  Nodes are therefore saturated in creation order and the
//    model comes from the first open leaf that was created.
//
// 4. No recursion in the search: the node queue is explicit.  A branch is
//    dropped once its node is decided; only `added` survives for rendering.
//
// ============================================================================

#include "tabsat/tableau.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <unordered_set>

namespace tabsat {

// ============================================================================
// String conversion
// ============================================================================

const char* result_to_string(const Result& r) noexcept {
    switch (r.verdict) {
        case Result::Value::Satisfiable:   return "SAT";
        case Result::Value::Unsatisfiable: return "UNSAT";
    }
    return "?";
}

const char* classification_to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Tautology:     return "TAUTOLOGY";
        case Classification::Contingent:    return "CONTINGENT";
        case Classification::Contradiction: return "CONTRADICTION";
    }
    return "?";
}

std::string signed_to_string(const FormulaFactory& factory, SignedFormula sf) {
    return (sf.polarity ? "T:" : "F:") + factory.to_string(sf.formula);
}

// ============================================================================
// expand() — the rule table
// ============================================================================

Expansion expand(const FormulaFactory& factory, SignedFormula sf) {
    const FormulaNode& n = factory.node(sf.formula);
    const FormulaId a = n.children[0];
    const FormulaId b = n.children[1];
    const bool t = sf.polarity;

    Expansion e;
    switch (n.kind) {
        case NodeKind::Var:
            e.kind = Expansion::Kind::Terminal;
            break;

        case NodeKind::Not:
            e.kind = Expansion::Kind::Linear;
            e.left = {{a, !t}};
            break;

        case NodeKind::And:
            if (t) {
                e.kind = Expansion::Kind::Linear;
                e.left = {{a, true}, {b, true}};
            } else {
                e.kind = Expansion::Kind::Branching;
                e.left = {{a, false}};
                e.right = {{b, false}};
            }
            break;

        case NodeKind::Or:
            if (t) {
                e.kind = Expansion::Kind::Branching;
                e.left = {{a, true}};
                e.right = {{b, true}};
            } else {
                e.kind = Expansion::Kind::Linear;
                e.left = {{a, false}, {b, false}};
            }
            break;

        case NodeKind::Implies:
            if (t) {
                e.kind = Expansion::Kind::Branching;
                e.left = {{a, false}};
                e.right = {{b, true}};
            } else {
                e.kind = Expansion::Kind::Linear;
                e.left = {{a, true}, {b, false}};
            }
            break;

        case NodeKind::Iff:
            e.kind = Expansion::Kind::Branching;
            if (t) {
                e.left = {{a, true}, {b, true}};
                e.right = {{a, false}, {b, false}};
            } else {
                e.left = {{a, true}, {b, false}};
                e.right = {{a, false}, {b, true}};
            }
            break;
    }
    return e;
}

// ============================================================================
// Branch
// ============================================================================

bool Branch::add(const FormulaFactory& factory, SignedFormula sf) {
    if (closed_) {
        return false;
    }

    auto& same = sf.polarity ? asserted_true_ : asserted_false_;
    const auto& opposite = sf.polarity ? asserted_false_ : asserted_true_;

    if (!same.insert(sf.formula).second) {
        return true;  // already on the branch
    }
    entries_.push_back(sf);

    if (opposite.count(sf.formula) != 0) {
        closed_ = true;
        conflict_ = sf.formula;
        pending_.clear();
        return false;
    }

    if (factory.node(sf.formula).kind != NodeKind::Var) {
        pending_.push_back(sf);
    }
    return true;
}

std::optional<SignedFormula> Branch::take_pending() {
    if (pending_.empty()) {
        return std::nullopt;
    }
    SignedFormula sf = pending_.front();
    pending_.pop_front();
    return sf;
}

bool Branch::contains(SignedFormula sf) const noexcept {
    return sf.polarity ? asserted_true_.count(sf.formula) != 0
                       : asserted_false_.count(sf.formula) != 0;
}

// ============================================================================
// TableauStats implementation
// ============================================================================

std::string TableauStats::to_string() const {
    std::ostringstream oss;
    oss << "nodes=" << nodes_created
        << " open=" << nodes_open
        << " closed=" << nodes_closed
        << " expansions=" << expansions
        << " splits=" << splits
        << " max_depth=" << max_depth
        << " time=" << elapsed_s << "s";
    return oss.str();
}

// ============================================================================
// TableauEngine implementation
// ============================================================================

TableauEngine::TableauEngine(const FormulaFactory& factory)
    : factory_(factory) {}

TableauEngine::~TableauEngine() = default;

TableauNode* TableauEngine::alloc_node(TableauNode* parent) {
    auto node = std::make_unique<TableauNode>();
    node->id = static_cast<std::uint32_t>(nodes_.size());
    if (parent != nullptr) {
        node->depth = parent->depth + 1;
        parent->children.push_back(node.get());
    }
    stats_.nodes_created++;
    stats_.max_depth = std::max(stats_.max_depth, node->depth);

    TableauNode* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
}

bool TableauEngine::extend(TableauNode* node, const std::vector<SignedFormula>& sfs) {
    for (const SignedFormula& sf : sfs) {
        if (node->branch.closed()) break;
        if (node->branch.contains(sf)) continue;
        node->added.push_back(sf);
        node->branch.add(factory_, sf);
    }
    return !node->branch.closed();
}

// ── Public entry points ─────────────────────────────────────────────────────

Result TableauEngine::check(FormulaId formula) {
    return run(SignedFormula{formula, true});
}

Result TableauEngine::falsify(FormulaId formula) {
    return run(SignedFormula{formula, false});
}

bool TableauEngine::is_valid(FormulaId formula) {
    return falsify(formula) == Result::Unsatisfiable;
}

Classification TableauEngine::classify(FormulaId formula) {
    if (check(formula) == Result::Unsatisfiable) {
        return Classification::Contradiction;
    }
    if (falsify(formula) == Result::Unsatisfiable) {
        return Classification::Tautology;
    }
    return Classification::Contingent;
}

// ============================================================================
// run() — breadth-first exploration of the tableau
// ============================================================================

Result TableauEngine::run(SignedFormula root_sf) {
    // Reset state from previous runs.
    nodes_.clear();
    stats_.reset();

    const auto t_start = std::chrono::steady_clock::now();

    TableauNode* root = alloc_node(nullptr);
    extend(root, {root_sf});

    std::deque<TableauNode*> queue{root};
    std::optional<Assignment> model;

    while (!queue.empty()) {
        TableauNode* node = queue.front();
        queue.pop_front();

        switch (saturate(node)) {
            case Outcome::Closed:
                node->status = NodeStatus::Closed;
                stats_.nodes_closed++;
                if (trace_) {
                    std::cerr << "[tableau] node " << node->id << " closed on "
                              << factory_.to_string(node->branch.conflict()) << "\n";
                }
                node->branch = Branch{};
                break;

            case Outcome::Open:
                node->status = NodeStatus::Open;
                stats_.nodes_open++;
                if (trace_) {
                    std::cerr << "[tableau] node " << node->id << " open\n";
                }
                if (!model) {
                    model = extract_model(node, root_sf.formula);
                }
                node->branch = Branch{};
                break;

            case Outcome::Split:
                node->status = NodeStatus::Split;
                queue.push_back(node->children[0]);
                queue.push_back(node->children[1]);
                break;
        }

        if (model && !complete_) {
            break;
        }
    }

    // Nodes left unexplored keep their status but not their branch.
    for (TableauNode* node : queue) {
        node->branch = Branch{};
    }

    stats_.elapsed_s = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t_start).count();

    if (!model) {
        return Result(Result::Value::Unsatisfiable, {}, stats_.elapsed_s);
    }
    return Result(Result::Value::Satisfiable, std::move(*model), stats_.elapsed_s);
}

// ============================================================================
// saturate() — apply rules to one node until it closes, opens or splits
// ============================================================================

TableauEngine::Outcome TableauEngine::saturate(TableauNode* node) {
    Branch& branch = node->branch;

    while (!branch.closed()) {
        std::optional<SignedFormula> next = branch.take_pending();
        if (!next) {
            return Outcome::Open;
        }

        Expansion e = expand(factory_, *next);
        stats_.expansions++;
        if (trace_) {
            std::cerr << "[tableau] node " << node->id << " expand "
                      << signed_to_string(factory_, *next) << "\n";
        }

        switch (e.kind) {
            case Expansion::Kind::Terminal:
                break;

            case Expansion::Kind::Linear:
                extend(node, e.left);
                break;

            case Expansion::Kind::Branching: {
                node->expanded = *next;
                TableauNode* left = alloc_node(node);
                TableauNode* right = alloc_node(node);
                left->branch = branch;
                right->branch = std::move(branch);
                node->branch = Branch{};
                extend(left, e.left);
                extend(right, e.right);
                stats_.splits++;
                if (trace_) {
                    std::cerr << "[tableau] node " << node->id << " split into "
                              << left->id << ", " << right->id << "\n";
                }
                return Outcome::Split;
            }
        }
    }
    return Outcome::Closed;
}

// ============================================================================
// Model extraction
// ============================================================================

void TableauEngine::collect_variables(FormulaId formula, Assignment& out) const {
    std::vector<FormulaId> work{formula};
    std::unordered_set<FormulaId> seen;
    while (!work.empty()) {
        FormulaId id = work.back();
        work.pop_back();
        if (!seen.insert(id).second) continue;

        const FormulaNode& n = factory_.node(id);
        if (n.kind == NodeKind::Var) {
            out.emplace(n.var_name, false);
            continue;
        }
        for (FormulaId child : n.children) {
            if (child != kInvalidId) work.push_back(child);
        }
    }
}

Assignment TableauEngine::extract_model(const TableauNode* leaf,
                                        FormulaId formula) const {
    // Every variable of the formula defaults to false; the branch's
    // literals override.
    Assignment model;
    collect_variables(formula, model);
    for (const SignedFormula& sf : leaf->branch.entries()) {
        const FormulaNode& n = factory_.node(sf.formula);
        if (n.kind == NodeKind::Var) {
            model[n.var_name] = sf.polarity;
        }
    }
    return model;
}

// ============================================================================
// Rendering
// ============================================================================

const char* TableauEngine::status_name(NodeStatus s) const noexcept {
    switch (s) {
        case NodeStatus::Unknown: return "UNEXPLORED";
        case NodeStatus::Open:    return "OPEN";
        case NodeStatus::Closed:  return "CLOSED";
        case NodeStatus::Split:   return "SPLIT";
    }
    return "?";
}

void TableauEngine::render_node(const TableauNode* node, std::string& out) const {
    out.append(2 * node->depth, ' ');
    out += "[" + std::to_string(node->id) + "]";
    for (std::size_t i = 0; i < node->added.size(); ++i) {
        out += (i == 0 ? " " : ", ");
        out += signed_to_string(factory_, node->added[i]);
    }
    if (node->status == NodeStatus::Split && node->expanded) {
        out += "  split on " + signed_to_string(factory_, *node->expanded);
    } else {
        out += "  ";
        out += status_name(node->status);
    }
    out += "\n";
}

std::string TableauEngine::tree_string() const {
    std::string out;
    if (nodes_.empty()) {
        return "(no tableau)\n";
    }
    std::vector<const TableauNode*> stack{nodes_.front().get()};
    while (!stack.empty()) {
        const TableauNode* node = stack.back();
        stack.pop_back();
        render_node(node, out);
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return out;
}

std::string TableauEngine::to_dot() const {
    std::ostringstream oss;
    oss << "digraph Tableau {\n";
    oss << "  node [shape=box fontname=\"Helvetica\"];\n";
    for (const auto& node : nodes_) {
        oss << "  n" << node->id << " [label=\"";
        for (const SignedFormula& sf : node->added) {
            oss << signed_to_string(factory_, sf) << "\\n";
        }
        if (node->status == NodeStatus::Split && node->expanded) {
            oss << "split " << signed_to_string(factory_, *node->expanded);
        } else {
            oss << status_name(node->status);
        }
        oss << "\"";
        if (node->status == NodeStatus::Closed) {
            oss << " color=red";
        } else if (node->status == NodeStatus::Open) {
            oss << " color=darkgreen penwidth=2";
        }
        oss << "];\n";
        for (const TableauNode* child : node->children) {
            oss << "  n" << node->id << " -> n" << child->id << ";\n";
        }
    }
    oss << "}\n";
    return oss.str();
}

std::string TableauEngine::stats() const {
    return stats_.to_string();
}

}  // namespace tabsat
