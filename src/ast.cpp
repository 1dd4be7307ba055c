// ============================================================================
// ast.cpp — Implementation of the formula tree, interning, and printing
// ============================================================================

#include "tabsat/ast.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tabsat {

// ── node_kind_name ──────────────────────────────────────────────────────────

const char* node_kind_name(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::Var:     return "Var";
        case NodeKind::Not:     return "-";
        case NodeKind::And:     return "^";
        case NodeKind::Or:      return "|";
        case NodeKind::Implies: return "->";
        case NodeKind::Iff:     return "<->";
    }
    return "?";
}

bool is_binary(NodeKind k) noexcept {
    switch (k) {
        case NodeKind::And:
        case NodeKind::Or:
        case NodeKind::Implies:
        case NodeKind::Iff:
            return true;
        case NodeKind::Var:
        case NodeKind::Not:
            return false;
    }
    return false;
}

bool is_valid_variable_name(std::string_view name) noexcept {
    if (name.empty() || !std::isalpha(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    });
}

// ============================================================================
// Formula
// ============================================================================

Formula Formula::var(std::string name) {
    if (name.empty()) {
        throw std::invalid_argument("variable name must not be empty");
    }
    if (!is_valid_variable_name(name)) {
        throw std::invalid_argument("invalid variable name: " + name);
    }
    Formula f;
    f.kind_ = NodeKind::Var;
    f.name_ = std::move(name);
    return f;
}

Formula Formula::negation(Formula operand) {
    Formula f;
    f.kind_ = NodeKind::Not;
    f.children_[0] = std::make_unique<Formula>(std::move(operand));
    return f;
}

Formula Formula::binary(NodeKind kind, Formula lhs, Formula rhs) {
    if (!is_binary(kind)) {
        throw std::invalid_argument(std::string("not a binary connective: ") +
                                    node_kind_name(kind));
    }
    Formula f;
    f.kind_ = kind;
    f.children_[0] = std::make_unique<Formula>(std::move(lhs));
    f.children_[1] = std::make_unique<Formula>(std::move(rhs));
    return f;
}

Formula Formula::conjunction(Formula lhs, Formula rhs) {
    return binary(NodeKind::And, std::move(lhs), std::move(rhs));
}

Formula Formula::disjunction(Formula lhs, Formula rhs) {
    return binary(NodeKind::Or, std::move(lhs), std::move(rhs));
}

Formula Formula::implication(Formula lhs, Formula rhs) {
    return binary(NodeKind::Implies, std::move(lhs), std::move(rhs));
}

Formula Formula::biconditional(Formula lhs, Formula rhs) {
    return binary(NodeKind::Iff, std::move(lhs), std::move(rhs));
}

Formula::Formula(const Formula& other)
    : kind_(other.kind_), name_(other.name_) {
    // Pairs of (source node, destination node whose children are missing).
    std::vector<std::pair<const Formula*, Formula*>> work{{&other, this}};
    while (!work.empty()) {
        auto [src, dst] = work.back();
        work.pop_back();
        for (int i = 0; i < 2; ++i) {
            const Formula* child = src->children_[i].get();
            if (child == nullptr) continue;
            std::unique_ptr<Formula> copy(new Formula());
            copy->kind_ = child->kind_;
            copy->name_ = child->name_;
            work.emplace_back(child, copy.get());
            dst->children_[i] = std::move(copy);
        }
    }
}

Formula& Formula::operator=(const Formula& other) {
    if (this != &other) {
        Formula copy(other);
        *this = std::move(copy);
    }
    return *this;
}

Formula::~Formula() {
    std::vector<std::unique_ptr<Formula>> doomed;
    for (auto& child : children_) {
        if (child) doomed.push_back(std::move(child));
    }
    while (!doomed.empty()) {
        std::unique_ptr<Formula> f = std::move(doomed.back());
        doomed.pop_back();
        for (auto& child : f->children_) {
            if (child) doomed.push_back(std::move(child));
        }
        // `f` goes out of scope here with no children left.
    }
}

std::size_t Formula::size() const {
    std::size_t n = 0;
    std::vector<const Formula*> work{this};
    while (!work.empty()) {
        const Formula* f = work.back();
        work.pop_back();
        ++n;
        for (const auto& child : f->children_) {
            if (child) work.push_back(child.get());
        }
    }
    return n;
}

std::set<std::string> Formula::variables() const {
    std::set<std::string> out;
    std::vector<const Formula*> work{this};
    while (!work.empty()) {
        const Formula* f = work.back();
        work.pop_back();
        if (f->kind_ == NodeKind::Var) {
            out.insert(f->name_);
            continue;
        }
        for (const auto& child : f->children_) {
            if (child) work.push_back(child.get());
        }
    }
    return out;
}

// Post-order: a node is pushed once to schedule its operands and once more
// (`ready`) to combine their values from the value stack.
bool Formula::evaluate(const Assignment& a) const {
    std::vector<std::pair<const Formula*, bool>> work{{this, false}};
    std::vector<bool> values;

    while (!work.empty()) {
        auto [f, ready] = work.back();
        work.pop_back();

        if (f->kind_ == NodeKind::Var) {
            auto it = a.find(f->name_);
            values.push_back(it != a.end() && it->second);
            continue;
        }
        if (!ready) {
            work.emplace_back(f, true);
            if (f->children_[1]) work.emplace_back(f->children_[1].get(), false);
            work.emplace_back(f->children_[0].get(), false);
            continue;
        }

        if (f->kind_ == NodeKind::Not) {
            values.back() = !values.back();
            continue;
        }
        const bool r = values.back();
        values.pop_back();
        const bool l = values.back();
        switch (f->kind_) {
            case NodeKind::And:     values.back() = l && r;  break;
            case NodeKind::Or:      values.back() = l || r;  break;
            case NodeKind::Implies: values.back() = !l || r; break;
            case NodeKind::Iff:     values.back() = l == r;  break;
            case NodeKind::Var:
            case NodeKind::Not:
                break;
        }
    }
    return values.back();
}

std::string Formula::to_string() const {
    // Either a sub-formula still to print or a literal piece of text.
    struct Piece {
        const Formula* formula;
        const char*    text;
    };
    std::vector<Piece> work{{this, nullptr}};
    std::string out;

    while (!work.empty()) {
        Piece p = work.back();
        work.pop_back();
        if (p.formula == nullptr) {
            out += p.text;
            continue;
        }
        const Formula& f = *p.formula;
        switch (f.kind_) {
            case NodeKind::Var:
                out += f.name_;
                break;
            case NodeKind::Not:
                out += '-';
                work.push_back({&f.operand(), nullptr});
                break;
            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
                out += '(';
                work.push_back({nullptr, ")"});
                work.push_back({&f.rhs(), nullptr});
                work.push_back({nullptr, node_kind_name(f.kind_)});
                work.push_back({&f.lhs(), nullptr});
                break;
        }
    }
    return out;
}

bool Formula::operator==(const Formula& o) const noexcept {
    std::vector<std::pair<const Formula*, const Formula*>> work{{this, &o}};
    while (!work.empty()) {
        auto [a, b] = work.back();
        work.pop_back();
        if (a->kind_ != b->kind_ || a->name_ != b->name_) return false;
        for (int i = 0; i < 2; ++i) {
            const Formula* ca = a->children_[i].get();
            const Formula* cb = b->children_[i].get();
            if ((ca == nullptr) != (cb == nullptr)) return false;
            if (ca != nullptr) work.emplace_back(ca, cb);
        }
    }
    return true;
}

// ── FormulaHash ─────────────────────────────────────────────────────────────
// Mixes the pre-order sequence of kinds and names.  Arities are fixed by the
// kind, so equal sequences mean equal trees.

std::size_t FormulaHash::operator()(const Formula& f) const noexcept {
    std::size_t h = 0;
    std::vector<const Formula*> work{&f};
    while (!work.empty()) {
        const Formula* n = work.back();
        work.pop_back();
        h ^= static_cast<std::size_t>(n->kind()) + 0x9e3779b9 + (h << 6) + (h >> 2);
        switch (n->kind()) {
            case NodeKind::Var:
                h ^= std::hash<std::string>{}(n->name()) + 0x9e3779b9 + (h << 6) + (h >> 2);
                break;
            case NodeKind::Not:
                work.push_back(&n->operand());
                break;
            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
                work.push_back(&n->rhs());
                work.push_back(&n->lhs());
                break;
        }
    }
    return h;
}

// ── FormulaNode equality ────────────────────────────────────────────────────

bool FormulaNode::operator==(const FormulaNode& o) const noexcept {
    return kind == o.kind &&
           var_name == o.var_name &&
           children[0] == o.children[0] &&
           children[1] == o.children[1];
}

// ── FormulaNodeHash ─────────────────────────────────────────────────────────
// Combine kind, var_name, and children via FNV-like mixing.

std::size_t FormulaNodeHash::operator()(const FormulaNode& n) const noexcept {
    std::size_t h = static_cast<std::size_t>(n.kind);
    h ^= std::hash<std::string>{}(n.var_name) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[0]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    h ^= std::hash<FormulaId>{}(n.children[1]) + 0x9e3779b9 + (h << 6) + (h >> 2);
    return h;
}

// ============================================================================
// FormulaFactory
// ============================================================================

FormulaId FormulaFactory::intern_node(FormulaNode node) {
    // Check if a structurally identical node already exists.
    auto it = intern_.find(node);
    if (it != intern_.end()) {
        return it->second;
    }
    // Allocate a new id (index into nodes_).
    FormulaId id = static_cast<FormulaId>(nodes_.size());
    nodes_.push_back(std::move(node));
    intern_[nodes_.back()] = id;
    return id;
}

FormulaId FormulaFactory::make_var(const std::string& name) {
    FormulaNode n;
    n.kind = NodeKind::Var;
    n.var_name = name;
    return intern_node(std::move(n));
}

FormulaId FormulaFactory::make_not(FormulaId child) {
    FormulaNode n;
    n.kind = NodeKind::Not;
    n.children[0] = child;
    return intern_node(std::move(n));
}

FormulaId FormulaFactory::make_binary(NodeKind kind, FormulaId lhs, FormulaId rhs) {
    FormulaNode n;
    n.kind = kind;
    n.children[0] = lhs;
    n.children[1] = rhs;
    return intern_node(std::move(n));
}

FormulaId FormulaFactory::make_and(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::And, lhs, rhs);
}

FormulaId FormulaFactory::make_or(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Or, lhs, rhs);
}

FormulaId FormulaFactory::make_implies(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Implies, lhs, rhs);
}

FormulaId FormulaFactory::make_iff(FormulaId lhs, FormulaId rhs) {
    return make_binary(NodeKind::Iff, lhs, rhs);
}

// Post-order worklist: operands are interned before the node that uses them,
// their ids wait on `ids` until the node is revisited.
FormulaId FormulaFactory::intern(const Formula& formula) {
    std::vector<std::pair<const Formula*, bool>> work{{&formula, false}};
    std::vector<FormulaId> ids;

    while (!work.empty()) {
        auto [f, ready] = work.back();
        work.pop_back();

        switch (f->kind()) {
            case NodeKind::Var:
                ids.push_back(make_var(f->name()));
                break;

            case NodeKind::Not:
                if (!ready) {
                    work.emplace_back(f, true);
                    work.emplace_back(&f->operand(), false);
                } else {
                    ids.back() = make_not(ids.back());
                }
                break;

            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
                if (!ready) {
                    work.emplace_back(f, true);
                    work.emplace_back(&f->rhs(), false);
                    work.emplace_back(&f->lhs(), false);
                } else {
                    FormulaId rhs = ids.back();
                    ids.pop_back();
                    ids.back() = make_binary(f->kind(), ids.back(), rhs);
                }
                break;
        }
    }
    return ids.back();
}

const FormulaNode& FormulaFactory::node(FormulaId id) const {
    if (id >= nodes_.size()) {
        throw std::out_of_range("FormulaFactory::node: invalid id " +
                                std::to_string(id));
    }
    return nodes_[id];
}

std::size_t FormulaFactory::size() const noexcept {
    return nodes_.size();
}

Formula FormulaFactory::to_formula(FormulaId id) const {
    std::vector<std::pair<FormulaId, bool>> work{{id, false}};
    std::vector<Formula> built;

    while (!work.empty()) {
        auto [cur, ready] = work.back();
        work.pop_back();
        const FormulaNode& n = node(cur);

        if (n.kind == NodeKind::Var) {
            built.push_back(Formula::var(n.var_name));
        } else if (!ready) {
            work.emplace_back(cur, true);
            if (n.kind != NodeKind::Not) work.emplace_back(n.children[1], false);
            work.emplace_back(n.children[0], false);
        } else if (n.kind == NodeKind::Not) {
            built.back() = Formula::negation(std::move(built.back()));
        } else {
            Formula rhs = std::move(built.back());
            built.pop_back();
            built.back() = Formula::binary(n.kind, std::move(built.back()), std::move(rhs));
        }
    }
    return std::move(built.back());
}

// ── Pretty-printing ─────────────────────────────────────────────────────────
// Same piece-stack walk as Formula::to_string(); kInvalidId marks text.

std::string FormulaFactory::to_string(FormulaId id) const {
    std::vector<std::pair<FormulaId, const char*>> work{{id, nullptr}};
    std::string out;

    while (!work.empty()) {
        auto [cur, text] = work.back();
        work.pop_back();
        if (cur == kInvalidId) {
            out += text;
            continue;
        }
        const FormulaNode& n = node(cur);
        switch (n.kind) {
            case NodeKind::Var:
                out += n.var_name;
                break;
            case NodeKind::Not:
                out += '-';
                work.emplace_back(n.children[0], nullptr);
                break;
            case NodeKind::And:
            case NodeKind::Or:
            case NodeKind::Implies:
            case NodeKind::Iff:
                out += '(';
                work.emplace_back(kInvalidId, ")");
                work.emplace_back(n.children[1], nullptr);
                work.emplace_back(kInvalidId, node_kind_name(n.kind));
                work.emplace_back(n.children[0], nullptr);
                break;
        }
    }
    return out;
}

}  // namespace tabsat
