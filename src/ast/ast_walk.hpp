/*
 * ast_walk.hpp
 *
 * generic traversal helpers over the program tree
 */

#ifndef CLOAK_AST_WALK_HPP
#define CLOAK_AST_WALK_HPP

#include "ast.hpp"

#include <functional>
#include <string>
#include <unordered_set>

namespace cloak {
namespace ast {

/**
 * Post-order over an expression tree
 */
template<typename E, typename F>
void visitExpr(E& e, F&& f) {
    for (auto& a : e.args) visitExpr(a, f);
    f(e);
}

/**
 * Calls f on every expression root in a statement tree (initializers,
 * expression statements, conditions, for steps). Case labels are skipped.
 */
template<typename S, typename F>
void visitStmtExprRoots(S& s, F&& f) {
    if (s.decl && s.decl->init) f(*s.decl->init);
    if (s.expr) f(*s.expr);
    if (s.step) f(*s.step);
    for (auto& c : s.init) visitStmtExprRoots(c, f);
    for (auto& c : s.body) visitStmtExprRoots(c, f);
    for (auto& c : s.else_body) visitStmtExprRoots(c, f);
    for (auto& sc : s.cases) {
        for (auto& c : sc.body) visitStmtExprRoots(c, f);
    }
}

template<typename B, typename F>
void visitBlockExprRoots(B& block, F&& f) {
    for (auto& s : block) visitStmtExprRoots(s, f);
}

/**
 * Post-order over every expression node in a block
 */
template<typename B, typename F>
void visitBlockExprs(B& block, F&& f) {
    visitBlockExprRoots(block, [&](auto& root) { visitExpr(root, f); });
}

/**
 * Pre-order over statements, including nested blocks
 */
template<typename S, typename F>
void visitStmt(S& s, F&& f) {
    f(s);
    for (auto& c : s.init) visitStmt(c, f);
    for (auto& c : s.body) visitStmt(c, f);
    for (auto& c : s.else_body) visitStmt(c, f);
    for (auto& sc : s.cases) {
        for (auto& c : sc.body) visitStmt(c, f);
    }
}

template<typename B, typename F>
void visitBlockStmts(B& block, F&& f) {
    for (auto& s : block) visitStmt(s, f);
}

/**
 * True if evaluating e may write memory, call a function or otherwise
 * be observable
 */
inline bool hasSideEffects(const Expr& e) {
    switch (e.kind) {
        case ExprKind::Assign:
        case ExprKind::Call:
            return true;
        case ExprKind::Unary:
            if (e.uop == UnaryOp::PreInc || e.uop == UnaryOp::PreDec ||
                e.uop == UnaryOp::PostInc || e.uop == UnaryOp::PostDec) {
                return true;
            }
            break;
        case ExprKind::SizeOf:
            return false;
        default:
            break;
    }
    for (const auto& a : e.args) {
        if (hasSideEffects(a)) return true;
    }
    return false;
}

/**
 * True if e may trap or read through a pointer: division, dereference,
 * indexing, arrow access. Such expressions are not duplicated.
 */
inline bool mayTrap(const Expr& e) {
    switch (e.kind) {
        case ExprKind::Binary:
            if (e.bop == BinaryOp::Div || e.bop == BinaryOp::Mod) return true;
            break;
        case ExprKind::Unary:
            if (e.uop == UnaryOp::Deref) return true;
            break;
        case ExprKind::Index:
            return true;
        case ExprKind::Member:
            if (e.arrow) return true;
            break;
        case ExprKind::SizeOf:
            return false;
        default:
            break;
    }
    for (const auto& a : e.args) {
        if (mayTrap(a)) return true;
    }
    return false;
}

inline bool containsCall(const Expr& e) {
    if (e.kind == ExprKind::Call) return true;
    for (const auto& a : e.args) {
        if (containsCall(a)) return true;
    }
    return false;
}

/**
 * Number of statements, counting nested ones (the inlining size measure)
 */
inline int countStatements(const Block& block) {
    int n = 0;
    visitBlockStmts(block, [&n](const Stmt& s) {
        if (s.kind != StmtKind::Compound) n++;
    });
    return n;
}

/**
 * A local binding: the declaring scope plus the name. Unique within a
 * function once the tree has been analyzed.
 */
struct BindingKey {
    int scope = -1;
    std::string name;

    bool operator==(const BindingKey& o) const { return scope == o.scope && name == o.name; }
};

struct BindingKeyHash {
    size_t operator()(const BindingKey& k) const {
        return std::hash<std::string>()(k.name) * 31u + static_cast<size_t>(k.scope);
    }
};

inline BindingKey bindingOf(const Expr& ident) { return {ident.scope_id, ident.text}; }
inline BindingKey bindingOf(const VarDecl& d) { return {d.scope_id, d.name}; }
inline BindingKey bindingOf(const Param& p) { return {p.scope_id, p.name}; }

inline bool isLocalRef(const Expr& e) {
    return e.kind == ExprKind::Identifier &&
           (e.storage == StorageKind::Local || e.storage == StorageKind::Param);
}

/**
 * Every identifier spelled anywhere in the program (declarations and uses)
 */
std::unordered_set<std::string> collectNames(const Program& program);

/**
 * Names visible at file scope: functions, globals, typedefs, enum constants
 */
std::unordered_set<std::string> collectGlobalNames(const Program& program);

} // namespace ast
} // namespace cloak

#endif // CLOAK_AST_WALK_HPP
