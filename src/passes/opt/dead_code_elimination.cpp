/**
 * Cloak - Obfuscating C Compiler
 *
 * dead_code_elimination.cpp - Unreachable statements and unread locals
 */

#include "dead_code_elimination.hpp"

#include "../../ast/const_eval.hpp"

namespace cloak {
namespace opt {

using namespace ast;

namespace {

using ReadMap = std::unordered_map<BindingKey, int, BindingKeyHash>;

bool isIncDec(UnaryOp op) {
    return op == UnaryOp::PreInc || op == UnaryOp::PreDec ||
           op == UnaryOp::PostInc || op == UnaryOp::PostDec;
}

bool isJump(StmtKind k) {
    return k == StmtKind::Return || k == StmtKind::Break || k == StmtKind::Continue;
}

// a write whose value is discarded is not a read of its target
void countReads(const Expr& e, bool discarded, ReadMap& reads) {
    switch (e.kind) {
        case ExprKind::Identifier:
            if (isLocalRef(e)) reads[bindingOf(e)]++;
            return;
        case ExprKind::Assign: {
            const Expr& target = e.lhs();
            bool write_only = target.kind == ExprKind::Identifier && (!e.assign_op || discarded);
            if (!write_only) countReads(target, false, reads);
            countReads(e.rhs(), false, reads);
            return;
        }
        case ExprKind::Unary:
            if (isIncDec(e.uop) && discarded && e.operand().kind == ExprKind::Identifier) return;
            break;
        default:
            break;
    }
    for (const auto& a : e.args) countReads(a, false, reads);
}

} // namespace

DceCounts DeadCodeEliminator::run(Function& f) {
    counts_ = DceCounts();
    for (int i = 0; i < kMaxRounds; i++) {
        if (!round(f)) break;
    }
    return counts_;
}

bool DeadCodeEliminator::round(Function& f) {
    findDeadLocals(f);
    bool changed = false;
    processBlock(f.body, changed);
    if (!dead_.empty()) {
        visitBlockExprRoots(f.body, [&](Expr& root) { stripDeadAssignments(root, changed); });
    }
    return changed;
}

void DeadCodeEliminator::findDeadLocals(const Function& f) {
    local_types_.clear();
    dead_.clear();

    ReadMap reads;
    visitBlockStmts(f.body, [&](const Stmt& s) {
        switch (s.kind) {
            case StmtKind::Decl:
                local_types_[bindingOf(*s.decl)] = s.decl->type;
                if (s.decl->init) countReads(*s.decl->init, false, reads);
                break;
            case StmtKind::Expr:
                countReads(*s.expr, true, reads);
                break;
            case StmtKind::For:
                if (s.expr) countReads(*s.expr, false, reads);
                if (s.step) countReads(*s.step, true, reads);
                break;
            default:
                if (s.expr) countReads(*s.expr, false, reads);
                break;
        }
    });

    for (const auto& [key, type] : local_types_) {
        auto it = reads.find(key);
        if (it == reads.end() || it->second == 0) dead_.insert(key);
    }
}

bool DeadCodeEliminator::isDeadTarget(const Expr& e) const {
    return isLocalRef(e) && dead_.count(bindingOf(e)) != 0;
}

void DeadCodeEliminator::stripDeadAssignments(Expr& e, bool& changed) {
    for (auto& a : e.args) stripDeadAssignments(a, changed);
    if (e.kind != ExprKind::Assign || e.assign_op || !isDeadTarget(e.lhs())) return;

    // the value of the assignment is the converted right-hand side
    const Type& t = local_types_.at(bindingOf(e.lhs()));
    Expr rhs = std::move(e.args[1]);
    if (t.isScalar()) {
        e = make::cast(withoutConst(t), std::move(rhs));
    } else {
        e = std::move(rhs);
    }
    changed = true;
}

bool DeadCodeEliminator::reduceStatementExpr(Expr& root, std::optional<Expr>& out, bool& changed) {
    if (root.kind == ExprKind::Assign && isDeadTarget(root.lhs())) {
        Expr rhs = std::move(root.args[1]);
        changed = true;
        if (hasSideEffects(rhs)) {
            stripDeadAssignments(rhs, changed);
            out = std::move(rhs);
        } else {
            out.reset();
        }
        return true;
    }
    if (root.kind == ExprKind::Unary && isIncDec(root.uop) && isDeadTarget(root.operand())) {
        changed = true;
        out.reset();
        return true;
    }
    return false;
}

void DeadCodeEliminator::processBlock(Block& block, bool& changed) {
    Block out;
    bool terminated = false;

    for (auto& s : block) {
        if (terminated) {
            counts_.statements_removed++;
            changed = true;
            continue;
        }

        switch (s.kind) {
            case StmtKind::If:
                processBlock(s.body, changed);
                processBlock(s.else_body, changed);
                break;
            case StmtKind::While:
            case StmtKind::DoWhile:
            case StmtKind::Compound:
                processBlock(s.body, changed);
                break;
            case StmtKind::For:
                processBlock(s.init, changed);
                processBlock(s.body, changed);
                if (s.step) {
                    std::optional<Expr> reduced;
                    if (reduceStatementExpr(*s.step, reduced, changed)) s.step = std::move(reduced);
                }
                break;
            case StmtKind::Switch:
                for (auto& c : s.cases) processBlock(c.body, changed);
                break;
            default:
                break;
        }

        switch (s.kind) {
            case StmtKind::If:
                if (s.expr->isLiteral()) {
                    Block taken = literalBits(*s.expr) != 0 ? std::move(s.body) : std::move(s.else_body);
                    counts_.branches_folded++;
                    changed = true;
                    if (!taken.empty()) out.push_back(make::compound(std::move(taken)));
                    continue;
                }
                break;
            case StmtKind::While:
                if (s.expr->isLiteral() && literalBits(*s.expr) == 0) {
                    counts_.branches_folded++;
                    changed = true;
                    continue;
                }
                break;
            case StmtKind::Decl:
                if (dead_.count(bindingOf(*s.decl))) {
                    counts_.variables_removed++;
                    changed = true;
                    if (s.decl->init) {
                        Expr& init = *s.decl->init;
                        if (init.kind == ExprKind::InitList) {
                            for (auto& el : init.args) {
                                if (hasSideEffects(el)) out.push_back(make::exprStmt(std::move(el)));
                            }
                        } else if (hasSideEffects(init)) {
                            out.push_back(make::exprStmt(std::move(init)));
                        }
                    }
                    continue;
                }
                break;
            case StmtKind::Expr: {
                std::optional<Expr> reduced;
                if (reduceStatementExpr(*s.expr, reduced, changed)) {
                    if (reduced) {
                        out.push_back(make::exprStmt(std::move(*reduced)));
                    } else {
                        counts_.statements_removed++;
                    }
                    continue;
                }
                break;
            }
            default:
                break;
        }

        bool jump = isJump(s.kind);
        out.push_back(std::move(s));
        if (jump) terminated = true;
    }

    block = std::move(out);
}

TransformResult DeadCodeEliminationPass::transformFunction(Function& f, CompileContext&) {
    DeadCodeEliminator dce;
    DceCounts counts = dce.run(f);
    if (counts.total() == 0) return TransformResult::NotApplicable;

    incrementStat("statements_removed", counts.statements_removed);
    incrementStat("variables_removed", counts.variables_removed);
    incrementStat("branches_folded", counts.branches_folded);
    logger_.debug("{}: removed {} statements, {} variables", f.name,
                  counts.statements_removed, counts.variables_removed);
    return TransformResult::Success;
}

} // namespace opt
} // namespace cloak
