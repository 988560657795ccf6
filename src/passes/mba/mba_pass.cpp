/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_pass.cpp - Expression complication over function bodies
 */

#include "mba_pass.hpp"

#include "../../ast/ast_walk.hpp"

namespace cloak {
namespace mba {

using namespace ast;

namespace {

int nodeCount(const Expr& e) {
    int n = 1;
    for (const auto& a : e.args) n += nodeCount(a);
    return n;
}

bool integerOperand(const Expr& e) {
    return e.type && decay(*e.type).isInteger();
}

} // namespace

ExpressionComplicator::ExpressionComplicator() {
    transforms_[BinaryOp::Add] = std::make_unique<MBAAdd>();
    transforms_[BinaryOp::Sub] = std::make_unique<MBASub>();
    transforms_[BinaryOp::BitXor] = std::make_unique<MBAXor>();
    transforms_[BinaryOp::BitAnd] = std::make_unique<MBAAnd>();
    transforms_[BinaryOp::BitOr] = std::make_unique<MBAOr>();
    transforms_[BinaryOp::Mul] = std::make_unique<MBAMult>();
}

void ExpressionComplicator::setOperationEnabled(BinaryOp op, bool enabled) {
    if (!enabled) {
        transforms_.erase(op);
        return;
    }
    if (transforms_.count(op)) return;
    switch (op) {
        case BinaryOp::Add: transforms_[op] = std::make_unique<MBAAdd>(); break;
        case BinaryOp::Sub: transforms_[op] = std::make_unique<MBASub>(); break;
        case BinaryOp::BitXor: transforms_[op] = std::make_unique<MBAXor>(); break;
        case BinaryOp::BitAnd: transforms_[op] = std::make_unique<MBAAnd>(); break;
        case BinaryOp::BitOr: transforms_[op] = std::make_unique<MBAOr>(); break;
        case BinaryOp::Mul: transforms_[op] = std::make_unique<MBAMult>(); break;
        default: break;
    }
}

bool ExpressionComplicator::eligible(const Expr& e) const {
    if (e.kind != ExprKind::Binary || !transforms_.count(e.bop)) return false;
    if (!e.type || !e.type->isWordInteger()) return false;

    const Expr& l = e.lhs();
    const Expr& r = e.rhs();
    if (!integerOperand(l) || !integerOperand(r)) return false;
    if (l.isLiteral() && r.isLiteral()) return false;
    if (hasSideEffects(l) || hasSideEffects(r)) return false;
    return nodeCount(l) <= config_.max_operand_nodes && nodeCount(r) <= config_.max_operand_nodes;
}

int ExpressionComplicator::complicate(Expr& e, Random& rng) {
    if (!config_.enabled || e.kind == ExprKind::SizeOf) return 0;

    // decided on the original operands, before they are rewritten
    bool rewrite = eligible(e) && rng.decide(config_.probability);

    int n = 0;
    for (auto& a : e.args) n += complicate(a, rng);
    if (!rewrite) return n;

    const MBATransformation& t = *transforms_.at(e.bop);
    Type result = withoutConst(*e.type);
    Type uint = Type::intType(true);

    Expr a = make::cast(uint, std::move(e.args[0]));
    Expr b = make::cast(uint, std::move(e.args[1]));
    Expr rewritten = t.apply(t.selectVariant(config_, rng), a, b);
    if (!result.is_unsigned || result.kind != TypeKind::Int) {
        rewritten = make::cast(result, std::move(rewritten));
    }

    SourceLoc loc = e.loc;
    e = std::move(rewritten);
    e.loc = loc;
    applied_[t.getName()]++;
    return n + 1;
}

TransformResult ExpressionComplicationPass::transformFunction(Function& f, CompileContext& ctx) {
    int n = 0;
    // static initializers must stay constant expressions
    visitBlockStmts(f.body, [&](Stmt& s) {
        if (s.decl && s.decl->init && !s.decl->is_static) {
            n += complicator_.complicate(*s.decl->init, ctx.rng());
        }
        if (s.expr) n += complicator_.complicate(*s.expr, ctx.rng());
        if (s.step) n += complicator_.complicate(*s.step, ctx.rng());
    });

    if (n == 0) return TransformResult::NotApplicable;
    incrementStat("expressions_complicated", n);
    logger_.debug("{}: complicated {} expressions", f.name, n);
    return TransformResult::Success;
}

} // namespace mba
} // namespace cloak
