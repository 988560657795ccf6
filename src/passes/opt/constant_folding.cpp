/**
 * Cloak - Obfuscating C Compiler
 *
 * constant_folding.cpp - Literal arithmetic at compile time
 */

#include "constant_folding.hpp"

#include "../../ast/ast_walk.hpp"
#include "../../ast/const_eval.hpp"

namespace cloak {
namespace opt {

using namespace ast;

namespace {

// promoted type of a literal operand; falls back to the literal's own flag
Type literalType(const Expr& lit) {
    if (lit.type) return promote(*lit.type);
    return Type::intType(lit.kind == ExprKind::IntLiteral && lit.is_unsigned);
}

void replaceWithLiteral(Expr& e, uint32_t bits, bool is_unsigned) {
    SourceLoc loc = e.loc;
    int64_t value = is_unsigned ? static_cast<int64_t>(bits)
                                : static_cast<int64_t>(static_cast<int32_t>(bits));
    e = make::intLit(value, is_unsigned);
    e.loc = loc;
    e.type = Type::intType(is_unsigned);
}

bool isFoldableUnary(UnaryOp op) {
    return op == UnaryOp::Plus || op == UnaryOp::Neg ||
           op == UnaryOp::Not || op == UnaryOp::BitNot;
}

} // namespace

int ConstantFolder::fold(Expr& e) const {
    if (e.kind == ExprKind::SizeOf) return 0;
    int n = 0;
    for (auto& a : e.args) n += fold(a);
    if (foldNode(e)) n++;
    return n;
}

int ConstantFolder::foldBlock(Block& block) const {
    int n = 0;
    visitBlockExprRoots(block, [&](Expr& root) { n += fold(root); });
    return n;
}

bool ConstantFolder::foldNode(Expr& e) const {
    switch (e.kind) {
        case ExprKind::Unary: {
            const Expr& o = e.operand();
            if (!isFoldableUnary(e.uop) || !o.isLiteral()) return false;
            Type t = literalType(o);
            uint32_t bits = evalUnary32(e.uop, literalBits(o));
            replaceWithLiteral(e, bits, e.uop == UnaryOp::Not ? false : t.is_unsigned);
            return true;
        }

        case ExprKind::Binary: {
            const Expr& l = e.lhs();
            const Expr& r = e.rhs();
            BinaryOp op = e.bop;

            if ((op == BinaryOp::LogAnd || op == BinaryOp::LogOr) && l.isLiteral()) {
                bool lz = literalBits(l) == 0;
                // the right operand is never evaluated
                if (op == BinaryOp::LogAnd && lz) {
                    replaceWithLiteral(e, 0, false);
                    return true;
                }
                if (op == BinaryOp::LogOr && !lz) {
                    replaceWithLiteral(e, 1, false);
                    return true;
                }
            }
            if (!l.isLiteral() || !r.isLiteral()) return false;

            Type lt = literalType(l);
            Type rt = literalType(r);
            bool shift = op == BinaryOp::Shl || op == BinaryOp::Shr;
            bool uns = shift ? lt.is_unsigned : commonType(lt, rt).is_unsigned;
            auto v = evalBinary32(op, literalBits(l), literalBits(r), uns);
            if (!v) return false;
            bool logical = isComparison(op) || op == BinaryOp::LogAnd || op == BinaryOp::LogOr;
            replaceWithLiteral(e, *v, logical ? false : uns);
            return true;
        }

        case ExprKind::Cast: {
            if (!e.target_type.isInteger() || !e.operand().isLiteral()) return false;
            uint32_t bits = convertTo(e.target_type, literalBits(e.operand()));
            replaceWithLiteral(e, bits, promote(e.target_type).is_unsigned);
            return true;
        }

        case ExprKind::Ternary: {
            if (!e.cond().isLiteral()) return false;
            Expr chosen = literalBits(e.cond()) != 0 ? e.args[1] : e.args[2];
            if (e.type && e.type->isScalar()) {
                bool same = chosen.type && sameType(decay(*chosen.type), *e.type);
                if (!same) {
                    chosen = make::cast(*e.type, std::move(chosen));
                    foldNode(chosen);
                }
            }
            e = std::move(chosen);
            return true;
        }

        default:
            return false;
    }
}

TransformResult ConstantFoldingPass::transformFunction(Function& f, CompileContext&) {
    int n = folder_.foldBlock(f.body);
    if (n == 0) return TransformResult::NotApplicable;
    incrementStat("expressions_folded", n);
    logger_.debug("{}: folded {} expressions", f.name, n);
    return TransformResult::Success;
}

} // namespace opt
} // namespace cloak
