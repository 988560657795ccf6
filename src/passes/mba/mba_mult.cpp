/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_mult.cpp - MBA transformation for multiplication operations
 */

#include "mba_mult.hpp"

#include "../../ast/const_eval.hpp"

#include <optional>

namespace cloak {
namespace mba {

using namespace ops;

namespace {

// literal value under any number of casts
std::optional<uint32_t> literalOperand(const ast::Expr& e) {
    if (e.isLiteral()) return ast::literalBits(e);
    if (e.kind == ast::ExprKind::Cast) return literalOperand(e.operand());
    return std::nullopt;
}

int log2Exact(uint32_t v) {
    if (v == 0 || (v & (v - 1)) != 0) return -1;
    int n = 0;
    while (v > 1) {
        v >>= 1;
        n++;
    }
    return n;
}

} // namespace

ast::Expr MBAMult::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    if (variant == 3) {
        auto k = literalOperand(b);
        int n = k ? log2Exact(*k) : -1;
        if (n >= 0) {
            return bin(ast::BinaryOp::Shl, a, ast::make::uintLit(static_cast<uint32_t>(n)));
        }
        variant = 0;
    }

    switch (variant) {
        case 0:
            return add(mul(band(a, b), bor(a, b)), mul(band(a, bnot(b)), band(bnot(a), b)));
        case 1:
            return sub(sub(sub(mul(bnot(a), bnot(b)), a), b), one());
        default:
            return add(mul(a, sub(b, one())), a);
    }
}

} // namespace mba
} // namespace cloak
