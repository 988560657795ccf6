/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_mult.hpp - MBA transformation for multiplication operations
 *
 * Multiplication is harder to transform with pure boolean algebra,
 * but these hold modulo 2^32:
 *   Variant 0: (a & b) * (a | b) + (a & ~b) * (~a & b)
 *   Variant 1: ~a * ~b - a - b - 1
 *   Variant 2: a * (b - 1) + a
 *   Variant 3: a << n when b is the constant 2^n (falls back to variant 0)
 */

#ifndef CLOAK_MBA_MULT_HPP
#define CLOAK_MBA_MULT_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBAMult : public MBATransformation {
public:
    MBAMult() : MBATransformation("MBA_MULT") {}

    std::string getName() const override { return "MBA_MULT"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::Mul; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("and_or_product", "(a & b) * (a | b) + (a & ~b) * (~a & b)", 0.35),
            MBAVariant("complement_product", "~a * ~b - a - b - 1", 0.25),
            MBAVariant("decrement", "a * (b - 1) + a", 0.2),
            MBAVariant("shift", "a << log2(b) [if b is a power of 2]", 0.2)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_MULT_HPP
