/*
 * mba_xor.hpp - xor obfuscation
 *
 * a ^ b == (a | b) - (a & b) == (a + b) - 2 * (a & b)
 */

#ifndef CLOAK_MBA_XOR_HPP
#define CLOAK_MBA_XOR_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBAXor : public MBATransformation {
public:
    MBAXor() : MBATransformation("MBA_XOR") {}

    std::string getName() const override { return "MBA_XOR"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::BitXor; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("or_minus_and", "(a | b) - (a & b)", 0.3),
            MBAVariant("and_not_or", "(a & ~b) | (~a & b)", 0.25),
            MBAVariant("add_minus_and", "(a + b) - 2 * (a & b)", 0.25),
            MBAVariant("nand_and_or", "~(a & b) & (a | b)", 0.2)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_XOR_HPP
