/*
 * mba_add.hpp - addition obfuscation
 *
 * a + b can be rewritten as:
 *   (a ^ b) + 2 * (a & b)
 *   (a | b) + (a & b)
 *   2 * (a | b) - (a ^ b)
 *   etc.
 */

#ifndef CLOAK_MBA_ADD_HPP
#define CLOAK_MBA_ADD_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBAAdd : public MBATransformation {
public:
    MBAAdd() : MBATransformation("MBA_ADD") {}

    std::string getName() const override { return "MBA_ADD"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::Add; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("xor_and", "(a ^ b) + 2 * (a & b)", 0.2),
            MBAVariant("or_and", "(a | b) + (a & b)", 0.15),
            MBAVariant("or_xor", "2 * (a | b) - (a ^ b)", 0.15),
            MBAVariant("twos_comp", "a - (~b + 1)", 0.1),
            MBAVariant("complement", "~(~a - b)", 0.1),
            MBAVariant("complex_or", "((a ^ b) | (a & b)) + (a & b)", 0.15),
            MBAVariant("xor_and_shift", "(a ^ b) + ((a & b) << 1)", 0.15)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_ADD_HPP
