/*
 * mba_and.hpp - and obfuscation
 *
 * a & b == (a + b) - (a | b) == ~(~a | ~b)
 */

#ifndef CLOAK_MBA_AND_HPP
#define CLOAK_MBA_AND_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBAAnd : public MBATransformation {
public:
    MBAAnd() : MBATransformation("MBA_AND") {}

    std::string getName() const override { return "MBA_AND"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::BitAnd; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("add_minus_or", "(a + b) - (a | b)", 0.3),
            MBAVariant("de_morgan", "~(~a | ~b)", 0.25),
            MBAVariant("or_minus_xor", "(a | b) - (a ^ b)", 0.25),
            MBAVariant("xnor_mask", "(a ^ ~b) & a", 0.2)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_AND_HPP
