/*
 * mba_or.hpp - or obfuscation
 *
 * a | b == (a ^ b) + (a & b) == (a + b) - (a & b)
 */

#ifndef CLOAK_MBA_OR_HPP
#define CLOAK_MBA_OR_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBAOr : public MBATransformation {
public:
    MBAOr() : MBATransformation("MBA_OR") {}

    std::string getName() const override { return "MBA_OR"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::BitOr; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("xor_plus_and", "(a ^ b) + (a & b)", 0.3),
            MBAVariant("add_minus_and", "(a + b) - (a & b)", 0.25),
            MBAVariant("de_morgan", "~(~a & ~b)", 0.25),
            MBAVariant("and_not_plus", "(a & ~b) + b", 0.2)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_OR_HPP
