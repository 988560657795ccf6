/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_sub.hpp - MBA transformation for subtraction operations
 *
 * Mathematical identities for a - b:
 *   Variant 0: (a ^ b) - 2 * (~a & b)
 *   Variant 1: (a | ~b) - (~a | b)
 *   Variant 2: a + (~b + 1)  [two's complement]
 *   Variant 3: ~(~a + b)     [complement identity]
 *   Variant 4: (a & ~b) - (~a & b)  [diff of exclusive bits]
 */

#ifndef CLOAK_MBA_SUB_HPP
#define CLOAK_MBA_SUB_HPP

#include "mba_base.hpp"

namespace cloak {
namespace mba {

class MBASub : public MBATransformation {
public:
    MBASub() : MBATransformation("MBA_SUB") {}

    std::string getName() const override { return "MBA_SUB"; }
    ast::BinaryOp getOperation() const override { return ast::BinaryOp::Sub; }

    std::vector<MBAVariant> getVariants() const override {
        return {
            MBAVariant("xor_not_and", "(a ^ b) - 2 * (~a & b)", 0.25),
            MBAVariant("or_complement", "(a | ~b) - (~a | b)", 0.2),
            MBAVariant("twos_complement", "a + (~b + 1)", 0.2),
            MBAVariant("not_add", "~(~a + b)", 0.2),
            MBAVariant("diff_exclusive", "(a & ~b) - (~a & b)", 0.15)
        };
    }

    ast::Expr apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const override;
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_SUB_HPP
