/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_add.cpp - MBA transformation for addition operations
 *
 * Mathematical identities used:
 *   a + b = (a ^ b) + 2*(a & b)
 *   a + b = (a | b) + (a & b)
 *   a + b = 2*(a | b) - (a ^ b)
 *   a + b = a - (~b + 1)  [negate via two's complement]
 *   a + b = ~(~a - b)     [complement identity]
 *   a + b = ((a ^ b) | (a & b)) + (a & b)
 */

#include "mba_add.hpp"

namespace cloak {
namespace mba {

using namespace ops;

ast::Expr MBAAdd::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    switch (variant) {
        case 0:
            return add(bxor(a, b), mul(two(), band(a, b)));
        case 1:
            return add(bor(a, b), band(a, b));
        case 2:
            return sub(mul(two(), bor(a, b)), bxor(a, b));
        case 3:
            return sub(a, add(bnot(b), one()));
        case 4:
            return bnot(sub(bnot(a), b));
        case 5:
            return add(bor(bxor(a, b), band(a, b)), band(a, b));
        default:
            return add(bxor(a, b), shl1(band(a, b)));
    }
}

} // namespace mba
} // namespace cloak
