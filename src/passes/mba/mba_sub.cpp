/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_sub.cpp - MBA transformation for subtraction operations
 */

#include "mba_sub.hpp"

namespace cloak {
namespace mba {

using namespace ops;

ast::Expr MBASub::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    switch (variant) {
        case 0:
            return sub(bxor(a, b), mul(two(), band(bnot(a), b)));
        case 1:
            return sub(bor(a, bnot(b)), bor(bnot(a), b));
        case 2:
            return add(a, add(bnot(b), one()));
        case 3:
            return bnot(add(bnot(a), b));
        default:
            return sub(band(a, bnot(b)), band(bnot(a), b));
    }
}

} // namespace mba
} // namespace cloak
