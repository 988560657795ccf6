/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_and.cpp - MBA transformation for AND operations
 */

#include "mba_and.hpp"

namespace cloak {
namespace mba {

using namespace ops;

ast::Expr MBAAnd::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    switch (variant) {
        case 0:
            return sub(add(a, b), bor(a, b));
        case 1:
            return bnot(bor(bnot(a), bnot(b)));
        case 2:
            return sub(bor(a, b), bxor(a, b));
        default:
            return band(bxor(a, bnot(b)), a);
    }
}

} // namespace mba
} // namespace cloak
