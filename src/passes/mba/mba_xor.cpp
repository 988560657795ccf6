/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_xor.cpp - MBA transformation for XOR operations
 */

#include "mba_xor.hpp"

namespace cloak {
namespace mba {

using namespace ops;

ast::Expr MBAXor::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    switch (variant) {
        case 0:
            return sub(bor(a, b), band(a, b));
        case 1:
            return bor(band(a, bnot(b)), band(bnot(a), b));
        case 2:
            return sub(add(a, b), mul(two(), band(a, b)));
        default:
            return band(bnot(band(a, b)), bor(a, b));
    }
}

} // namespace mba
} // namespace cloak
