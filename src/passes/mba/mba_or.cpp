/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_or.cpp - MBA transformation for OR operations
 */

#include "mba_or.hpp"

namespace cloak {
namespace mba {

using namespace ops;

ast::Expr MBAOr::apply(size_t variant, const ast::Expr& a, const ast::Expr& b) const {
    switch (variant) {
        case 0:
            return add(bxor(a, b), band(a, b));
        case 1:
            return sub(add(a, b), band(a, b));
        case 2:
            return bnot(band(bnot(a), bnot(b)));
        default:
            return add(band(a, bnot(b)), b);
    }
}

} // namespace mba
} // namespace cloak
