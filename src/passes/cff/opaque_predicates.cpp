/**
 * Cloak - Obfuscating C Compiler
 *
 * opaque_predicates.cpp - Predicate library
 */

#include "opaque_predicates.hpp"

namespace cloak {
namespace cff {

using namespace ast;

namespace predicates {

Expr bin(BinaryOp op, Expr a, Expr b) { return make::binary(op, std::move(a), std::move(b)); }
Expr u(uint32_t v) { return make::uintLit(v); }

// (x * (x + 1)) & 1 == 0 -- consecutive ints multiply to even
Expr evenProduct(const Expr& x, const Expr&) {
    Expr prod = bin(BinaryOp::Mul, x, bin(BinaryOp::Add, x, u(1)));
    return bin(BinaryOp::Eq, bin(BinaryOp::BitAnd, std::move(prod), u(1)), u(0));
}

// x ^ x == 0 always
Expr xorSelfZero(const Expr& x, const Expr&) {
    return bin(BinaryOp::Eq, bin(BinaryOp::BitXor, x, x), u(0));
}

// x & ~x == 0 always
Expr andNotSelf(const Expr& x, const Expr&) {
    return bin(BinaryOp::Eq, bin(BinaryOp::BitAnd, x, make::unary(UnaryOp::BitNot, x)), u(0));
}

Expr orSelf(const Expr& x, const Expr&) {
    return bin(BinaryOp::Eq, bin(BinaryOp::BitOr, x, x), x);
}

// (x | y) >= (x & y) always, unsigned
Expr orGeqAnd(const Expr& x, const Expr& y) {
    return bin(BinaryOp::Ge, bin(BinaryOp::BitOr, x, y), bin(BinaryOp::BitAnd, x, y));
}

// ((x & y) | (x ^ y)) == (x | y) -- boolean identity
Expr booleanIdentity(const Expr& x, const Expr& y) {
    Expr lhs = bin(BinaryOp::BitOr, bin(BinaryOp::BitAnd, x, y), bin(BinaryOp::BitXor, x, y));
    return bin(BinaryOp::Eq, std::move(lhs), bin(BinaryOp::BitOr, x, y));
}

// 2*(x&y) + (x^y) == x+y -- the MBA identity
Expr mbaIdentity(const Expr& x, const Expr& y) {
    Expr lhs = bin(BinaryOp::Add, bin(BinaryOp::Mul, u(2), bin(BinaryOp::BitAnd, x, y)),
                   bin(BinaryOp::BitXor, x, y));
    return bin(BinaryOp::Eq, std::move(lhs), bin(BinaryOp::Add, x, y));
}

// squares are 0 or 1 mod 4
Expr squareMod4(const Expr& x, const Expr&) {
    return bin(BinaryOp::Lt, bin(BinaryOp::BitAnd, bin(BinaryOp::Mul, x, x), u(3)), u(2));
}

// always-false variants

Expr oddProduct(const Expr& x, const Expr&) {
    Expr prod = bin(BinaryOp::Mul, x, bin(BinaryOp::Add, x, u(1)));
    return bin(BinaryOp::Ne, bin(BinaryOp::BitAnd, std::move(prod), u(1)), u(0));
}

Expr xorSelfNonZero(const Expr& x, const Expr&) {
    return bin(BinaryOp::Ne, bin(BinaryOp::BitXor, x, x), u(0));
}

Expr andNotSelfNonZero(const Expr& x, const Expr&) {
    return bin(BinaryOp::Ne, bin(BinaryOp::BitAnd, x, make::unary(UnaryOp::BitNot, x)), u(0));
}

// (x|y) < (x&y) never
Expr orLtAnd(const Expr& x, const Expr& y) {
    return bin(BinaryOp::Lt, bin(BinaryOp::BitOr, x, y), bin(BinaryOp::BitAnd, x, y));
}

Expr squareMod4Three(const Expr& x, const Expr&) {
    return bin(BinaryOp::Eq, bin(BinaryOp::BitAnd, bin(BinaryOp::Mul, x, x), u(3)), u(3));
}

} // namespace predicates

OpaquePredicateLibrary::OpaquePredicateLibrary() {
    initializePredicates();
}

void OpaquePredicateLibrary::initializePredicates() {
    using PT = PredicateType;
    predicates_ = {
        {"even_product", PT::AlwaysTrue, "(x * (x + 1)) & 1 == 0", false, predicates::evenProduct},
        {"xor_self_zero", PT::AlwaysTrue, "(x ^ x) == 0", true, predicates::xorSelfZero},
        {"and_not_self", PT::AlwaysTrue, "(x & ~x) == 0", true, predicates::andNotSelf},
        {"or_self", PT::AlwaysTrue, "(x | x) == x", true, predicates::orSelf},
        {"or_geq_and", PT::AlwaysTrue, "(x | y) >= (x & y)", false, predicates::orGeqAnd},
        {"boolean_identity", PT::AlwaysTrue, "((x & y) | (x ^ y)) == (x | y)", false,
         predicates::booleanIdentity},
        {"mba_identity", PT::AlwaysTrue, "2 * (x & y) + (x ^ y) == x + y", false,
         predicates::mbaIdentity},
        {"square_mod4", PT::AlwaysTrue, "((x * x) & 3) < 2", false, predicates::squareMod4},

        {"odd_product", PT::AlwaysFalse, "(x * (x + 1)) & 1 != 0", false, predicates::oddProduct},
        {"xor_self_nonzero", PT::AlwaysFalse, "(x ^ x) != 0", true, predicates::xorSelfNonZero},
        {"and_not_self_nonzero", PT::AlwaysFalse, "(x & ~x) != 0", true,
         predicates::andNotSelfNonZero},
        {"or_lt_and", PT::AlwaysFalse, "(x | y) < (x & y)", false, predicates::orLtAnd},
        {"square_mod4_three", PT::AlwaysFalse, "((x * x) & 3) == 3", false,
         predicates::squareMod4Three},
    };

    for (size_t i = 0; i < predicates_.size(); i++) {
        if (predicates_[i].type == PT::AlwaysTrue) {
            true_indices_.push_back(i);
        } else {
            false_indices_.push_back(i);
        }
    }
}

const OpaquePredicate* OpaquePredicateLibrary::getByName(const std::string& name) const {
    for (const auto& p : predicates_) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

Expr OpaquePredicateLibrary::instantiate(const OpaquePredicate& p, const Expr& var,
                                         uint32_t y) const {
    Expr x = make::cast(Type::intType(true), var);
    return p.generator(x, make::uintLit(y));
}

Expr OpaquePredicateLibrary::pick(PredicateType type, const Expr& var,
                                  PredicateComplexity complexity, Random& rng) const {
    const auto& indices = type == PredicateType::AlwaysTrue ? true_indices_ : false_indices_;
    std::vector<size_t> pool;
    for (size_t i : indices) {
        if (complexity != PredicateComplexity::Low || predicates_[i].simple) pool.push_back(i);
    }
    const OpaquePredicate& p = predicates_[rng.choose(pool)];
    return instantiate(p, var, rng.nextUint32());
}

Expr OpaquePredicateLibrary::generateAlwaysTrue(const Expr& var, PredicateComplexity complexity,
                                                Random& rng) const {
    Expr p = pick(PredicateType::AlwaysTrue, var, complexity, rng);
    if (complexity != PredicateComplexity::High) return p;
    Expr q = pick(PredicateType::AlwaysTrue, var, complexity, rng);
    return make::binary(BinaryOp::LogAnd, std::move(p), std::move(q));
}

Expr OpaquePredicateLibrary::generateAlwaysFalse(const Expr& var, PredicateComplexity complexity,
                                                 Random& rng) const {
    Expr p = pick(PredicateType::AlwaysFalse, var, complexity, rng);
    if (complexity != PredicateComplexity::High) return p;
    Expr q = pick(PredicateType::AlwaysFalse, var, complexity, rng);
    return make::binary(BinaryOp::LogOr, std::move(p), std::move(q));
}

} // namespace cff
} // namespace cloak
