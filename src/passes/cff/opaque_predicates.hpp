/*
 * opaque_predicates.hpp
 *
 * conditions that always eval to true/false but look complex
 * e.g. (x * (x + 1)) & 1 == 0 is always true but a decompiler won't see that
 *
 * every predicate is built over (unsigned)x, so it holds for every 32-bit
 * value of x and has no undefined behavior
 */

#ifndef CLOAK_OPAQUE_PREDICATES_HPP
#define CLOAK_OPAQUE_PREDICATES_HPP

#include "../../ast/ast.hpp"
#include "../../common/random.hpp"
#include "../../core/options.hpp"

#include <functional>
#include <string>
#include <vector>

namespace cloak {
namespace cff {

enum class PredicateType {
    AlwaysTrue,
    AlwaysFalse
};

struct OpaquePredicate {
    std::string name;
    PredicateType type;
    std::string description;
    bool simple;    // offered at low complexity
    // (x, y) are unsigned operands; y is a random constant
    std::function<ast::Expr(const ast::Expr&, const ast::Expr&)> generator;
};

class OpaquePredicateLibrary {
public:
    OpaquePredicateLibrary();

    const std::vector<OpaquePredicate>& getAllPredicates() const { return predicates_; }
    const OpaquePredicate* getByName(const std::string& name) const;

    /**
     * Instantiates one predicate over the integer expression var (read
     * once per use, so it must be side-effect free). High complexity
     * joins two predicates.
     */
    ast::Expr generateAlwaysTrue(const ast::Expr& var, PredicateComplexity complexity,
                                 Random& rng) const;
    ast::Expr generateAlwaysFalse(const ast::Expr& var, PredicateComplexity complexity,
                                  Random& rng) const;

    /**
     * The predicate itself, with y given explicitly
     */
    ast::Expr instantiate(const OpaquePredicate& p, const ast::Expr& var, uint32_t y) const;

private:
    std::vector<OpaquePredicate> predicates_;
    std::vector<size_t> true_indices_;
    std::vector<size_t> false_indices_;

    void initializePredicates();
    ast::Expr pick(PredicateType type, const ast::Expr& var, PredicateComplexity complexity,
                   Random& rng) const;
};

} // namespace cff
} // namespace cloak

#endif // CLOAK_OPAQUE_PREDICATES_HPP
