/**
 * Cloak - Bogus Control Flow
 *
 * The opaque predicate pass. Wraps selected statements as
 *
 *   if (P) { real } else { dead }
 *
 * where P is always true. P reads an int parameter of the function, or a
 * fresh local declared at function entry when no parameter qualifies. The
 * else branch comes from the dead code generators and never executes.
 * Declarations are never wrapped, since that would end their scope.
 */

#ifndef CLOAK_BOGUS_CF_HPP
#define CLOAK_BOGUS_CF_HPP

#include "opaque_predicates.hpp"
#include "../deadcode/dead_code_base.hpp"
#include "../../core/transformation_base.hpp"
#include "../../common/logging.hpp"

#include <string>

namespace cloak {
namespace cff {

/**
 * Configuration for bogus control flow
 */
struct BogusConfig {
    double probability = 0.3;           // Probability of wrapping a statement
    PredicateComplexity complexity = PredicateComplexity::Medium;
    bool generate_dead_code = true;     // Fill the else branch
};

class OpaquePredicatePass : public FunctionPass {
public:
    explicit OpaquePredicatePass(BogusConfig config = {});

    std::string getName() const override { return "opaque_predicates"; }
    std::string getDescription() const override {
        return "Wraps statements in always-true opaque predicates";
    }
    PassPriority getPriority() const override { return PassPriority::OpaquePredicates; }

protected:
    void beginProgram(ast::Program& program, CompileContext& ctx) override;
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;
    void endProgram(ast::Program& program, CompileContext& ctx) override;

private:
    BogusConfig bogus_;
    OpaquePredicateLibrary predicates_;
    deadcode::DeadCodeSynthesizer dead_code_;
    Logger logger_{"BogusCF"};

    int wrapBlock(ast::Block& block, const std::string& var, CompileContext& ctx);
    // an unshadowed integer parameter, or empty when there is none
    std::string predicateVariable(const ast::Function& f, CompileContext& ctx);
};

} // namespace cff
} // namespace cloak

#endif // CLOAK_BOGUS_CF_HPP
