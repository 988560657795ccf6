/**
 * Cloak - Obfuscating C Compiler
 *
 * dead_code_base.hpp - Base definitions for dead code generation
 *
 * Dead code obfuscation includes:
 *   - Dead arithmetic over fresh unsigned locals
 *   - Discarded calls to a synthesized pure helper
 *   - Bounded dummy loops
 *   - Branches guarded by an always-false opaque predicate
 *
 * Generated code only writes variables it declares itself, inside its own
 * compound block, and every loop it builds has a constant trip count.
 */

#ifndef CLOAK_DEAD_CODE_BASE_HPP
#define CLOAK_DEAD_CODE_BASE_HPP

#include "../../core/compile_context.hpp"
#include "../../ast/ast.hpp"
#include "../cff/opaque_predicates.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cloak {
namespace deadcode {

/**
 * Types of dead code that can be generated
 */
enum class DeadCodeType {
    Arithmetic,     // Dead arithmetic operations
    Call,           // Discarded helper calls
    Loop,           // Bounded dummy loops
    ControlFlow     // Dead branches (using opaque predicates)
};

/**
 * Configuration for dead code generation
 */
struct DeadCodeConfig {
    bool enabled = true;
    double probability = 0.2;      // Probability to insert before a statement

    int min_ops_per_block = 2;
    int max_ops_per_block = 5;
    int max_loop_iterations = 8;

    // Type weights
    double arithmetic_probability = 0.35;
    double call_probability = 0.25;
    double loop_probability = 0.2;
    double control_flow_probability = 0.2;

    PredicateComplexity predicate_complexity = PredicateComplexity::Medium;
};

/**
 * Generated dead code block
 */
struct DeadCodeBlock {
    ast::Block code;                          // One compound statement
    std::vector<std::string> vars_created;
    DeadCodeType type = DeadCodeType::Arithmetic;
    int ops_inserted = 0;
    int calls_inserted = 0;
};

// the pure helper dead calls go to: unsigned (unsigned, unsigned)
constexpr const char* kMixHelperName = "__cloak_mix";

ast::Function makeMixHelper();

/**
 * Adds the helper ahead of every other declaration unless it is there
 */
void ensureMixHelper(ast::Program& program);

// ============================================================================
// Dead Code Generators
// ============================================================================

/**
 * Base class for dead code generators
 */
class DeadCodeGenerator {
public:
    virtual ~DeadCodeGenerator() = default;

    virtual std::string getName() const = 0;

    virtual DeadCodeBlock generate(CompileContext& ctx, const DeadCodeConfig& config) = 0;

protected:
    std::string nextTemp(CompileContext& ctx, DeadCodeBlock& block) {
        std::string name = ctx.freshName("__dc_");
        block.vars_created.push_back(name);
        return name;
    }

    static ast::Expr randomConstant(Random& rng) {
        return ast::make::uintLit(static_cast<uint32_t>(rng.nextInt(1, 0xFFFF)));
    }

    /**
     * num_ops assignments mixing the given unsigned variables
     */
    static ast::Block arithmeticChain(const std::vector<std::string>& vars, int num_ops,
                                      Random& rng);
};

/**
 * Generates realistic dead arithmetic operations
 */
class DeadArithmeticGenerator : public DeadCodeGenerator {
public:
    std::string getName() const override { return "DeadArithmetic"; }
    DeadCodeBlock generate(CompileContext& ctx, const DeadCodeConfig& config) override;
};

/**
 * Discarded calls to the mix helper
 */
class DeadCallGenerator : public DeadCodeGenerator {
public:
    std::string getName() const override { return "DeadCall"; }
    DeadCodeBlock generate(CompileContext& ctx, const DeadCodeConfig& config) override;
};

/**
 * for loops with a constant trip count that only touch their own locals
 */
class DeadLoopGenerator : public DeadCodeGenerator {
public:
    std::string getName() const override { return "DeadLoop"; }
    DeadCodeBlock generate(CompileContext& ctx, const DeadCodeConfig& config) override;
};

/**
 * if (always false) { dead arithmetic }
 */
class DeadBranchGenerator : public DeadCodeGenerator {
public:
    std::string getName() const override { return "DeadBranch"; }
    DeadCodeBlock generate(CompileContext& ctx, const DeadCodeConfig& config) override;

private:
    cff::OpaquePredicateLibrary predicates_;
    DeadArithmeticGenerator body_;
};

/**
 * Picks a generator by the configured weights
 */
class DeadCodeSynthesizer {
public:
    explicit DeadCodeSynthesizer(DeadCodeConfig config = {});

    const DeadCodeConfig& config() const { return config_; }

    DeadCodeBlock generate(DeadCodeType type, CompileContext& ctx);
    DeadCodeBlock generateRandom(CompileContext& ctx);

    // any generated block called the mix helper
    bool usedHelper() const { return used_helper_; }
    void resetHelperUse() { used_helper_ = false; }

private:
    DeadCodeConfig config_;
    DeadArithmeticGenerator arithmetic_;
    DeadCallGenerator call_;
    DeadLoopGenerator loop_;
    DeadBranchGenerator branch_;
    bool used_helper_ = false;
};

} // namespace deadcode
} // namespace cloak

#endif // CLOAK_DEAD_CODE_BASE_HPP
