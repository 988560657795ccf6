/**
 * Cloak - Obfuscating C Compiler
 *
 * mba_pass.hpp - Unified MBA (Mixed Boolean Arithmetic) Pass
 *
 * This is the expression complication pass. It coordinates the ADD, SUB,
 * XOR, AND, OR and MULT transformations over every function body.
 */

#ifndef CLOAK_MBA_PASS_HPP
#define CLOAK_MBA_PASS_HPP

#include "mba_base.hpp"
#include "mba_add.hpp"
#include "mba_sub.hpp"
#include "mba_xor.hpp"
#include "mba_and.hpp"
#include "mba_or.hpp"
#include "mba_mult.hpp"

#include "../../core/transformation_base.hpp"

#include <map>
#include <memory>

namespace cloak {
namespace mba {

/**
 * Rewrites selected 32-bit integer operations of one expression tree.
 * An operation qualifies when its result is a word integer, neither
 * operand is a pointer or has side effects, not both operands are
 * literals, and neither operand is larger than max_operand_nodes.
 */
class ExpressionComplicator {
public:
    ExpressionComplicator();

    void configure(const MBAConfig& config) { config_ = config; }
    const MBAConfig& config() const { return config_; }

    void setOperationEnabled(ast::BinaryOp op, bool enabled);

    /**
     * Returns the number of operations rewritten. New nodes carry no
     * types until the program is analyzed again.
     */
    int complicate(ast::Expr& e, Random& rng);

    const std::map<std::string, int>& perOperationCounts() const { return applied_; }

private:
    MBAConfig config_;
    std::map<ast::BinaryOp, std::unique_ptr<MBATransformation>> transforms_;
    std::map<std::string, int> applied_;

    bool eligible(const ast::Expr& e) const;
};

class ExpressionComplicationPass : public FunctionPass {
public:
    explicit ExpressionComplicationPass(MBAConfig config = {}) {
        complicator_.configure(config);
        config_.probability = config.probability;
    }

    std::string getName() const override { return "expression_complication"; }
    std::string getDescription() const override {
        return "Mixed Boolean Arithmetic rewrites of integer expressions";
    }
    PassPriority getPriority() const override { return PassPriority::ExpressionComplication; }

    bool initialize(const PassConfig& config) override {
        TransformationPass::initialize(config);
        MBAConfig mba = complicator_.config();
        mba.probability = config.probability;
        mba.enabled = config.enabled;
        complicator_.configure(mba);
        return true;
    }

    ExpressionComplicator& complicator() { return complicator_; }

protected:
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;

private:
    ExpressionComplicator complicator_;
    Logger logger_{"MBA_Pass"};
};

} // namespace mba
} // namespace cloak

#endif // CLOAK_MBA_PASS_HPP
