/*
 * constant_folding.hpp - literal arithmetic at compile time
 *
 * bottom-up: an operator whose operands are all literals becomes one
 * literal with 32-bit wraparound. operations that would trap or are
 * undefined on the target stay as they are:
 *   x / 0, x % 0, INT_MIN / -1, INT_MIN % -1, shifts outside [0, 31]
 * a cast of a literal to an integer type folds to the converted value;
 * a ternary with a literal condition folds to the chosen branch.
 * sizeof operands are never touched.
 */

#ifndef CLOAK_CONSTANT_FOLDING_HPP
#define CLOAK_CONSTANT_FOLDING_HPP

#include "../../core/transformation_base.hpp"
#include "../../common/logging.hpp"

namespace cloak {
namespace opt {

class ConstantFolder {
public:
    /**
     * Folds e in place; returns the number of nodes replaced
     */
    int fold(ast::Expr& e) const;

    int foldBlock(ast::Block& block) const;

private:
    bool foldNode(ast::Expr& e) const;
};

class ConstantFoldingPass : public FunctionPass {
public:
    std::string getName() const override { return "constant_folding"; }
    std::string getDescription() const override {
        return "Evaluates operations on literal operands";
    }
    PassPriority getPriority() const override { return PassPriority::ConstantFolding; }
    PassKind getKind() const override { return PassKind::Optimization; }

protected:
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;

private:
    ConstantFolder folder_;
    Logger logger_{"ConstFold"};
};

} // namespace opt
} // namespace cloak

#endif // CLOAK_CONSTANT_FOLDING_HPP
