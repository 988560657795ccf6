/*
 * dead_code_elimination.hpp - removes code with no observable effect
 *
 *   - statements after return / break / continue in the same block
 *   - if with a literal condition (the taken branch stays as a block)
 *   - while (0)
 *   - locals that are never read; assignments to them are dropped or
 *     reduced to their right-hand side when that has side effects.
 *     calls are never removed.
 *
 * runs to a fixed point per function, since removing one write can
 * leave another variable unread
 */

#ifndef CLOAK_DEAD_CODE_ELIMINATION_HPP
#define CLOAK_DEAD_CODE_ELIMINATION_HPP

#include "../../core/transformation_base.hpp"
#include "../../ast/ast_walk.hpp"
#include "../../common/logging.hpp"

#include <unordered_map>
#include <unordered_set>

namespace cloak {
namespace opt {

struct DceCounts {
    int statements_removed = 0;
    int variables_removed = 0;
    int branches_folded = 0;

    int total() const { return statements_removed + variables_removed + branches_folded; }
};

class DeadCodeEliminator {
public:
    static constexpr int kMaxRounds = 32;

    DceCounts run(ast::Function& f);

private:
    using KeySet = std::unordered_set<ast::BindingKey, ast::BindingKeyHash>;

    KeySet dead_;
    std::unordered_map<ast::BindingKey, ast::Type, ast::BindingKeyHash> local_types_;
    DceCounts counts_;

    bool round(ast::Function& f);
    void findDeadLocals(const ast::Function& f);
    void processBlock(ast::Block& block, bool& changed);
    void stripDeadAssignments(ast::Expr& e, bool& changed);
    bool isDeadTarget(const ast::Expr& e) const;
    bool reduceStatementExpr(ast::Expr& root, std::optional<ast::Expr>& out, bool& changed);
};

class DeadCodeEliminationPass : public FunctionPass {
public:
    std::string getName() const override { return "dead_code_elimination"; }
    std::string getDescription() const override {
        return "Removes unreachable statements and unread locals";
    }
    PassPriority getPriority() const override { return PassPriority::DeadCodeElimination; }
    PassKind getKind() const override { return PassKind::Optimization; }

protected:
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;

private:
    Logger logger_{"DCE"};
};

} // namespace opt
} // namespace cloak

#endif // CLOAK_DEAD_CODE_ELIMINATION_HPP
