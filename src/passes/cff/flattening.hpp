/**
 * Cloak - Control Flow Flattening
 *
 * Splits a function body into segments at every control transfer (branch
 * targets, loop heads and tails, break/continue/return) and dispatches
 * them from one switch inside while (1). Segment ids follow a pre-order
 * walk from the entry, so the entry is 0; segments no path reaches are
 * dropped.
 *
 * Locals are hoisted to the function entry under fresh names, their
 * initializers turned into assignments where the declaration stood.
 * Original switch statements stay whole inside their segment; a continue
 * inside one becomes the owning loop's transition.
 */

#ifndef CLOAK_FLATTENING_HPP
#define CLOAK_FLATTENING_HPP

#include "cff_base.hpp"
#include "dispatch_analyzer.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace cloak {
namespace cff {

class ControlFlowFlattener {
public:
    explicit ControlFlowFlattener(CFFConfig config = {}) : config_(std::move(config)) {}

    const CFFConfig& config() const { return config_; }

    /**
     * Rewrites f in place. Throws InternalError if the machine it built
     * fails the state coverage check.
     */
    CFFResult flatten(ast::Function& f, CompileContext& ctx);

private:
    struct Machine;

    CFFConfig config_;
    DispatchAnalyzer analyzer_;
    Logger logger_{"CFF"};

    // per-function state
    CompileContext* ctx_ = nullptr;
    CFFResult* result_ = nullptr;
    ast::Block hoisted_;
    std::unordered_map<ast::BindingKey, std::string, ast::BindingKeyHash> renamed_;

    std::string newStateVar();
    ast::Block buildMachine(Machine& m);

    int lowerList(ast::Block& stmts, Machine& m, int cur);
    int lowerStmt(ast::Stmt& s, Machine& m, int cur);
    void lowerLoop(ast::Stmt& loop, ast::Block& out);
    void lowerDecl(ast::VarDecl& v, ast::Block& out);
    void keepIntact(ast::Block& block, Machine& m, int cur);

    void storeElements(const ast::Expr& target, const ast::Type& type, ast::Expr& init,
                       ast::Block& out);
    void zeroFill(const std::string& array, ast::Block& out);
};

class ControlFlowFlatteningPass : public FunctionPass {
public:
    explicit ControlFlowFlatteningPass(CFFConfig config = {}) : flattener_(config) {
        config_.probability = config.probability;
    }

    std::string getName() const override { return "control_flow_flattening"; }
    std::string getDescription() const override {
        return "Control Flow Flattening - converts function bodies to state machines";
    }
    PassPriority getPriority() const override { return PassPriority::Flattening; }

protected:
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;

private:
    ControlFlowFlattener flattener_;
    Logger logger_{"CFF_Pass"};
};

} // namespace cff
} // namespace cloak

#endif // CLOAK_FLATTENING_HPP
