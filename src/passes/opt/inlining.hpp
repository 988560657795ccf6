/*
 * inlining.hpp - replaces small function calls with the callee's body
 *
 * a callee is a candidate when it is defined, at or below the statement
 * threshold, not variadic, not recursive (directly or through others),
 * never has its address taken, has no static locals, returns a scalar or
 * void, and has no return inside a loop or switch.
 *
 * only these call sites are rewritten:
 *   f(args);              x = f(args);
 *   T x = f(args);        return f(args);
 *
 * the copy gets fresh names for parameters and locals. early returns set
 * a completion flag and the rest of each enclosing block is guarded by it.
 */

#ifndef CLOAK_INLINING_HPP
#define CLOAK_INLINING_HPP

#include "../../core/transformation_base.hpp"
#include "../../ast/ast_walk.hpp"
#include "../../common/logging.hpp"

#include <unordered_map>
#include <unordered_set>

namespace cloak {
namespace opt {

/**
 * Which functions may be inlined, and why the others may not
 */
class InlineCandidates {
public:
    InlineCandidates(const ast::Program& program, int threshold);

    bool isCandidate(const std::string& name) const { return candidates_.count(name) != 0; }
    bool isRecursive(const std::string& name) const { return recursive_.count(name) != 0; }
    bool isAddressTaken(const std::string& name) const { return address_taken_.count(name) != 0; }

    const ast::Function* callee(const std::string& name) const;

    /**
     * True if every file-scope name and record tag the callee's body
     * relies on is declared before the declaration at caller_index
     */
    bool visibleAt(const ast::Function& callee, size_t caller_index) const;

private:
    std::unordered_map<std::string, const ast::Function*> candidates_;
    std::unordered_map<std::string, size_t> first_decl_;
    std::unordered_map<std::string, size_t> first_record_;
    std::unordered_set<std::string> recursive_;
    std::unordered_set<std::string> address_taken_;

    bool typeVisible(const ast::Type& t, size_t index) const;
};

class InliningPass : public TransformationPass {
public:
    explicit InliningPass(int threshold = 10) : threshold_(threshold) {}

    std::string getName() const override { return "inlining"; }
    std::string getDescription() const override {
        return "Inlines small non-recursive functions at statement-level call sites";
    }
    PassPriority getPriority() const override { return PassPriority::Inlining; }
    PassKind getKind() const override { return PassKind::Optimization; }

    ast::Program run(const ast::Program& program, CompileContext& ctx) override;

private:
    int threshold_;
    Logger logger_{"Inliner"};

    // per-caller state
    const InlineCandidates* candidates_ = nullptr;
    CompileContext* ctx_ = nullptr;
    size_t caller_index_ = 0;
    int inlined_ = 0;
    std::unordered_set<std::string> caller_locals_;

    void inlineBlock(ast::Block& block);
    bool canInlineCall(const ast::Expr& call) const;
    ast::Block expand(const ast::Expr& call, std::optional<ast::Expr> result_target,
                      bool is_return);
};

} // namespace opt
} // namespace cloak

#endif // CLOAK_INLINING_HPP
