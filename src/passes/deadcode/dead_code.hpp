/**
 * Cloak - Obfuscating C Compiler
 *
 * dead_code.hpp - Dead code insertion pass
 *
 * Before each statement, with the configured ratio, inserts one block from
 * the dead code generators: dead arithmetic, a discarded call to the pure
 * mix helper, a bounded dummy loop, or a branch behind an always-false
 * predicate.
 *
 * Example output:
 *   {
 *       int __dc_4 = 7121;
 *       if (((unsigned int)__dc_4 ^ (unsigned int)__dc_4) != 0u) {
 *           { unsigned int __dc_5 = 913u; ... }
 *       }
 *   }
 *   total = total + x;     // real code continues here
 */

#ifndef CLOAK_DEAD_CODE_HPP
#define CLOAK_DEAD_CODE_HPP

#include "dead_code_base.hpp"
#include "../../core/transformation_base.hpp"
#include "../../common/logging.hpp"

namespace cloak {
namespace deadcode {

class DeadCodeInsertionPass : public FunctionPass {
public:
    explicit DeadCodeInsertionPass(DeadCodeConfig config = {})
        : synthesizer_(config) {
        config_.probability = config.probability;
    }

    std::string getName() const override { return "dead_code_insertion"; }
    std::string getDescription() const override {
        return "Inserts dead statements that never affect observable behavior";
    }
    PassPriority getPriority() const override { return PassPriority::DeadCodeInsertion; }

protected:
    void beginProgram(ast::Program& program, CompileContext& ctx) override;
    TransformResult transformFunction(ast::Function& f, CompileContext& ctx) override;
    void endProgram(ast::Program& program, CompileContext& ctx) override;

private:
    DeadCodeSynthesizer synthesizer_;
    Logger logger_{"DeadCode"};

    int insertInto(ast::Block& block, CompileContext& ctx);
};

} // namespace deadcode
} // namespace cloak

#endif // CLOAK_DEAD_CODE_HPP
