/**
 * Cloak - Obfuscating C Compiler
 *
 * dead_code.cpp - Dead code insertion pass
 */

#include "dead_code.hpp"

namespace cloak {
namespace deadcode {

using namespace ast;

void DeadCodeInsertionPass::beginProgram(Program&, CompileContext&) {
    synthesizer_.resetHelperUse();
}

int DeadCodeInsertionPass::insertInto(Block& block, CompileContext& ctx) {
    int inserted = 0;
    Block out;
    for (auto& s : block) {
        inserted += insertInto(s.body, ctx);
        inserted += insertInto(s.else_body, ctx);
        for (auto& c : s.cases) inserted += insertInto(c.body, ctx);

        if (shouldTransform(ctx)) {
            DeadCodeBlock dead = synthesizer_.generateRandom(ctx);
            switch (dead.type) {
                case DeadCodeType::Call: incrementStat("calls_inserted", dead.calls_inserted); break;
                case DeadCodeType::Loop: incrementStat("loops_inserted"); break;
                case DeadCodeType::ControlFlow: incrementStat("branches_inserted"); break;
                default: incrementStat("arithmetic_inserted"); break;
            }
            for (auto& d : dead.code) out.push_back(std::move(d));
            inserted++;
        }
        out.push_back(std::move(s));
    }
    block = std::move(out);
    return inserted;
}

TransformResult DeadCodeInsertionPass::transformFunction(Function& f, CompileContext& ctx) {
    int n = insertInto(f.body, ctx);
    if (n == 0) return TransformResult::NotApplicable;
    incrementStat("blocks_inserted", n);
    logger_.debug("{}: inserted {} dead blocks", f.name, n);
    return TransformResult::Success;
}

void DeadCodeInsertionPass::endProgram(Program& program, CompileContext&) {
    if (synthesizer_.usedHelper()) ensureMixHelper(program);
}

} // namespace deadcode
} // namespace cloak
