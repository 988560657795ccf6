/**
 * Cloak - Bogus Control Flow
 *
 * bogus_cf.cpp - Opaque predicate insertion
 */

#include "bogus_cf.hpp"

#include "../../ast/ast_walk.hpp"

#include <unordered_set>

namespace cloak {
namespace cff {

using namespace ast;

namespace {

deadcode::DeadCodeConfig deadCodeFor(const BogusConfig& config) {
    deadcode::DeadCodeConfig dc;
    dc.predicate_complexity = config.complexity;
    return dc;
}

} // namespace

OpaquePredicatePass::OpaquePredicatePass(BogusConfig config)
    : bogus_(config), dead_code_(deadCodeFor(config)) {
    config_.probability = config.probability;
}

void OpaquePredicatePass::beginProgram(Program&, CompileContext&) {
    dead_code_.resetHelperUse();
}

std::string OpaquePredicatePass::predicateVariable(const Function& f, CompileContext& ctx) {
    // a parameter is usable only if no local shadows it anywhere
    std::unordered_set<std::string> locals;
    visitBlockStmts(f.body, [&locals](const Stmt& s) {
        if (s.kind == StmtKind::Decl) locals.insert(s.decl->name);
    });

    std::vector<std::string> usable;
    for (const auto& p : f.params) {
        if (p.type.isInteger() && !locals.count(p.name)) usable.push_back(p.name);
    }
    if (!usable.empty()) return ctx.rng().choose(usable);
    return std::string();
}

int OpaquePredicatePass::wrapBlock(Block& block, const std::string& var, CompileContext& ctx) {
    int wrapped = 0;
    for (auto& s : block) {
        wrapped += wrapBlock(s.body, var, ctx);
        wrapped += wrapBlock(s.else_body, var, ctx);
        for (auto& c : s.cases) wrapped += wrapBlock(c.body, var, ctx);

        if (s.kind == StmtKind::Decl || s.kind == StmtKind::Empty) continue;
        if (!shouldTransform(ctx)) continue;

        Block dead;
        if (bogus_.generate_dead_code) dead = dead_code_.generateRandom(ctx).code;

        Expr pred = predicates_.generateAlwaysTrue(make::ident(var), bogus_.complexity, ctx.rng());
        Block real;
        real.push_back(std::move(s));
        s = make::ifElseStmt(std::move(pred), std::move(real), std::move(dead));
        wrapped++;
    }
    return wrapped;
}

TransformResult OpaquePredicatePass::transformFunction(Function& f, CompileContext& ctx) {
    if (f.body.empty()) return TransformResult::NotApplicable;

    std::string var = predicateVariable(f, ctx);
    bool fresh = var.empty();
    if (fresh) var = ctx.freshName("__op_");

    int n = wrapBlock(f.body, var, ctx);
    if (n == 0) return TransformResult::NotApplicable;

    if (fresh) {
        Expr init = make::intLit(ctx.rng().nextInt(-100000, 100000));
        f.body.insert(f.body.begin(), make::declStmt(var, Type::intType(), std::move(init)));
    }

    incrementStat("predicates_inserted", n);
    logger_.debug("{}: {} statements behind opaque predicates", f.name, n);
    return TransformResult::Success;
}

void OpaquePredicatePass::endProgram(Program& program, CompileContext&) {
    if (dead_code_.usedHelper()) deadcode::ensureMixHelper(program);
}

} // namespace cff
} // namespace cloak
