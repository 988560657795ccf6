/**
 * Cloak - Obfuscating C Compiler
 *
 * dead_code_base.cpp - Dead code generators
 */

#include "dead_code_base.hpp"

#include "../../core/diagnostics.hpp"

#include <algorithm>

namespace cloak {
namespace deadcode {

using namespace ast;

namespace {

const Type& unsignedInt() {
    static const Type t = Type::intType(true);
    return t;
}

Block wrap(Block body) {
    Block out;
    out.push_back(make::compound(std::move(body)));
    return out;
}

} // namespace

Function makeMixHelper() {
    Function f;
    f.name = kMixHelperName;
    f.return_type = unsignedInt();
    f.params = {Param{"a", unsignedInt(), {}, -1}, Param{"b", unsignedInt(), {}, -1}};
    f.is_definition = true;
    f.is_static = true;
    f.meta.synthetic = true;

    // (a ^ (b << 5)) + ((a >> 3) | b)
    Expr lhs = make::binary(BinaryOp::BitXor, make::ident("a"),
                            make::binary(BinaryOp::Shl, make::ident("b"), make::uintLit(5)));
    Expr rhs = make::binary(BinaryOp::BitOr,
                            make::binary(BinaryOp::Shr, make::ident("a"), make::uintLit(3)),
                            make::ident("b"));
    f.body.push_back(make::returnStmt(make::binary(BinaryOp::Add, std::move(lhs), std::move(rhs))));
    return f;
}

void ensureMixHelper(Program& program) {
    if (program.findFunction(kMixHelperName)) return;
    program.decls.insert(program.decls.begin(), make::functionDecl(makeMixHelper()));
}

Block DeadCodeGenerator::arithmeticChain(const std::vector<std::string>& vars, int num_ops,
                                         Random& rng) {
    static const std::vector<BinaryOp> ops = {
        BinaryOp::Add, BinaryOp::Sub, BinaryOp::Mul, BinaryOp::BitXor,
        BinaryOp::BitAnd, BinaryOp::BitOr, BinaryOp::Shr
    };

    Block code;
    for (int i = 0; i < num_ops; i++) {
        const std::string& target = rng.choose(vars);
        const std::string& source = rng.choose(vars);
        BinaryOp op = rng.choose(ops);

        Expr k = op == BinaryOp::Shr ? make::uintLit(static_cast<uint32_t>(rng.nextInt(1, 7)))
                                     : randomConstant(rng);
        Expr mixed = make::binary(op, make::ident(source), std::move(k));
        BinaryOp join = rng.decide(0.5) ? BinaryOp::Add : BinaryOp::BitXor;
        code.push_back(make::exprStmt(make::assign(
            make::ident(target), make::binary(join, make::ident(target), std::move(mixed)))));
    }
    return code;
}

DeadCodeBlock DeadArithmeticGenerator::generate(CompileContext& ctx, const DeadCodeConfig& config) {
    DeadCodeBlock block;
    block.type = DeadCodeType::Arithmetic;
    Random& rng = ctx.rng();

    std::string a = nextTemp(ctx, block);
    std::string b = nextTemp(ctx, block);
    int num_ops = rng.nextInt(config.min_ops_per_block, config.max_ops_per_block);

    Block body;
    body.push_back(make::declStmt(a, unsignedInt(), randomConstant(rng)));
    body.push_back(make::declStmt(b, unsignedInt(), randomConstant(rng)));
    for (auto& s : arithmeticChain({a, b}, num_ops, rng)) body.push_back(std::move(s));

    block.ops_inserted = num_ops;
    block.code = wrap(std::move(body));
    return block;
}

DeadCodeBlock DeadCallGenerator::generate(CompileContext& ctx, const DeadCodeConfig&) {
    DeadCodeBlock block;
    block.type = DeadCodeType::Call;
    Random& rng = ctx.rng();

    std::vector<Expr> args;
    args.push_back(randomConstant(rng));
    args.push_back(randomConstant(rng));
    Expr call = make::call(kMixHelperName, std::move(args));

    Block body;
    if (rng.decide(0.5)) {
        body.push_back(make::exprStmt(std::move(call)));
        block.calls_inserted = 1;
    } else {
        // chained through a fresh local, result still discarded
        std::string r = nextTemp(ctx, block);
        body.push_back(make::declStmt(r, unsignedInt(), std::move(call)));
        std::vector<Expr> again;
        again.push_back(make::ident(r));
        again.push_back(randomConstant(rng));
        body.push_back(make::exprStmt(make::call(kMixHelperName, std::move(again))));
        block.calls_inserted = 2;
    }

    block.code = wrap(std::move(body));
    return block;
}

DeadCodeBlock DeadLoopGenerator::generate(CompileContext& ctx, const DeadCodeConfig& config) {
    DeadCodeBlock block;
    block.type = DeadCodeType::Loop;
    Random& rng = ctx.rng();

    std::string acc = nextTemp(ctx, block);
    std::string i = nextTemp(ctx, block);
    int trips = rng.nextInt(2, std::max(2, config.max_loop_iterations));

    Block init;
    init.push_back(make::declStmt(i, Type::intType(), make::intLit(0)));
    Expr cond = make::binary(BinaryOp::Lt, make::ident(i), make::intLit(trips));
    Expr step = make::unary(UnaryOp::PostInc, make::ident(i));

    Block loop_body;
    Expr scaled = make::binary(BinaryOp::Mul, make::ident(acc), make::uintLit(31));
    Expr next = make::binary(BinaryOp::Add, std::move(scaled),
                             make::cast(unsignedInt(), make::ident(i)));
    loop_body.push_back(make::exprStmt(make::assign(make::ident(acc), std::move(next))));

    Block body;
    body.push_back(make::declStmt(acc, unsignedInt(), randomConstant(rng)));
    body.push_back(make::forStmt(std::move(init), std::move(cond), std::move(step),
                                 std::move(loop_body)));

    block.ops_inserted = 1;
    block.code = wrap(std::move(body));
    return block;
}

DeadCodeBlock DeadBranchGenerator::generate(CompileContext& ctx, const DeadCodeConfig& config) {
    DeadCodeBlock block;
    block.type = DeadCodeType::ControlFlow;
    Random& rng = ctx.rng();

    std::string v = nextTemp(ctx, block);
    DeadCodeBlock inner = body_.generate(ctx, config);
    for (auto& name : inner.vars_created) block.vars_created.push_back(name);

    Block body;
    body.push_back(make::declStmt(v, Type::intType(), make::intLit(rng.nextInt(-10000, 10000))));
    Expr guard = predicates_.generateAlwaysFalse(make::ident(v), config.predicate_complexity, rng);
    body.push_back(make::ifStmt(std::move(guard), std::move(inner.code)));

    block.ops_inserted = inner.ops_inserted;
    block.code = wrap(std::move(body));
    return block;
}

DeadCodeSynthesizer::DeadCodeSynthesizer(DeadCodeConfig config) : config_(config) {}

DeadCodeBlock DeadCodeSynthesizer::generate(DeadCodeType type, CompileContext& ctx) {
    switch (type) {
        case DeadCodeType::Arithmetic:
            return arithmetic_.generate(ctx, config_);
        case DeadCodeType::Call:
            used_helper_ = true;
            return call_.generate(ctx, config_);
        case DeadCodeType::Loop:
            return loop_.generate(ctx, config_);
        case DeadCodeType::ControlFlow:
            return branch_.generate(ctx, config_);
    }
    throw InternalError("dead code: unknown generator type");
}

DeadCodeBlock DeadCodeSynthesizer::generateRandom(CompileContext& ctx) {
    std::vector<double> weights = {
        config_.arithmetic_probability,
        config_.call_probability,
        config_.loop_probability,
        config_.control_flow_probability
    };
    static const DeadCodeType types[] = {
        DeadCodeType::Arithmetic, DeadCodeType::Call, DeadCodeType::Loop, DeadCodeType::ControlFlow
    };
    return generate(types[ctx.rng().chooseWeighted(weights)], ctx);
}

} // namespace deadcode
} // namespace cloak
