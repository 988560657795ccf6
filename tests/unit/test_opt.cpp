/**
 * Cloak - Optimization Pass Tests
 */

#include <gtest/gtest.h>
#include "fixtures/obfuscation_fixture.hpp"
#include "passes/opt/opt.hpp"

#include <algorithm>
#include <climits>

using namespace cloak;
using namespace cloak::test;

namespace {

const ast::Expr& returned(const ast::Function& f) {
    const ast::Stmt& last = f.body.back();
    EXPECT_EQ(last.kind, ast::StmtKind::Return);
    return *last.expr;
}

struct Folded {
    ast::Program program;
    int replaced = 0;
};

Folded foldFunction(const std::string& src, const std::string& name = "f") {
    Folded out;
    auto program = analyzeSource(src);
    if (!program) return out;
    out.program = std::move(*program);
    opt::ConstantFolder folder;
    out.replaced = folder.foldBlock(out.program.findFunction(name)->body);
    return out;
}

int32_t literalValue(const ast::Expr& e) {
    EXPECT_TRUE(e.isLiteral()) << ast::printExpr(e);
    return static_cast<int32_t>(e.int_value);
}

} // namespace

// ============================================================================
// Constant folding
// ============================================================================

TEST(ConstantFoldingTest, FoldsNestedArithmetic) {
    auto r = foldFunction("int f(void) { return 3 + 4 * 2 - (10 >> 1); }\n");
    EXPECT_EQ(literalValue(returned(*r.program.findFunction("f"))), 6);
    EXPECT_EQ(r.replaced, 4);
}

TEST(ConstantFoldingTest, WrapsAtThirtyTwoBits) {
    auto r = foldFunction("int f(void) { return 2147483647 + 1; }\n");
    EXPECT_EQ(literalValue(returned(*r.program.findFunction("f"))), INT32_MIN);
}

TEST(ConstantFoldingTest, UnsignedOperandsDivideUnsigned) {
    // 4294967295 does not fit int and is unsigned
    auto r = foldFunction("unsigned f(void) { return 4294967295 / 2; }\n");
    const ast::Expr& e = returned(*r.program.findFunction("f"));
    ASSERT_TRUE(e.isLiteral());
    EXPECT_TRUE(e.is_unsigned);
    EXPECT_EQ(static_cast<uint32_t>(e.int_value), 2147483647u);
}

TEST(ConstantFoldingTest, ComparisonsAndLogicalOperators) {
    auto r = foldFunction(
        "int g(void);\n"
        "int f(void) { return (3 < 4) + (5 == 6) + !0 + (0 && g()) + (2 || g()); }\n");
    EXPECT_EQ(literalValue(returned(*r.program.findFunction("f"))), 3);
}

TEST(ConstantFoldingTest, CastsAndTernaries) {
    auto r = foldFunction("int f(void) { return (char)300 + (1 ? 5 : 6) + (0 ? 7 : -8); }\n");
    // (char)300 is 44
    EXPECT_EQ(literalValue(returned(*r.program.findFunction("f"))), 41);
}

TEST(ConstantFoldingTest, LeavesTrappingOperations) {
    const char* cases[] = {
        "int f(void) { return 1 / 0; }\n",
        "int f(void) { return 7 % 0; }\n",
        "int f(void) { return (-2147483647 - 1) / -1; }\n",
        "int f(void) { return (-2147483647 - 1) % -1; }\n",
        "int f(void) { return 1 << 32; }\n",
        "int f(void) { return 1 >> -1; }\n",
    };
    for (const char* src : cases) {
        auto r = foldFunction(src);
        const ast::Expr& e = returned(*r.program.findFunction("f"));
        EXPECT_EQ(e.kind, ast::ExprKind::Binary) << src;
        // the operands themselves are folded
        EXPECT_TRUE(e.lhs().isLiteral()) << src;
        EXPECT_TRUE(e.rhs().isLiteral()) << src;
    }
}

TEST(ConstantFoldingTest, SizeofOperandUntouched) {
    auto r = foldFunction("int f(void) { return sizeof(1 + 2); }\n");
    const ast::Expr& e = returned(*r.program.findFunction("f"));
    ASSERT_EQ(e.kind, ast::ExprKind::SizeOf);
    EXPECT_EQ(r.replaced, 0);
}

TEST(ConstantFoldingTest, VariablesStopFolding) {
    auto r = foldFunction("int f(int x) { return x + (2 * 3); }\n");
    const ast::Expr& e = returned(*r.program.findFunction("f"));
    ASSERT_EQ(e.kind, ast::ExprKind::Binary);
    EXPECT_EQ(e.lhs().kind, ast::ExprKind::Identifier);
    EXPECT_EQ(literalValue(e.rhs()), 6);
}

TEST(ConstantFoldingTest, SecondRunFindsNothing) {
    auto r = foldFunction("int f(int x) { int y = 1 + 2; return x * (4 - 1) + y; }\n");
    EXPECT_GT(r.replaced, 0);
    opt::ConstantFolder folder;
    EXPECT_EQ(folder.foldBlock(r.program.findFunction("f")->body), 0);
}

// ============================================================================
// Dead code elimination
// ============================================================================

namespace {

struct Eliminated {
    ast::Program program;
    opt::DceCounts counts;
    const ast::Function& fn() const { return *program.findFunction("f"); }
};

Eliminated eliminate(const std::string& src) {
    Eliminated out;
    auto program = analyzeSource(src);
    if (!program) return out;
    out.program = std::move(*program);
    opt::DeadCodeEliminator dce;
    out.counts = dce.run(*out.program.findFunction("f"));
    return out;
}

} // namespace

TEST(DeadCodeEliminationTest, DropsStatementsAfterReturn) {
    auto r = eliminate("int f(int a) { return a; a = a + 1; a = 2; }\n");
    EXPECT_EQ(r.counts.statements_removed, 2);
    ASSERT_EQ(r.fn().body.size(), 1u);
    EXPECT_EQ(r.fn().body[0].kind, ast::StmtKind::Return);
}

TEST(DeadCodeEliminationTest, DropsStatementsAfterBreak) {
    auto r = eliminate("int f(int a) { while (a) { break; a = 3; } return a; }\n");
    EXPECT_EQ(r.counts.statements_removed, 1);
    EXPECT_EQ(r.fn().body[0].body.size(), 1u);
}

TEST(DeadCodeEliminationTest, FoldsLiteralConditions) {
    auto r = eliminate(
        "int f(int a) {\n"
        "    if (1) { a = a + 2; } else { a = 3; }\n"
        "    if (0) { a = 4; }\n"
        "    while (0) { a = 5; }\n"
        "    return a;\n"
        "}\n");
    EXPECT_EQ(r.counts.branches_folded, 3);
    // the taken branch survives as a block, the empty one disappears
    ASSERT_EQ(r.fn().body.size(), 2u);
    EXPECT_EQ(r.fn().body[0].kind, ast::StmtKind::Compound);
    EXPECT_EQ(r.fn().body[1].kind, ast::StmtKind::Return);
}

TEST(DeadCodeEliminationTest, RemovesUnreadLocals) {
    auto r = eliminate(
        "int f(void) {\n"
        "    int unused = 5;\n"
        "    int used = 2;\n"
        "    unused = used + 1;\n"
        "    unused++;\n"
        "    return used;\n"
        "}\n");
    EXPECT_EQ(r.counts.variables_removed, 1);
    EXPECT_EQ(r.counts.statements_removed, 2);
    std::string text = ast::printProgram(r.program);
    EXPECT_EQ(text.find("unused"), std::string::npos) << text;
}

TEST(DeadCodeEliminationTest, KeepsCallsFeedingDeadLocals) {
    auto r = eliminate(
        "int g(void);\n"
        "int f(void) {\n"
        "    int r = g();\n"
        "    int s;\n"
        "    s = g() + 1;\n"
        "    return 0;\n"
        "}\n");
    EXPECT_EQ(r.counts.variables_removed, 2);
    std::string text = ast::printProgram(r.program);
    EXPECT_EQ(countOccurrences(text, "g()"), 2) << text;
}

TEST(DeadCodeEliminationTest, ReachesFixedPoint) {
    // b reads a; once b is gone a is unread too
    auto r = eliminate("int f(void) { int a = 1; int b = a; int c = b; return 0; }\n");
    EXPECT_EQ(r.counts.variables_removed, 3);
    EXPECT_EQ(r.fn().body.size(), 1u);
}

TEST(DeadCodeEliminationTest, KeepsLocalsReadThroughPointers) {
    auto r = eliminate("int f(void) { int a = 1; int *p = &a; *p = 4; return a; }\n");
    EXPECT_EQ(r.counts.total(), 0);
}

TEST(DeadCodeEliminationTest, AssignmentValueStillUsed) {
    // the write is dead but its value feeds the return
    auto r = eliminate("int f(int v) { int t; return (t = v * 2) + 1; }\n");
    EXPECT_EQ(r.counts.variables_removed, 1);
    std::string text = ast::printProgram(r.program);
    EXPECT_EQ(text.find(" t "), std::string::npos) << text;
    EXPECT_NE(text.find("(v * 2)"), std::string::npos) << text;
}

// ============================================================================
// Inlining
// ============================================================================

namespace {

const char* kCandidateProgram =
    "static int sq(int x) { return x * x; }\n"
    "int fact(int n) { if (n < 2) return 1; return n * fact(n - 1); }\n"
    "int pong(int n);\n"
    "int ping(int n) { return n ? pong(n - 1) : 1; }\n"
    "int pong(int n) { return n ? ping(n - 1) : 0; }\n"
    "int twice(int x) { return x + x; }\n"
    "int (*handler)(int) = twice;\n"
    "int looped(int n) { while (n) { return n; } return 0; }\n"
    "int counter(void) { static int c; c++; return c; }\n"
    "int big(int n) { n++; n++; n++; n++; n++; n++; return n; }\n"
    "int main(void) { return sq(2); }\n";

} // namespace

TEST(InliningTest, CandidateSelection) {
    auto program = analyzeSource(kCandidateProgram);
    ASSERT_TRUE(program.has_value());
    opt::InlineCandidates candidates(*program, 5);

    EXPECT_TRUE(candidates.isCandidate("sq"));
    EXPECT_NE(candidates.callee("sq"), nullptr);

    EXPECT_TRUE(candidates.isRecursive("fact"));
    EXPECT_TRUE(candidates.isRecursive("ping"));
    EXPECT_TRUE(candidates.isRecursive("pong"));
    EXPECT_TRUE(candidates.isAddressTaken("twice"));

    EXPECT_FALSE(candidates.isCandidate("fact"));
    EXPECT_FALSE(candidates.isCandidate("ping"));
    EXPECT_FALSE(candidates.isCandidate("twice"));
    EXPECT_FALSE(candidates.isCandidate("looped"));
    EXPECT_FALSE(candidates.isCandidate("counter"));
    EXPECT_FALSE(candidates.isCandidate("big"));
    EXPECT_FALSE(candidates.isCandidate("main"));
    EXPECT_EQ(candidates.callee("big"), nullptr);
}

TEST(InliningTest, ThresholdBoundsSize) {
    auto program = analyzeSource(kCandidateProgram);
    ASSERT_TRUE(program.has_value());
    opt::InlineCandidates generous(*program, 100);
    EXPECT_TRUE(generous.isCandidate("big"));
    opt::InlineCandidates none(*program, 0);
    EXPECT_FALSE(none.isCandidate("sq"));
}

class InliningPassTest : public ObfuscationFixture {};

TEST_F(InliningPassTest, InlinesStatementLevelCalls) {
    const char* src =
        "int clamp(int v, int hi) {\n"
        "    if (v > hi) return hi;\n"
        "    if (v < 0) return 0;\n"
        "    return v;\n"
        "}\n"
        "void bump(int *p) { *p = *p + 1; }\n"
        "int main(void) {\n"
        "    int a = clamp(12, 10);\n"
        "    int b;\n"
        "    b = clamp(-4, 10);\n"
        "    bump(&b);\n"
        "    return a * 100 + b + clamp(7, 10) * 0;\n"
        "}\n";

    CompilerOptions options = testOptions(OptLevel::Full);
    expectSameBehavior(src, options);

    options.emit_source = true;
    CompileResult result = compileC(src, options);
    ASSERT_TRUE(result.success) << describe(result.diagnostics);
    EXPECT_GE(result.statistics.get("inlining.calls_inlined"), 3);

    const ast::Function* main_fn = result.program.findFunction("main");
    ASSERT_NE(main_fn, nullptr);
    int calls = 0;
    ast::visitBlockExprs(main_fn->body, [&calls](const ast::Expr& e) {
        if (e.isDirectCall()) calls++;
    });
    // clamp inside the return expression is not a statement-level site
    EXPECT_EQ(calls, 1);
}

TEST_F(InliningPassTest, RenamesCalleeLocalsApart) {
    const char* src =
        "int mix(int x) { int t = x * 3; return t ^ 5; }\n"
        "int main(void) {\n"
        "    int t = 4;\n"
        "    int x = mix(t);\n"
        "    int y = mix(x);\n"
        "    return t + x + y;\n"
        "}\n";
    expectSameBehavior(src, testOptions(OptLevel::Full));
}

TEST_F(InliningPassTest, BasicLevelDoesNotInline) {
    auto plan = Compiler::plannedPasses(testOptions(OptLevel::Basic));
    EXPECT_EQ(std::find(plan.begin(), plan.end(), "inlining"), plan.end());
    auto full = Compiler::plannedPasses(testOptions(OptLevel::Full));
    EXPECT_NE(std::find(full.begin(), full.end(), "inlining"), full.end());
}

// ============================================================================
// Whole optimization pipeline
// ============================================================================

class OptimizationPipelineTest : public ObfuscationFixture {};

TEST_F(OptimizationPipelineTest, PreservesBehavior) {
    const char* src =
        "int printf(const char *fmt, ...);\n"
        "static int square(int v) { return v * v; }\n"
        "int main(void) {\n"
        "    int total = 0;\n"
        "    int scratch = 99;\n"
        "    int i;\n"
        "    for (i = 0; i < 2 * 5; i++) {\n"
        "        if (0) { total = -1; }\n"
        "        total += square(i) + (8 >> 2);\n"
        "    }\n"
        "    printf(\"%d\\n\", total);\n"
        "    return total & 0xff;\n"
        "}\n";
    expectSameBehavior(src, testOptions(OptLevel::Basic));
    expectSameBehavior(src, testOptions(OptLevel::Full));
}

TEST_F(OptimizationPipelineTest, RecordsStatistics) {
    CompilerOptions options = testOptions(OptLevel::Basic);
    options.emit_source = true;
    CompileResult result = compileC(
        "int main(void) { int dead = 3; return 2 + 3; }\n", options);
    ASSERT_TRUE(result.success) << describe(result.diagnostics);
    EXPECT_GT(result.statistics.get("constant_folding.expressions_folded"), 0);
    EXPECT_EQ(result.statistics.get("dead_code_elimination.variables_removed"), 1);
}

TEST_F(OptimizationPipelineTest, SwitchesTurnOffIndividualPasses) {
    CompilerOptions options = testOptions(OptLevel::Basic);
    options.constant_folding = false;
    auto plan = Compiler::plannedPasses(options);
    ASSERT_EQ(plan.size(), 1u);
    EXPECT_EQ(plan[0], "dead_code_elimination");

    options.dead_code_elimination = false;
    EXPECT_TRUE(Compiler::plannedPasses(options).empty());
}
