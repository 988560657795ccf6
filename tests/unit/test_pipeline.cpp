/**
 * Cloak - Pipeline and Pass Manager Tests
 */

#include <gtest/gtest.h>
#include "fixtures/obfuscation_fixture.hpp"
#include "core/pass_manager.hpp"
#include "passes/cff/cff.hpp"

#include <sstream>

using namespace cloak;
using namespace cloak::test;

namespace {

const char* kFactorial = "int f(int n){ if(n<=1) return 1; return n*f(n-1); }\n";

/**
 * Test pass: renames every function call target, leaving the program
 * ill-formed
 */
class BreakCallsPass : public FunctionPass {
public:
    std::string getName() const override { return "break_calls"; }
    std::string getDescription() const override { return "test pass"; }
    PassPriority getPriority() const override { return PassPriority::Renaming; }

protected:
    TransformResult transformFunction(ast::Function& f, CompileContext&) override {
        ast::visitBlockExprs(f.body, [](ast::Expr& e) {
            if (e.kind == ast::ExprKind::Call) e.args[0].text = "no_such_function";
        });
        return TransformResult::Success;
    }
};

class ThrowingPass : public TransformationPass {
public:
    std::string getName() const override { return "throwing"; }
    std::string getDescription() const override { return "test pass"; }
    PassPriority getPriority() const override { return PassPriority::ConstantFolding; }

    ast::Program run(const ast::Program&, CompileContext&) override {
        throw InternalError("invariant broken");
    }
};

class CountingPass : public FunctionPass {
public:
    explicit CountingPass(std::string name, PassPriority priority)
        : name_(std::move(name)), priority_(priority) {}

    std::string getName() const override { return name_; }
    std::string getDescription() const override { return "test pass"; }
    PassPriority getPriority() const override { return priority_; }

protected:
    TransformResult transformFunction(ast::Function&, CompileContext&) override {
        incrementStat("seen");
        return TransformResult::NotApplicable;
    }

private:
    std::string name_;
    PassPriority priority_;
};

} // namespace

// ============================================================================
// Pass planning
// ============================================================================

TEST(PipelinePlanTest, PlainCompileRunsNoPasses) {
    EXPECT_TRUE(Compiler::plannedPasses(testOptions()).empty());
}

TEST(PipelinePlanTest, OptimizationLevels) {
    std::vector<std::string> basic = {"constant_folding", "dead_code_elimination"};
    EXPECT_EQ(Compiler::plannedPasses(testOptions(OptLevel::Basic)), basic);

    std::vector<std::string> full = {"constant_folding", "dead_code_elimination", "inlining"};
    EXPECT_EQ(Compiler::plannedPasses(testOptions(OptLevel::Full)), full);
}

TEST(PipelinePlanTest, ObfuscationLevels) {
    std::vector<std::string> basic = {"identifier_renaming", "string_encryption"};
    EXPECT_EQ(Compiler::plannedPasses(testOptions(OptLevel::None, ObfLevel::Basic)), basic);

    std::vector<std::string> aggressive = {
        "identifier_renaming", "string_encryption", "expression_complication",
        "opaque_predicates", "dead_code_insertion", "control_flow_flattening"
    };
    EXPECT_EQ(Compiler::plannedPasses(testOptions(OptLevel::None, ObfLevel::Aggressive)), aggressive);
}

TEST(PipelinePlanTest, OptimizeThenObfuscate) {
    auto plan = Compiler::plannedPasses(testOptions(OptLevel::Full, ObfLevel::Aggressive));
    ASSERT_EQ(plan.size(), 9u);
    EXPECT_EQ(plan.front(), "constant_folding");
    EXPECT_EQ(plan[2], "inlining");
    EXPECT_EQ(plan[3], "identifier_renaming");
    EXPECT_EQ(plan.back(), "control_flow_flattening");
}

TEST(PipelinePlanTest, TogglesDropPasses) {
    CompilerOptions options = testOptions(OptLevel::None, ObfLevel::Aggressive);
    options.string_encryption = false;
    options.control_flow_flattening = false;
    options.dead_code_insertion_ratio = 0.0;
    std::vector<std::string> expected = {
        "identifier_renaming", "expression_complication", "opaque_predicates"
    };
    EXPECT_EQ(Compiler::plannedPasses(options), expected);
}

// ============================================================================
// Pass manager
// ============================================================================

TEST(PassManagerTest, RunsInPriorityOrder) {
    PassManager pm;
    pm.registerPass(std::make_unique<CountingPass>("late", PassPriority::Flattening));
    pm.registerPass(std::make_unique<CountingPass>("early", PassPriority::ConstantFolding));
    pm.registerPass(std::make_unique<CountingPass>("middle", PassPriority::Renaming));
    std::vector<std::string> expected = {"early", "middle", "late"};
    EXPECT_EQ(pm.getPassOrder(), expected);

    EXPECT_TRUE(pm.setPassEnabled("middle", false));
    EXPECT_FALSE(pm.setPassEnabled("missing", false));
    expected = {"early", "late"};
    EXPECT_EQ(pm.getEnabledPasses(), expected);
}

TEST(PassManagerTest, StatisticsArePrefixedByPass) {
    auto program = analyzeSource("int a(void) { return 1; }\nint b(void) { return a(); }\n");
    ASSERT_TRUE(program.has_value());
    PassManager pm;
    pm.registerPass(std::make_unique<CountingPass>("counter", PassPriority::Renaming));
    CompileContext ctx(testOptions());
    PassRunResult r = pm.run(*program, ctx);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(ctx.stats().get("counter.seen"), 2);
    EXPECT_EQ(ctx.stats().get("passes_run"), 1);
    EXPECT_FALSE(ctx.stats().has("counter.functions_transformed"));
}

TEST(PassManagerTest, IllFormedResultIsInternalInconsistency) {
    auto program = analyzeSource("int g(void) { return 1; }\nint main(void) { return g(); }\n");
    ASSERT_TRUE(program.has_value());
    PassManager pm;
    pm.registerPass(std::make_unique<BreakCallsPass>());
    CompileContext ctx(testOptions());
    PassRunResult r = pm.run(*program, ctx);
    EXPECT_FALSE(r.success);
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::InternalInconsistency);
    EXPECT_NE(r.diagnostics.firstError()->message.find("break_calls"), std::string::npos);
}

TEST(PassManagerTest, InternalErrorStopsThePipeline) {
    auto program = analyzeSource("int main(void) { return 0; }\n");
    ASSERT_TRUE(program.has_value());
    PassManager pm;
    pm.registerPass(std::make_unique<ThrowingPass>());
    pm.registerPass(std::make_unique<CountingPass>("after", PassPriority::Flattening));
    CompileContext ctx(testOptions());
    PassRunResult r = pm.run(*program, ctx);
    EXPECT_FALSE(r.success);
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::InternalInconsistency);
    EXPECT_FALSE(ctx.stats().has("after.seen"));
}

TEST(PassManagerTest, InputProgramIsNotModified) {
    auto program = analyzeSource(kFactorial);
    ASSERT_TRUE(program.has_value());
    std::string before = ast::printProgram(*program);

    PassManager pm;
    Compiler::registerPasses(pm, testOptions(OptLevel::Full, ObfLevel::Aggressive));
    CompileContext ctx(testOptions());
    PassRunResult r = pm.run(*program, ctx);
    ASSERT_TRUE(r.success) << describe(r.diagnostics);
    EXPECT_EQ(ast::printProgram(*program), before);
    EXPECT_NE(ast::printProgram(r.program), before);
}

// ============================================================================
// Compiler
// ============================================================================

class PipelineTest : public ObfuscationFixture {};

TEST_F(PipelineTest, FactorialWithoutPasses) {
    CompilerOptions options = testOptions();
    options.emit_source = true;
    CompileResult r = compileC(kFactorial, options);
    ASSERT_TRUE(r.success);
    ReferenceInterpreter interp(r.program);
    RunResult run = interp.call("f", {5});
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.value, 120);
}

TEST_F(PipelineTest, FlattenedFactorialHasOneDispatchLoop) {
    CompilerOptions options = testOptions(OptLevel::None, ObfLevel::Aggressive);
    options.string_encryption = false;
    options.expression_complication = false;
    options.opaque_predicates = false;
    options.dead_code_insertion_ratio = 0.0;
    options.emit_source = true;

    CompileResult r = compileC(kFactorial, options);
    ASSERT_TRUE(r.success) << describe(r.diagnostics);
    const ast::Function* f = r.program.findFunction("f");
    ASSERT_NE(f, nullptr);
    auto machines = cff::DispatchAnalyzer().analyze(*f);
    ASSERT_EQ(machines.size(), 1u);
    EXPECT_TRUE(cff::DispatchAnalyzer::coversAllStates(machines[0]));

    ReferenceInterpreter interp(r.program);
    RunResult run = interp.call("f", {5});
    ASSERT_TRUE(run.ok) << run.error;
    EXPECT_EQ(run.value, 120);
}

TEST_F(PipelineTest, UndeclaredIdentifierProducesNoOutput) {
    std::ostringstream out;
    Compiler compiler(testOptions());
    CompileResult r = compiler.compile("int main(void) { return missing + 1; }\n", out);
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.output.empty());
    EXPECT_TRUE(out.str().empty());
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::UnresolvedSymbol);
}

TEST_F(PipelineTest, SuccessWritesTheStream) {
    std::ostringstream out;
    Compiler compiler(testOptions());
    CompileResult r = compiler.compile("int main(void) { return 0; }\n", out);
    ASSERT_TRUE(r.success);
    EXPECT_EQ(out.str(), r.output);
    EXPECT_NE(out.str().find("main:"), std::string::npos);
}

TEST_F(PipelineTest, SyntaxErrorsStopBeforeAnalysis) {
    CompileResult r = compileC("int main(void) { return 0 }\n");
    EXPECT_FALSE(r.success);
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::SyntaxInput);
    EXPECT_EQ(r.statistics.timing("sema"), 0.0);
}

TEST_F(PipelineTest, WarningsDoNotStopCompilation) {
    CompileResult r = compileC(
        "int f(char *c) { int *p = c; return p == c; }\n"
        "int main(void) { return f(0); }\n");
    EXPECT_TRUE(r.success) << describe(r.diagnostics);
    EXPECT_GE(r.diagnostics.count(Severity::Warning), 1u);
    EXPECT_EQ(r.diagnostics.firstError(), nullptr);
}

TEST_F(PipelineTest, EmitSourceReturnsCompilableC) {
    CompilerOptions options = testOptions(OptLevel::Basic, ObfLevel::Aggressive, 9);
    options.emit_source = true;
    CompileResult r = compileC(kFactorial, options);
    ASSERT_TRUE(r.success) << describe(r.diagnostics);
    EXPECT_TRUE(r.frames.empty());
    EXPECT_EQ(r.output, ast::printProgram(r.program));

    // the printed program parses and analyzes again
    CompilerOptions again = testOptions();
    again.emit_source = true;
    CompileResult reparsed = compileC(r.output, again);
    EXPECT_TRUE(reparsed.success) << describe(reparsed.diagnostics) << r.output;
}

TEST_F(PipelineTest, StructReturnFailsOnlyInCodegen) {
    const char* src =
        "struct P { int a; int b; };\n"
        "struct P make(int a) { struct P p; p.a = a; p.b = a + 1; return p; }\n"
        "int main(void) { return 0; }\n";
    CompileResult r = compileC(src);
    EXPECT_FALSE(r.success);
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::UnsupportedConstruct);
    EXPECT_TRUE(r.output.empty());

    CompilerOptions options = testOptions();
    options.emit_source = true;
    CompileResult printed = compileC(src, options);
    ASSERT_TRUE(printed.success) << describe(printed.diagnostics);
    EXPECT_NE(printed.output.find("struct P make(int a)"), std::string::npos) << printed.output;
}

TEST_F(PipelineTest, SameSeedSameAssembly) {
    CompilerOptions options = testOptions(OptLevel::Full, ObfLevel::Aggressive, 1234);
    CompileResult a = compileC(kFactorial, options);
    CompileResult b = compileC(kFactorial, options);
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    EXPECT_EQ(a.output, b.output);
}

TEST_F(PipelineTest, StatisticsCoverEveryStage) {
    CompileResult r = compileC(kFactorial, testOptions(OptLevel::Basic, ObfLevel::Basic));
    ASSERT_TRUE(r.success);
    const auto& timings = r.statistics.timings();
    EXPECT_TRUE(timings.count("parse"));
    EXPECT_TRUE(timings.count("sema"));
    EXPECT_TRUE(timings.count("constant_folding"));
    EXPECT_TRUE(timings.count("identifier_renaming"));
    EXPECT_TRUE(timings.count("codegen"));
    EXPECT_EQ(r.statistics.get("passes_run"), 4);
}

TEST_F(PipelineTest, CompileFileWithoutPreprocessor) {
    auto path = writeSource("input.c", kFactorial);
    CompilerOptions options = testOptions();
    Compiler compiler(options);
    CompileResult r = compiler.compileFile(path.string());
    ASSERT_TRUE(r.success) << describe(r.diagnostics);
    EXPECT_NE(r.output.find("f:"), std::string::npos);

    CompileResult missing = compiler.compileFile((test_dir_ / "nope.c").string());
    EXPECT_FALSE(missing.success);
    ASSERT_NE(missing.diagnostics.firstError(), nullptr);
    EXPECT_EQ(missing.diagnostics.firstError()->code, DiagCode::ExternalToolFailure);
}

TEST_F(PipelineTest, MissingPreprocessorIsExternalToolFailure) {
    CompilerOptions options = testOptions();
    options.preprocess = true;
    options.preprocessor.tool = "cloak-no-such-preprocessor";
    Compiler compiler(options);
    CompileResult r = compiler.compileSource("int main(void) { return 0; }\n");
    EXPECT_FALSE(r.success);
    EXPECT_TRUE(r.output.empty());
    ASSERT_NE(r.diagnostics.firstError(), nullptr);
    EXPECT_EQ(r.diagnostics.firstError()->code, DiagCode::ExternalToolFailure);
}
