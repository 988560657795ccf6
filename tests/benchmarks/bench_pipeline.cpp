/**
 * Cloak - Pipeline Benchmarks
 *
 * Measures the front end, the MBA rewrites and whole compilations at each
 * optimization and obfuscation level.
 */

#include <benchmark/benchmark.h>
#include "ast/ast_walk.hpp"
#include "ast/const_eval.hpp"
#include "backends/x86/x86_codegen.hpp"
#include "core/pipeline.hpp"
#include "frontend/parser.hpp"
#include "passes/mba/mba.hpp"
#include "sema/semantic_analyzer.hpp"

#include <string>

using namespace cloak;

namespace {

const char* kProgram = R"(
int printf(const char *fmt, ...);
int table[16] = { 3, 1, 4, 1, 5, 9, 2, 6, 5, 3, 5, 8, 9, 7, 9, 3 };
unsigned int hash(const char *s) {
    unsigned int h = 2166136261u;
    while (*s) { h ^= (unsigned char)*s++; h *= 16777619u; }
    return h;
}
int classify(int v) {
    switch (v % 5) {
    case 0: return v * 3;
    case 1: return v - 7;
    case 2: return v ^ 0x55;
    case 3: return v & 0xF0;
    default: return v | 1;
    }
}
void sort(int *a, int n) {
    int i, j;
    for (i = 0; i < n - 1; i++)
        for (j = 0; j < n - 1 - i; j++)
            if (a[j] > a[j + 1]) { int t = a[j]; a[j] = a[j + 1]; a[j + 1] = t; }
}
int main(void) {
    int i, total = 0;
    sort(table, 16);
    for (i = 0; i < 16; i++) total += classify(table[i]);
    printf("%d %u\n", total, hash("benchmark"));
    return total & 0x7f;
}
)";

/**
 * Repeats the program's helper functions under new names so the input
 * grows with n
 */
std::string scaledProgram(int n) {
    std::string out = "int printf(const char *fmt, ...);\n";
    for (int i = 0; i < n; i++) {
        std::string id = std::to_string(i);
        out += "int f" + id + "(int a, int b) {\n"
               "    int r = 0, k;\n"
               "    for (k = 0; k < b; k++) {\n"
               "        if ((a ^ k) & 1) r += a * k - b; else r -= (a | k) + " + id + ";\n"
               "    }\n"
               "    return r;\n"
               "}\n";
    }
    out += "int main(void) {\n    int s = 0;\n";
    for (int i = 0; i < n; i++) out += "    s += f" + std::to_string(i) + "(s, 5);\n";
    out += "    printf(\"%d\\n\", s);\n    return 0;\n}\n";
    return out;
}

CompilerOptions benchOptions(OptLevel opt, ObfLevel obf) {
    CompilerOptions options;
    options.optimization = opt;
    options.obfuscation = obf;
    options.preprocess = false;
    options.seed = 42;
    return options;
}

} // namespace

// ============================================================================
// Benchmark: Front end
// ============================================================================

static void BM_Parse(benchmark::State& state) {
    std::string source = scaledProgram(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto parsed = frontend::parse(source);
        benchmark::DoNotOptimize(parsed.program.decls.size());
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(source.size()));
}
BENCHMARK(BM_Parse)->Arg(8)->Arg(64);

static void BM_Analyze(benchmark::State& state) {
    auto parsed = frontend::parse(scaledProgram(static_cast<int>(state.range(0))));
    if (!parsed.success) {
        state.SkipWithError("parse failed");
        return;
    }
    for (auto _ : state) {
        auto analyzed = sema::analyze(parsed.program);
        benchmark::DoNotOptimize(analyzed.success);
    }
}
BENCHMARK(BM_Analyze)->Arg(8)->Arg(64);

// ============================================================================
// Benchmark: MBA rewrites
// ============================================================================

template <typename T>
static void BM_MBARewrite(benchmark::State& state) {
    T transform;
    size_t variant = static_cast<size_t>(state.range(0)) % transform.getVariantCount();
    ast::Expr a = ast::make::intLit(0x12345678);
    ast::Expr b = ast::make::intLit(-977);
    ast::ConstEvaluator eval;

    for (auto _ : state) {
        ast::Expr rewritten = transform.apply(variant, a, b);
        auto value = eval.evaluate(rewritten);
        benchmark::DoNotOptimize(value);
    }
}
BENCHMARK_TEMPLATE(BM_MBARewrite, mba::MBAAdd)->DenseRange(0, 3);
BENCHMARK_TEMPLATE(BM_MBARewrite, mba::MBASub)->DenseRange(0, 4);
BENCHMARK_TEMPLATE(BM_MBARewrite, mba::MBAXor)->DenseRange(0, 3);
BENCHMARK_TEMPLATE(BM_MBARewrite, mba::MBAMult)->DenseRange(0, 3);

static void BM_ExpressionComplicator(benchmark::State& state) {
    auto analyzed = sema::analyze(frontend::parse(kProgram).program);
    if (!analyzed.success) {
        state.SkipWithError("analysis failed");
        return;
    }
    mba::ExpressionComplicator complicator;
    mba::MBAConfig config;
    config.probability = 1.0;
    complicator.configure(config);
    Random rng(7);

    for (auto _ : state) {
        ast::Program copy = analyzed.program;
        int rewritten = 0;
        copy.forEachFunction([&](ast::Function& f) {
            ast::visitBlockStmts(f.body, [&](ast::Stmt& s) {
                if (s.expr) rewritten += complicator.complicate(*s.expr, rng);
            });
        });
        benchmark::DoNotOptimize(rewritten);
    }
}
BENCHMARK(BM_ExpressionComplicator);

// ============================================================================
// Benchmark: Whole compilations
// ============================================================================

static void BM_Compile(benchmark::State& state) {
    auto opt = static_cast<OptLevel>(state.range(0));
    auto obf = static_cast<ObfLevel>(state.range(1));
    Compiler compiler(benchOptions(opt, obf));

    for (auto _ : state) {
        CompileResult result = compiler.compileSource(kProgram);
        if (!result.success) {
            state.SkipWithError("compilation failed");
            break;
        }
        benchmark::DoNotOptimize(result.output.size());
    }
}
BENCHMARK(BM_Compile)
    ->Args({0, 0})
    ->Args({2, 0})
    ->Args({0, 1})
    ->Args({0, 2})
    ->Args({2, 2});

static void BM_CompileScaled(benchmark::State& state) {
    std::string source = scaledProgram(static_cast<int>(state.range(0)));
    Compiler compiler(benchOptions(OptLevel::Full, ObfLevel::Aggressive));

    for (auto _ : state) {
        CompileResult result = compiler.compileSource(source);
        if (!result.success) {
            state.SkipWithError("compilation failed");
            break;
        }
        benchmark::DoNotOptimize(result.output.size());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_CompileScaled)->RangeMultiplier(2)->Range(4, 64)->Complexity();

static void BM_Codegen(benchmark::State& state) {
    auto parsed = frontend::parse(kProgram);
    auto analyzed = sema::analyze(parsed.program);
    if (!analyzed.success) {
        state.SkipWithError("analysis failed");
        return;
    }
    for (auto _ : state) {
        auto out = codegen::generate(analyzed.program);
        benchmark::DoNotOptimize(out.assembly.size());
    }
}
BENCHMARK(BM_Codegen);

BENCHMARK_MAIN();
