/**
 * Cloak - Obfuscating C Compiler
 *
 * pipeline.cpp - The compilation pipeline
 */

#include "pipeline.hpp"

#include "../ast/ast_printer.hpp"
#include "../backends/x86/x86_codegen.hpp"
#include "../frontend/parser.hpp"
#include "../frontend/preprocessor.hpp"
#include "../passes/cff/cff.hpp"
#include "../passes/data/data.hpp"
#include "../passes/deadcode/deadcode.hpp"
#include "../passes/mba/mba.hpp"
#include "../passes/opt/opt.hpp"
#include "../passes/rename/identifier_renaming.hpp"
#include "../sema/semantic_analyzer.hpp"

#include <fstream>
#include <memory>
#include <sstream>

namespace cloak {

namespace {

template<typename T>
std::unique_ptr<T> configured(std::unique_ptr<T> pass, const CompilerOptions& options,
                              double probability) {
    PassConfig pc;
    pc.probability = probability;
    pc.include_functions = options.include_functions;
    pc.exclude_functions = options.exclude_functions;
    pass->initialize(pc);
    return pass;
}

} // namespace

void Compiler::registerPasses(PassManager& pm, const CompilerOptions& options) {
    if (options.optimizing()) {
        if (options.constant_folding) {
            pm.registerPass(std::make_unique<opt::ConstantFoldingPass>());
        }
        if (options.dead_code_elimination) {
            pm.registerPass(std::make_unique<opt::DeadCodeEliminationPass>());
        }
        if (options.optimization == OptLevel::Full) {
            pm.registerPass(std::make_unique<opt::InliningPass>(options.inline_threshold));
        }
    }

    if (!options.obfuscating()) return;

    pm.registerPass(configured(std::make_unique<rename::IdentifierRenamingPass>(options.rename_style),
                               options, 1.0));
    if (options.string_encryption) {
        pm.registerPass(configured(std::make_unique<data::StringEncryptionPass>(), options, 1.0));
    }

    if (options.obfuscation != ObfLevel::Aggressive) return;

    if (options.expression_complication) {
        mba::MBAConfig mba;
        mba.probability = options.complication_probability;
        pm.registerPass(configured(std::make_unique<mba::ExpressionComplicationPass>(mba),
                                   options, options.complication_probability));
    }
    if (options.opaque_predicates) {
        cff::BogusConfig bogus;
        bogus.probability = options.opaque_predicate_probability;
        bogus.complexity = options.predicate_complexity;
        pm.registerPass(configured(std::make_unique<cff::OpaquePredicatePass>(bogus),
                                   options, options.opaque_predicate_probability));
    }
    if (options.dead_code_insertion_ratio > 0.0) {
        deadcode::DeadCodeConfig dc;
        dc.probability = options.dead_code_insertion_ratio;
        dc.predicate_complexity = options.predicate_complexity;
        pm.registerPass(configured(std::make_unique<deadcode::DeadCodeInsertionPass>(dc),
                                   options, options.dead_code_insertion_ratio));
    }
    if (options.control_flow_flattening) {
        pm.registerPass(configured(std::make_unique<cff::ControlFlowFlatteningPass>(),
                                   options, 1.0));
    }
}

std::vector<std::string> Compiler::plannedPasses(const CompilerOptions& options) {
    PassManager pm;
    registerPasses(pm, options);
    return pm.getEnabledPasses();
}

CompileResult Compiler::compileFile(const std::string& path) {
    if (options_.preprocess) {
        Statistics stats;
        frontend::PreprocessResult pre;
        {
            ScopedTimer timer(stats.timing("preprocess"));
            pre = frontend::Preprocessor(options_.preprocessor).preprocessFile(path);
        }
        if (!pre.success) {
            CompileResult result;
            result.diagnostics = std::move(pre.diagnostics);
            result.statistics = std::move(stats);
            return result;
        }
        CompileResult result = fromText(pre.output, std::move(stats));
        DiagnosticList all = pre.diagnostics;
        all.append(result.diagnostics);
        result.diagnostics = std::move(all);
        return result;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        CompileResult result;
        result.diagnostics.fatal(DiagCode::ExternalToolFailure, "cannot open '" + path + "'");
        return result;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return fromText(buf.str(), {});
}

CompileResult Compiler::compileSource(const std::string& source) {
    if (!options_.preprocess) return fromText(source, {});

    Statistics stats;
    frontend::PreprocessResult pre;
    {
        ScopedTimer timer(stats.timing("preprocess"));
        pre = frontend::Preprocessor(options_.preprocessor).preprocessString(source);
    }
    if (!pre.success) {
        CompileResult result;
        result.diagnostics = std::move(pre.diagnostics);
        result.statistics = std::move(stats);
        return result;
    }
    CompileResult result = fromText(pre.output, std::move(stats));
    DiagnosticList all = pre.diagnostics;
    all.append(result.diagnostics);
    result.diagnostics = std::move(all);
    return result;
}

CompileResult Compiler::compile(const std::string& source, std::ostream& out) {
    CompileResult result = compileSource(source);
    if (result.success) out << result.output;
    return result;
}

CompileResult Compiler::fromText(const std::string& text, Statistics stats) {
    frontend::ParseResult parsed;
    {
        ScopedTimer timer(stats.timing("parse"));
        parsed = frontend::parse(text);
    }
    if (!parsed.success) {
        CompileResult result;
        result.diagnostics = std::move(parsed.diagnostics);
        result.statistics = std::move(stats);
        return result;
    }
    CompileResult result = compileProgram(parsed.program);
    stats.merge(result.statistics);
    result.statistics = std::move(stats);
    return result;
}

CompileResult Compiler::compileProgram(const ast::Program& program) {
    CompileResult result;
    CompileContext ctx(options_);

    sema::AnalysisResult analysis;
    {
        ScopedTimer timer(ctx.stats().timing("sema"));
        analysis = sema::analyze(program);
    }
    result.diagnostics.append(analysis.diagnostics);
    if (!analysis.success) {
        logger_.debug("semantic analysis failed");
        result.statistics = ctx.stats();
        return result;
    }

    PassManager pm;
    registerPasses(pm, options_);
    logger_.info("running {} passes", pm.getEnabledPasses().size());
    PassRunResult passes = pm.run(analysis.program, ctx);
    result.diagnostics.append(passes.diagnostics);
    if (!passes.success) {
        result.statistics = ctx.stats();
        return result;
    }
    result.program = std::move(passes.program);

    if (options_.emit_source) {
        result.output = ast::printProgram(result.program);
        result.success = true;
        result.statistics = ctx.stats();
        return result;
    }

    codegen::CodegenResult code;
    {
        ScopedTimer timer(ctx.stats().timing("codegen"));
        code = codegen::generate(result.program);
    }
    result.diagnostics.append(code.diagnostics);
    ctx.stats().mergePrefixed("codegen", code.stats);
    result.statistics = ctx.stats();
    if (!code.success) return result;

    result.output = std::move(code.assembly);
    result.frames = std::move(code.frames);
    result.success = true;
    return result;
}

} // namespace cloak
