/**
 * Cloak - Obfuscating C Compiler
 *
 * pipeline.hpp - The compilation pipeline
 *
 * source -> preprocessor (optional) -> parser -> semantic analysis ->
 * optimization passes -> obfuscation passes -> x86 code generator
 * (or the C printer when emit_source is set)
 *
 * Each stage hands a new Program to the next. The first error ends the
 * compilation; nothing is written to the output stream unless every
 * stage succeeded.
 */

#ifndef CLOAK_PIPELINE_HPP
#define CLOAK_PIPELINE_HPP

#include "compile_context.hpp"
#include "diagnostics.hpp"
#include "options.hpp"
#include "pass_manager.hpp"
#include "statistics.hpp"
#include "../ast/ast.hpp"
#include "../backends/x86/frame_planner.hpp"
#include "../common/logging.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace cloak {

struct CompileResult {
    bool success = false;
    std::string output;                         // assembly, or C source with emit_source
    ast::Program program;                       // after the last pass
    DiagnosticList diagnostics;
    Statistics statistics;
    std::vector<codegen::FrameLayout> frames;   // empty with emit_source
};

class Compiler {
public:
    explicit Compiler(CompilerOptions options = {}) : options_(std::move(options)) {}

    const CompilerOptions& options() const { return options_; }

    /**
     * Compiles source text. The text goes through the preprocessor first
     * when options().preprocess is set.
     */
    CompileResult compileSource(const std::string& source);

    /**
     * Same as compileSource, writing the output to out on success
     */
    CompileResult compile(const std::string& source, std::ostream& out);

    CompileResult compileFile(const std::string& path);

    /**
     * Starts from a parsed Program (semantic analysis onward)
     */
    CompileResult compileProgram(const ast::Program& program);

    /**
     * Adds the passes the options select, in pipeline order
     */
    static void registerPasses(PassManager& pm, const CompilerOptions& options);

    /**
     * Names of the passes a compilation with these options runs
     */
    static std::vector<std::string> plannedPasses(const CompilerOptions& options);

private:
    CompilerOptions options_;
    Logger logger_{"Compiler"};

    CompileResult fromText(const std::string& text, Statistics stats);
};

} // namespace cloak

#endif // CLOAK_PIPELINE_HPP
