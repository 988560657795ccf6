/**
 * Cloak - Obfuscating C Compiler
 *
 * transformation_base.hpp - Base class for all transformation passes
 *
 * Every optimization and obfuscation pass derives from TransformationPass.
 * A pass never modifies its input: run() builds the successor Program,
 * and the pass manager re-analyzes it before handing it on.
 */

#ifndef CLOAK_TRANSFORMATION_BASE_HPP
#define CLOAK_TRANSFORMATION_BASE_HPP

#include "compile_context.hpp"
#include "../ast/ast_walk.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

namespace cloak {

/**
 * Result of transforming one function
 */
enum class TransformResult {
    Success,        // the function changed
    Skipped,        // probability or configuration said no
    NotApplicable   // nothing in the function matched
};

/**
 * Pass ordering. Optimizations run before obfuscations; within each group
 * the order is fixed.
 */
enum class PassPriority {
    ConstantFolding        = 100,
    DeadCodeElimination    = 110,
    Inlining               = 120,

    Renaming               = 200,
    StringEncryption       = 300,
    ExpressionComplication = 400,
    OpaquePredicates       = 500,
    DeadCodeInsertion      = 600,
    Flattening             = 700
};

enum class PassKind {
    Optimization,
    Obfuscation
};

/**
 * Base configuration for all passes
 */
struct PassConfig {
    bool enabled = true;
    double probability = 1.0;   // per-site transformation probability

    // Optional per-function control
    std::vector<std::string> include_functions;  // Only these functions
    std::vector<std::string> exclude_functions;  // Skip these functions
};

/**
 * Abstract base class for all transformation passes
 *
 * Lifecycle:
 *   1. Constructor - pass-specific settings
 *   2. initialize(config) - common configuration
 *   3. run(program, ctx) - once per compilation unit
 */
class TransformationPass {
public:
    virtual ~TransformationPass() = default;

    /**
     * Unique name; used for statistics keys and timing rows
     */
    virtual std::string getName() const = 0;

    virtual std::string getDescription() const = 0;

    virtual PassPriority getPriority() const = 0;

    virtual PassKind getKind() const { return PassKind::Obfuscation; }

    virtual bool initialize(const PassConfig& config) {
        config_ = config;
        return true;
    }

    bool isEnabled() const { return config_.enabled; }
    void setEnabled(bool enabled) { config_.enabled = enabled; }
    const PassConfig& getConfig() const { return config_; }

    /**
     * Builds the successor program. Throws InternalError when the pass
     * cannot keep the program's meaning.
     */
    virtual ast::Program run(const ast::Program& program, CompileContext& ctx) = 0;

    const std::map<std::string, int>& getStatistics() const { return statistics_; }

    void resetStatistics() { statistics_.clear(); }

protected:
    PassConfig config_;
    std::map<std::string, int> statistics_;

    void incrementStat(const std::string& name, int amount = 1) {
        statistics_[name] += amount;
    }

    /**
     * Draws against the configured probability
     */
    bool shouldTransform(CompileContext& ctx) const {
        return ctx.rng().decide(config_.probability);
    }

    /**
     * Check if a function should be processed based on include/exclude lists
     */
    bool shouldProcessFunction(const std::string& func_name) const {
        const auto& inc = config_.include_functions;
        if (!inc.empty() && std::find(inc.begin(), inc.end(), func_name) == inc.end()) {
            return false;
        }
        const auto& exc = config_.exclude_functions;
        return std::find(exc.begin(), exc.end(), func_name) == exc.end();
    }
};

/**
 * Pass that rewrites each function definition on its own. Synthetic
 * helpers added by earlier passes are left alone.
 */
class FunctionPass : public TransformationPass {
public:
    ast::Program run(const ast::Program& program, CompileContext& ctx) override {
        ast::Program out = program;
        // fresh names never collide with anything the program spells
        ctx.reserve(ast::collectNames(program));
        beginProgram(out, ctx);
        for (auto& d : out.decls) {
            if (d.kind != ast::DeclKind::Function) continue;
            ast::Function& f = d.func;
            if (!f.is_definition || f.meta.synthetic || !shouldProcessFunction(f.name)) continue;
            if (transformFunction(f, ctx) == TransformResult::Success) {
                incrementStat("functions_transformed");
            }
        }
        endProgram(out, ctx);
        return out;
    }

protected:
    virtual void beginProgram(ast::Program&, CompileContext&) {}
    virtual TransformResult transformFunction(ast::Function& f, CompileContext& ctx) = 0;
    virtual void endProgram(ast::Program&, CompileContext&) {}
};

} // namespace cloak

#endif // CLOAK_TRANSFORMATION_BASE_HPP
