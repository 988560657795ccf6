/*
 * pass_manager.hpp
 *
 * handles registering and running the transformation passes. after each
 * pass the successor program is analyzed again; a program a pass left
 * ill-formed is an InternalInconsistency, never a user error.
 */

#ifndef CLOAK_PASS_MANAGER_HPP
#define CLOAK_PASS_MANAGER_HPP

#include "transformation_base.hpp"
#include "statistics.hpp"
#include "../common/logging.hpp"
#include "../sema/semantic_analyzer.hpp"

#include <algorithm>
#include <memory>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace cloak {

struct PassEntry {
    std::unique_ptr<TransformationPass> pass;
    bool enabled;
    int order;
};

struct PassRunResult {
    bool success = false;
    ast::Program program;
    DiagnosticList diagnostics;
};

class PassManager {
public:
    PassManager() : logger_("PassManager") {}

    // takes ownership of the pass
    template<typename T>
    void registerPass(std::unique_ptr<T> pass) {
        static_assert(
            std::is_base_of<TransformationPass, T>::value,
            "Pass must inherit from TransformationPass"
        );

        std::string name = pass->getName();

        if (passes_.find(name) != passes_.end()) {
            logger_.warn("Pass '{}' already registered, replacing", name);
        }

        PassEntry entry;
        entry.pass = std::move(pass);
        entry.enabled = entry.pass->isEnabled();
        entry.order = static_cast<int>(entry.pass->getPriority());

        passes_[name] = std::move(entry);
        pass_order_dirty_ = true;

        logger_.debug("Registered pass: {}", name);
    }

    TransformationPass* getPass(const std::string& name) {
        auto it = passes_.find(name);
        return it != passes_.end() ? it->second.pass.get() : nullptr;
    }

    bool setPassEnabled(const std::string& name, bool enabled) {
        auto it = passes_.find(name);
        if (it == passes_.end()) return false;
        it->second.enabled = enabled;
        it->second.pass->setEnabled(enabled);
        return true;
    }

    /**
     * Names of every registered pass in execution order
     */
    std::vector<std::string> getPassOrder() {
        if (pass_order_dirty_) computePassOrder();
        return ordered_passes_;
    }

    /**
     * Names of the passes that will actually run
     */
    std::vector<std::string> getEnabledPasses() {
        std::vector<std::string> names;
        for (const auto& name : getPassOrder()) {
            if (passes_[name].enabled) names.push_back(name);
        }
        return names;
    }

    size_t size() const { return passes_.size(); }

    /**
     * Runs the enabled passes in order. Stops at the first pass that
     * fails or leaves a program that does not analyze.
     */
    PassRunResult run(const ast::Program& program, CompileContext& ctx) {
        if (pass_order_dirty_) computePassOrder();

        PassRunResult result;
        result.program = program;

        for (const auto& name : ordered_passes_) {
            auto& entry = passes_[name];
            if (!entry.enabled) continue;

            logger_.debug("Running pass: {}", name);
            ast::Program next;
            try {
                ScopedTimer timer(ctx.stats().timing(name));
                next = entry.pass->run(result.program, ctx);
            } catch (const CompileError& e) {
                result.diagnostics.add(e.diagnostic());
                return result;
            } catch (const InternalError& e) {
                logger_.error("Pass '{}' failed: {}", name, e.what());
                Diagnostic d = e.toDiagnostic();
                d.message = "pass '" + name + "': " + d.message;
                result.diagnostics.add(d);
                return result;
            }

            sema::AnalysisResult analysis = sema::analyze(next);
            if (!analysis.success) {
                const Diagnostic* first = analysis.diagnostics.firstError();
                std::string detail = first ? first->format() : "unknown error";
                logger_.error("Pass '{}' produced an ill-formed program: {}", name, detail);
                result.diagnostics.fatal(DiagCode::InternalInconsistency,
                                         "pass '" + name + "' produced an ill-formed program: " + detail);
                return result;
            }

            result.program = std::move(analysis.program);
            ctx.stats().mergePrefixed(name, entry.pass->getStatistics());
            entry.pass->resetStatistics();
            ctx.stats().increment("passes_run");
        }

        result.success = true;
        return result;
    }

private:
    std::unordered_map<std::string, PassEntry> passes_;
    std::vector<std::string> ordered_passes_;
    bool pass_order_dirty_ = true;
    Logger logger_;

    void computePassOrder() {
        std::vector<std::pair<std::string, int>> pass_priorities;
        for (const auto& [name, entry] : passes_) {
            pass_priorities.emplace_back(name, entry.order);
        }

        std::sort(pass_priorities.begin(), pass_priorities.end(),
            [](const auto& a, const auto& b) {
                return a.second != b.second ? a.second < b.second : a.first < b.first;
            });

        ordered_passes_.clear();
        for (const auto& [name, priority] : pass_priorities) {
            ordered_passes_.push_back(name);
        }
        pass_order_dirty_ = false;

        logger_.debug("Pass order computed:");
        for (size_t i = 0; i < ordered_passes_.size(); i++) {
            logger_.debug("  {}: {}", i + 1, ordered_passes_[i]);
        }
    }
};

} // namespace cloak

#endif // CLOAK_PASS_MANAGER_HPP
