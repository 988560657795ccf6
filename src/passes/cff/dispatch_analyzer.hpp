/*
 * dispatch_analyzer.hpp
 *
 * finds the dispatch loops flattening built and reads back their state
 * graph, so a flattened function can be checked for orphaned cases and
 * transitions into nowhere
 */

#ifndef CLOAK_DISPATCH_ANALYZER_HPP
#define CLOAK_DISPATCH_ANALYZER_HPP

#include "cff_base.hpp"

#include <vector>

namespace cloak {
namespace cff {

class DispatchAnalyzer {
public:
    /**
     * Every while (1) { switch (s) ... } whose s is one of the function's
     * recorded state variables, outermost first
     */
    std::vector<DispatchMachine> analyze(const ast::Function& f) const;

    /**
     * Each case is the entry (0) or a transition target, and each target
     * is a case
     */
    static bool coversAllStates(const DispatchMachine& m);
};

} // namespace cff
} // namespace cloak

#endif // CLOAK_DISPATCH_ANALYZER_HPP
