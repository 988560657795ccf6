/*
 * compile_context.hpp
 *
 * state owned by one compilation: the RNG every pass draws from, the
 * fresh-name counters and the statistics. nothing here is shared between
 * compilations, so two units compiled side by side stay deterministic.
 */

#ifndef CLOAK_COMPILE_CONTEXT_HPP
#define CLOAK_COMPILE_CONTEXT_HPP

#include "options.hpp"
#include "statistics.hpp"
#include "../common/random.hpp"

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace cloak {

class CompileContext {
public:
    explicit CompileContext(CompilerOptions options = {})
        : options_(std::move(options)), rng_(options_.seed) {}

    CompileContext(const CompileContext&) = delete;
    CompileContext& operator=(const CompileContext&) = delete;

    const CompilerOptions& options() const { return options_; }
    Random& rng() { return rng_; }
    Statistics& stats() { return stats_; }
    const Statistics& stats() const { return stats_; }

    /**
     * "<prefix><n>" with n counting per prefix from 0. Names already
     * reserved are skipped.
     */
    std::string freshName(const std::string& prefix) {
        for (;;) {
            std::string name = prefix + std::to_string(counters_[prefix]++);
            if (reserved_.insert(name).second) return name;
        }
    }

    /**
     * Marks names as taken (the program's own identifiers)
     */
    template<typename Names>
    void reserve(const Names& names) {
        for (const auto& n : names) reserved_.insert(n);
    }

    bool isReserved(const std::string& name) const {
        return reserved_.count(name) != 0;
    }

    /**
     * Claims an exact name; false if it is already taken
     */
    bool claim(const std::string& name) {
        return reserved_.insert(name).second;
    }

private:
    CompilerOptions options_;
    Random rng_;
    Statistics stats_;
    std::unordered_map<std::string, int> counters_;
    std::unordered_set<std::string> reserved_;
};

} // namespace cloak

#endif // CLOAK_COMPILE_CONTEXT_HPP
