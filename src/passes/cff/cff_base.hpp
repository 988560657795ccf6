/**
 * Cloak - Control Flow Flattening Base
 *
 * Base definitions for control flow flattening.
 * CFF converts a function body into a switch-based state machine:
 *
 *   s = 0;
 *   while (1) {
 *       switch (s) {
 *       case 0: ...; s = 2; continue;
 *       case 1: ...; return x;
 *       case 2: ...; break;          // leaves the machine
 *       }
 *       break;
 *   }
 *
 * Every loop gets a machine of its own, nested inside a segment of the
 * enclosing one, with its own state variable and ids again from 0.
 */

#ifndef CLOAK_CFF_BASE_HPP
#define CLOAK_CFF_BASE_HPP

#include "../../core/transformation_base.hpp"
#include "../../common/random.hpp"
#include "../../common/logging.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace cloak {
namespace cff {

/**
 * A straight-line run of statements between control transfers; one case
 * of a dispatch switch
 */
struct SegmentInfo {
    ast::Block code;
    std::vector<int> successors;     // provisional ids, in order of appearance
    bool closed = false;             // ends in a transition, exit or return
    int state_value = -1;            // assigned after reachability
};

/**
 * Configuration for CFF pass
 */
struct CFFConfig {
    bool enabled = true;
    double probability = 1.0;        // Probability of flattening a function

    int min_statements = 1;          // Smaller bodies are left alone

    std::string state_var_prefix = "__cff_s_";
    std::string local_prefix = "__cff_v_";

    bool verify_states = true;       // check coverage of every machine built
};

/**
 * Result of flattening a function
 */
struct CFFResult {
    bool success = false;
    std::string error;

    int machines = 0;                // dispatch loops built
    int segments = 0;                // cases emitted
    int dropped_segments = 0;        // unreachable, never emitted
    int hoisted_locals = 0;

    std::vector<std::string> state_vars;
};

/**
 * One dispatch loop found in a function
 */
struct DispatchMachine {
    std::string state_var;
    std::set<int64_t> case_ids;
    std::set<int64_t> targets;       // values assigned to the state variable
};

} // namespace cff
} // namespace cloak

#endif // CLOAK_CFF_BASE_HPP
