/**
 * Cloak - Control Flow Obfuscation
 *
 * Main include file for control flow obfuscation passes.
 *
 * Includes:
 * - Control Flow Flattening (CFF)
 * - Opaque Predicates (bogus control flow)
 */

#ifndef CLOAK_CFF_HPP
#define CLOAK_CFF_HPP

#include "cff_base.hpp"
#include "dispatch_analyzer.hpp"
#include "flattening.hpp"
#include "opaque_predicates.hpp"
#include "bogus_cf.hpp"

#endif // CLOAK_CFF_HPP
