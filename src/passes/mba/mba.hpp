/**
 * Cloak - Obfuscating C Compiler
 *
 * mba.hpp - Main include file for MBA (Mixed Boolean Arithmetic) module
 *
 * Include this file to access all MBA transformations.
 *
 * Usage:
 *   #include "passes/mba/mba.hpp"
 *
 *   cloak::mba::ExpressionComplicator mba;
 *   mba.complicate(expr, ctx.rng());
 */

#ifndef CLOAK_MBA_HPP
#define CLOAK_MBA_HPP

// Base definitions
#include "mba_base.hpp"

// Individual transformations
#include "mba_add.hpp"
#include "mba_sub.hpp"
#include "mba_xor.hpp"
#include "mba_and.hpp"
#include "mba_or.hpp"
#include "mba_mult.hpp"

// Unified pass
#include "mba_pass.hpp"

#endif // CLOAK_MBA_HPP
