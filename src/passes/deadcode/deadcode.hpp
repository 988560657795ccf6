/**
 * Cloak - Obfuscating C Compiler
 *
 * deadcode.hpp - Main include file for dead code obfuscation module
 *
 * Usage:
 *   #include "passes/deadcode/deadcode.hpp"
 *
 *   cloak::deadcode::DeadCodeSynthesizer gen;
 *   auto block = gen.generateRandom(ctx);
 */

#ifndef CLOAK_DEADCODE_HPP
#define CLOAK_DEADCODE_HPP

// Base definitions and generators
#include "dead_code_base.hpp"

// Insertion pass
#include "dead_code.hpp"

#endif // CLOAK_DEADCODE_HPP
