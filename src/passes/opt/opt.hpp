/**
 * Cloak - Obfuscating C Compiler
 *
 * opt.hpp - Main include file for the optimization passes
 *
 * Usage:
 *   #include "passes/opt/opt.hpp"
 *
 *   cloak::PassManager pm;
 *   pm.registerPass(std::make_unique<cloak::opt::ConstantFoldingPass>());
 *   pm.registerPass(std::make_unique<cloak::opt::InliningPass>(opts.inline_threshold));
 */

#ifndef CLOAK_OPT_HPP
#define CLOAK_OPT_HPP

#include "constant_folding.hpp"
#include "dead_code_elimination.hpp"
#include "inlining.hpp"

#endif // CLOAK_OPT_HPP
