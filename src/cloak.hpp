/*
 * cloak.hpp - main include file
 *
 * just include this and you get everything
 */

#ifndef CLOAK_HPP
#define CLOAK_HPP

// Version information
#define CLOAK_VERSION_MAJOR 1
#define CLOAK_VERSION_MINOR 0
#define CLOAK_VERSION_PATCH 0
#define CLOAK_VERSION_STRING "1.0.0"

// Core components
#include "core/diagnostics.hpp"
#include "core/options.hpp"
#include "core/compile_context.hpp"
#include "core/transformation_base.hpp"
#include "core/pass_manager.hpp"
#include "core/pipeline.hpp"
#include "core/statistics.hpp"

// Common utilities
#include "common/logging.hpp"
#include "common/random.hpp"
#include "common/json_parser.hpp"

// Front end and analysis
#include "ast/ast.hpp"
#include "ast/ast_printer.hpp"
#include "frontend/parser.hpp"
#include "frontend/preprocessor.hpp"
#include "sema/semantic_analyzer.hpp"

// Transformation passes
#include "passes/opt/opt.hpp"
#include "passes/rename/identifier_renaming.hpp"
#include "passes/data/data.hpp"
#include "passes/mba/mba.hpp"
#include "passes/cff/cff.hpp"
#include "passes/deadcode/deadcode.hpp"

// Back end
#include "backends/x86/x86_codegen.hpp"

#include <iostream>

namespace cloak {

// version string
inline const char* getVersion() {
    return CLOAK_VERSION_STRING;
}

// ascii art banner
inline const char* getBanner() {
    return R"(
       _             _
   ___| | ___   __ _| | __
  / __| |/ _ \ / _` | |/ /
 | (__| | (_) | (_| |   <
  \___|_|\___/ \__,_|_|\_\
  Obfuscating C Compiler v)" CLOAK_VERSION_STRING R"(
)";
}

inline void printBanner() {
    std::cout << getBanner() << std::endl;
}

} // namespace cloak

#endif // CLOAK_HPP
