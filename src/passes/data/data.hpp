/**
 * Cloak - Obfuscating C Compiler
 *
 * data.hpp - Main include file for data obfuscation module
 *
 * Usage:
 *   #include "passes/data/data.hpp"
 *
 *   pm.registerPass(std::make_unique<cloak::data::StringEncryptionPass>());
 */

#ifndef CLOAK_DATA_HPP
#define CLOAK_DATA_HPP

// Base definitions
#include "data_base.hpp"

#include "string_encoding.hpp"

#endif // CLOAK_DATA_HPP
