/**
 * Cloak - Obfuscating C Compiler
 *
 * semantic_analyzer.hpp - Name resolution and type checking
 *
 * Works on a copy of its input: the returned Program has every
 * expression annotated with its type and every identifier with its
 * storage kind and declaring scope. The first error stops analysis;
 * warnings are collected.
 *
 * Scoping follows C: parameters share the outermost scope of the body,
 * every nested block, loop body, for statement and switch body opens a
 * scope, and a declaration is visible inside its own initializer.
 */

#ifndef CLOAK_SEMANTIC_ANALYZER_HPP
#define CLOAK_SEMANTIC_ANALYZER_HPP

#include "symbol_table.hpp"
#include "../ast/ast.hpp"
#include "../ast/const_eval.hpp"
#include "../ast/type_layout.hpp"
#include "../common/logging.hpp"

namespace cloak {
namespace sema {

struct AnalysisResult {
    bool success = false;
    ast::Program program;
    SymbolTable symbols;
    DiagnosticList diagnostics;
};

class SemanticAnalyzer {
public:
    AnalysisResult analyze(const ast::Program& program);

private:
    SymbolTable symbols_;
    ast::TypeLayout layout_;
    DiagnosticList diagnostics_;
    const ast::Function* function_ = nullptr;
    int loop_depth_ = 0;
    int break_depth_ = 0;
    Logger logger_{"Sema"};

    // declarations
    void globalVariable(ast::VarDecl& v);
    void function(ast::Function& f);
    void enumeration(const ast::EnumDef& e);
    void localVariable(ast::VarDecl& v);
    void completeArraySize(ast::VarDecl& v);
    void checkObjectType(const ast::Type& t, const std::string& name, SourceLoc loc);
    void checkInitializer(const ast::Type& t, ast::Expr& init, bool constant, SourceLoc loc);
    bool isConstantInitializer(const ast::Type& t, const ast::Expr& init) const;

    // statements
    void block(ast::Block& b, bool new_scope);
    void statement(ast::Stmt& s);
    void switchStatement(ast::Stmt& s);
    void condition(ast::Expr& e);

    // expressions
    const ast::Type& expr(ast::Expr& e);
    ast::Type binary(ast::Expr& e);
    ast::Type unary(ast::Expr& e);
    ast::Type assignment(ast::Expr& e);
    ast::Type call(ast::Expr& e);
    ast::Type ternary(ast::Expr& e);
    ast::Type arithmeticResult(ast::BinaryOp op, const ast::Type& l, const ast::Type& r,
                               const ast::Expr& e);
    void checkAssignable(const ast::Type& target, const ast::Expr& value,
                         const std::string& context, SourceLoc loc);

    bool isLvalue(const ast::Expr& e) const;
    bool isNullConstant(const ast::Expr& e) const;
    std::optional<ast::IntValue> constant(const ast::Expr& e) const;
    long sizeOf(const ast::Type& t, SourceLoc loc) const;
    const ast::Type& pointeeChecked(const ast::Type& ptr, const char* what, SourceLoc loc) const;

    [[noreturn]] void error(DiagCode code, const std::string& msg, SourceLoc loc) const;
    void warning(DiagCode code, const std::string& msg, SourceLoc loc);
};

/**
 * Convenience wrapper: analyzes with a fresh analyzer
 */
AnalysisResult analyze(const ast::Program& program);

} // namespace sema
} // namespace cloak

#endif // CLOAK_SEMANTIC_ANALYZER_HPP
