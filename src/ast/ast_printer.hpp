/*
 * ast_printer.hpp
 *
 * turns a Program back into compilable C (the emit_source output)
 */

#ifndef CLOAK_AST_PRINTER_HPP
#define CLOAK_AST_PRINTER_HPP

#include "ast.hpp"

#include <sstream>
#include <string>

namespace cloak {
namespace ast {

class AstPrinter {
public:
    std::string print(const Program& program);

    std::string expr(const Expr& e) const;
    std::string declaration(const Type& t, const std::string& name) const;
    std::string typeName(const Type& t) const { return declaration(t, ""); }

    static std::string quote(const std::string& bytes);

private:
    std::ostringstream out_;
    int indent_ = 0;

    void topDecl(const TopDecl& d);
    void function(const Function& f);
    void block(const Block& b);
    void stmt(const Stmt& s);
    void line(const std::string& text);
    std::string varDecl(const VarDecl& v) const;
    std::string forClause(const Block& init) const;
    std::string baseSpelling(const Type& t) const;
    std::string declarator(const Type& t, const std::string& inner) const;
    std::string literal(const Expr& e) const;
};

inline std::string printProgram(const Program& program) {
    AstPrinter printer;
    return printer.print(program);
}

inline std::string printExpr(const Expr& e) {
    AstPrinter printer;
    return printer.expr(e);
}

} // namespace ast
} // namespace cloak

#endif // CLOAK_AST_PRINTER_HPP
