/**
 * Cloak - Obfuscating C Compiler
 *
 * ast_walk.cpp - Name collection over whole programs
 */

#include "ast_walk.hpp"

namespace cloak {
namespace ast {

std::unordered_set<std::string> collectGlobalNames(const Program& program) {
    std::unordered_set<std::string> names;
    for (const auto& d : program.decls) {
        switch (d.kind) {
            case DeclKind::Function: names.insert(d.func.name); break;
            case DeclKind::Variable: names.insert(d.var.name); break;
            case DeclKind::Typedef:  names.insert(d.tdef.name); break;
            case DeclKind::Record:   break;
            case DeclKind::Enum:
                for (const auto& item : d.enm.items) names.insert(item.name);
                break;
        }
    }
    return names;
}

std::unordered_set<std::string> collectNames(const Program& program) {
    auto names = collectGlobalNames(program);
    for (const auto& d : program.decls) {
        if (d.kind != DeclKind::Function) continue;
        for (const auto& p : d.func.params) names.insert(p.name);
        visitBlockStmts(d.func.body, [&names](const Stmt& s) {
            if (s.kind == StmtKind::Decl) names.insert(s.decl->name);
        });
        visitBlockExprs(d.func.body, [&names](const Expr& e) {
            if (e.kind == ExprKind::Identifier) names.insert(e.text);
        });
    }
    return names;
}

} // namespace ast
} // namespace cloak
